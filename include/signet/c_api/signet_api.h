#pragma once

#include "signet/c_api/signet_export.h"

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#define SIGNET_API_VERSION_MAJOR 1
#define SIGNET_API_VERSION_MINOR 0
#define SIGNET_API_VERSION_PATCH 0

typedef enum {
    SIGNET_SUCCESS = 0,
    SIGNET_ERROR_GENERIC = 1,
    SIGNET_ERROR_INVALID_INPUT = 2,
    SIGNET_ERROR_KEY_GENERATION = 3,
    SIGNET_ERROR_DERIVE_KEY = 4,
    SIGNET_ERROR_INVALID_KEY = 5,
    SIGNET_ERROR_DECODE = 6,
    SIGNET_ERROR_ENCODE = 7,
    SIGNET_ERROR_SIGNATURE = 8,
    SIGNET_ERROR_OUT_OF_MEMORY = 9,
    SIGNET_ERROR_SODIUM_FAILURE = 10,
    SIGNET_ERROR_NULL_POINTER = 11,
    SIGNET_ERROR_INVALID_STATE = 12
} SignetErrorCode;

typedef enum {
    SIGNET_OBJECT_PUBLIC_KEY = 0,
    SIGNET_OBJECT_PRIVATE_KEY = 1,
    SIGNET_OBJECT_IDENTITY_KEY_PAIR = 2,
    SIGNET_OBJECT_SIGNED_PRE_KEY_RECORD = 3
} SignetObjectKind;

typedef struct SignetPublicKey SignetPublicKey;
typedef struct SignetPrivateKey SignetPrivateKey;
typedef struct SignetIdentityKeyPair SignetIdentityKeyPair;
typedef struct SignetSignedPreKeyRecord SignetSignedPreKeyRecord;

/* Library-owned bytes; release with signet_buffer_free. */
typedef struct SignetBuffer {
    uint8_t* data;
    size_t length;
} SignetBuffer;

/* message is heap-allocated; release with signet_error_free. */
typedef struct SignetError {
    SignetErrorCode code;
    char* message;
} SignetError;

typedef struct SignetConfig {
    uint32_t max_signature_length;
    uint32_t max_serialized_length;
    bool verify_key_pair;
} SignetConfig;

// ----------------------------------------------------------------------------
// Library
// ----------------------------------------------------------------------------

SIGNET_API const char* signet_version(void);

SIGNET_API SignetErrorCode signet_init(void);

// Installs record validation limits; zero limits are rejected.
SIGNET_API SignetErrorCode signet_init_with_config(
    const SignetConfig* config,
    SignetError* out_error);

SIGNET_API void signet_shutdown(void);

// Number of native objects of the given kind currently allocated.
SIGNET_API uint64_t signet_live_object_count(SignetObjectKind kind);

SIGNET_API void signet_buffer_free(SignetBuffer* buffer);

SIGNET_API void signet_error_free(SignetError* error);

SIGNET_API const char* signet_error_string(SignetErrorCode code);

// ----------------------------------------------------------------------------
// Public keys
// ----------------------------------------------------------------------------

// Input is the 33-byte type-prefixed form.
SIGNET_API SignetErrorCode signet_public_key_deserialize(
    SignetPublicKey** out_key,
    const uint8_t* data,
    size_t data_length,
    SignetError* out_error);

SIGNET_API SignetErrorCode signet_public_key_serialize(
    SignetBuffer* out_buffer,
    const SignetPublicKey* key,
    SignetError* out_error);

SIGNET_API SignetErrorCode signet_public_key_get_public_key_bytes(
    SignetBuffer* out_buffer,
    const SignetPublicKey* key,
    SignetError* out_error);

// out_result is negative, zero or positive in lexicographic byte order.
SIGNET_API SignetErrorCode signet_public_key_compare(
    int32_t* out_result,
    const SignetPublicKey* key1,
    const SignetPublicKey* key2,
    SignetError* out_error);

SIGNET_API SignetErrorCode signet_public_key_clone(
    SignetPublicKey** out_key,
    const SignetPublicKey* key,
    SignetError* out_error);

SIGNET_API SignetErrorCode signet_public_key_destroy(SignetPublicKey* key);

// ----------------------------------------------------------------------------
// Private keys
// ----------------------------------------------------------------------------

SIGNET_API SignetErrorCode signet_private_key_generate(
    SignetPrivateKey** out_key,
    SignetError* out_error);

SIGNET_API SignetErrorCode signet_private_key_deserialize(
    SignetPrivateKey** out_key,
    const uint8_t* data,
    size_t data_length,
    SignetError* out_error);

SIGNET_API SignetErrorCode signet_private_key_serialize(
    SignetBuffer* out_buffer,
    const SignetPrivateKey* key,
    SignetError* out_error);

SIGNET_API SignetErrorCode signet_private_key_get_public_key(
    SignetPublicKey** out_key,
    const SignetPrivateKey* key,
    SignetError* out_error);

SIGNET_API SignetErrorCode signet_private_key_agree(
    SignetBuffer* out_shared_secret,
    const SignetPrivateKey* private_key,
    const SignetPublicKey* public_key,
    SignetError* out_error);

SIGNET_API SignetErrorCode signet_private_key_clone(
    SignetPrivateKey** out_key,
    const SignetPrivateKey* key,
    SignetError* out_error);

SIGNET_API SignetErrorCode signet_private_key_destroy(SignetPrivateKey* key);

// ----------------------------------------------------------------------------
// Identity key pairs (Ed25519)
// ----------------------------------------------------------------------------

SIGNET_API SignetErrorCode signet_identity_key_pair_generate(
    SignetIdentityKeyPair** out_key_pair,
    SignetError* out_error);

SIGNET_API SignetErrorCode signet_identity_key_pair_get_public_key(
    SignetBuffer* out_buffer,
    const SignetIdentityKeyPair* key_pair,
    SignetError* out_error);

SIGNET_API SignetErrorCode signet_identity_key_pair_sign(
    SignetBuffer* out_signature,
    const SignetIdentityKeyPair* key_pair,
    const uint8_t* message,
    size_t message_length,
    SignetError* out_error);

SIGNET_API SignetErrorCode signet_identity_key_pair_clone(
    SignetIdentityKeyPair** out_key_pair,
    const SignetIdentityKeyPair* key_pair,
    SignetError* out_error);

SIGNET_API SignetErrorCode signet_identity_key_pair_destroy(SignetIdentityKeyPair* key_pair);

SIGNET_API SignetErrorCode signet_identity_verify(
    bool* out_valid,
    const uint8_t* public_key,
    size_t public_key_length,
    const uint8_t* message,
    size_t message_length,
    const uint8_t* signature,
    size_t signature_length,
    SignetError* out_error);

// ----------------------------------------------------------------------------
// Signed pre-key records
// ----------------------------------------------------------------------------

SIGNET_API SignetErrorCode signet_signed_pre_key_record_new(
    SignetSignedPreKeyRecord** out_record,
    uint32_t id,
    uint64_t timestamp_ms,
    const SignetPublicKey* public_key,
    const SignetPrivateKey* private_key,
    const uint8_t* signature,
    size_t signature_length,
    SignetError* out_error);

SIGNET_API SignetErrorCode signet_signed_pre_key_record_deserialize(
    SignetSignedPreKeyRecord** out_record,
    const uint8_t* data,
    size_t data_length,
    SignetError* out_error);

SIGNET_API SignetErrorCode signet_signed_pre_key_record_clone(
    SignetSignedPreKeyRecord** out_record,
    const SignetSignedPreKeyRecord* record,
    SignetError* out_error);

SIGNET_API SignetErrorCode signet_signed_pre_key_record_destroy(SignetSignedPreKeyRecord* record);

SIGNET_API SignetErrorCode signet_signed_pre_key_record_serialize(
    SignetBuffer* out_buffer,
    const SignetSignedPreKeyRecord* record,
    SignetError* out_error);

SIGNET_API SignetErrorCode signet_signed_pre_key_record_get_signature(
    SignetBuffer* out_signature,
    const SignetSignedPreKeyRecord* record,
    SignetError* out_error);

SIGNET_API SignetErrorCode signet_signed_pre_key_record_get_id(
    uint32_t* out_id,
    const SignetSignedPreKeyRecord* record,
    SignetError* out_error);

SIGNET_API SignetErrorCode signet_signed_pre_key_record_get_timestamp(
    uint64_t* out_timestamp_ms,
    const SignetSignedPreKeyRecord* record,
    SignetError* out_error);

SIGNET_API SignetErrorCode signet_signed_pre_key_record_get_public_key(
    SignetPublicKey** out_key,
    const SignetSignedPreKeyRecord* record,
    SignetError* out_error);

SIGNET_API SignetErrorCode signet_signed_pre_key_record_get_private_key(
    SignetPrivateKey** out_key,
    const SignetSignedPreKeyRecord* record,
    SignetError* out_error);

#ifdef __cplusplus
}
#endif
