/**
 * @file signet_keys_api.cpp
 * @brief C API for X25519 public/private keys and Ed25519 identity key pairs
 */

#include "signet/c_api/signet_api.h"
#include "signet_internal.hpp"
#include "signet/models/key_materials/public_key_codec.hpp"
#include "signet/crypto/sodium_interop.hpp"
#include "signet/core/constants.hpp"
#include <algorithm>
#include <cstring>
#include <new>
#include <span>
#include <string>

using namespace signet::protocol;
using namespace signet::protocol::crypto;
using namespace signet::internal;

extern "C" {

// ----------------------------------------------------------------------------
// Public Keys
// ----------------------------------------------------------------------------

SignetErrorCode signet_public_key_deserialize(
    SignetPublicKey** out_key,
    const uint8_t* data,
    const size_t data_length,
    SignetError* out_error) {
    if (!validate_output_handle(out_key, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    if (!validate_buffer_param(data, data_length, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    auto decode_result = PublicKeyCodec::Decode(std::span(data, data_length));
    if (decode_result.IsErr()) {
        return fill_error_from_failure(out_error, decode_result.UnwrapErr());
    }
    return make_public_key(decode_result.Unwrap(), out_key, out_error);
}

SignetErrorCode signet_public_key_serialize(
    SignetBuffer* out_buffer,
    const SignetPublicKey* key,
    SignetError* out_error) {
    if (!validate_output_handle(out_buffer, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    if (!validate_input_handle(key, "Public key", out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    const auto serialized = PublicKeyCodec::Encode(key->key);
    if (!copy_to_buffer(serialized, out_buffer, out_error)) {
        return SIGNET_ERROR_OUT_OF_MEMORY;
    }
    return SIGNET_SUCCESS;
}

SignetErrorCode signet_public_key_get_public_key_bytes(
    SignetBuffer* out_buffer,
    const SignetPublicKey* key,
    SignetError* out_error) {
    if (!validate_output_handle(out_buffer, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    if (!validate_input_handle(key, "Public key", out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    if (!copy_to_buffer(key->key, out_buffer, out_error)) {
        return SIGNET_ERROR_OUT_OF_MEMORY;
    }
    return SIGNET_SUCCESS;
}

SignetErrorCode signet_public_key_compare(
    int32_t* out_result,
    const SignetPublicKey* key1,
    const SignetPublicKey* key2,
    SignetError* out_error) {
    if (!validate_output_handle(out_result, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    if (!validate_input_handle(key1, "First public key", out_error) ||
        !validate_input_handle(key2, "Second public key", out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    const auto order = std::lexicographical_compare_three_way(
        key1->key.begin(), key1->key.end(),
        key2->key.begin(), key2->key.end());
    *out_result = order < 0 ? -1 : (order > 0 ? 1 : 0);
    return SIGNET_SUCCESS;
}

SignetErrorCode signet_public_key_clone(
    SignetPublicKey** out_key,
    const SignetPublicKey* key,
    SignetError* out_error) {
    if (!validate_output_handle(out_key, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    if (!validate_input_handle(key, "Public key", out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    return make_public_key(key->key, out_key, out_error);
}

SignetErrorCode signet_public_key_destroy(SignetPublicKey* key) {
    delete key;
    return SIGNET_SUCCESS;
}

// ----------------------------------------------------------------------------
// Private Keys
// ----------------------------------------------------------------------------

SignetErrorCode signet_private_key_generate(
    SignetPrivateKey** out_key,
    SignetError* out_error) {
    if (const auto err = EnsureInitialized(); err != SIGNET_SUCCESS) {
        fill_error(out_error, err, std::string(ErrorMessages::SODIUM_INIT_FAILED));
        return err;
    }
    if (!validate_output_handle(out_key, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    auto key_pair_result = X25519KeyPair::Generate();
    if (key_pair_result.IsErr()) {
        return fill_error_from_failure(out_error, key_pair_result.UnwrapErr());
    }
    return make_private_key(std::move(key_pair_result).Unwrap(), out_key, out_error);
}

SignetErrorCode signet_private_key_deserialize(
    SignetPrivateKey** out_key,
    const uint8_t* data,
    const size_t data_length,
    SignetError* out_error) {
    if (const auto err = EnsureInitialized(); err != SIGNET_SUCCESS) {
        fill_error(out_error, err, std::string(ErrorMessages::SODIUM_INIT_FAILED));
        return err;
    }
    if (!validate_output_handle(out_key, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    if (!validate_buffer_param(data, data_length, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    auto key_pair_result = X25519KeyPair::FromPrivateKey(std::span(data, data_length));
    if (key_pair_result.IsErr()) {
        return fill_error_from_failure(out_error, key_pair_result.UnwrapErr());
    }
    return make_private_key(std::move(key_pair_result).Unwrap(), out_key, out_error);
}

SignetErrorCode signet_private_key_serialize(
    SignetBuffer* out_buffer,
    const SignetPrivateKey* key,
    SignetError* out_error) {
    if (!validate_output_handle(out_buffer, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    if (!validate_input_handle(key, "Private key", out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    auto private_result = key->key_pair->GetPrivateKeyCopy();
    if (private_result.IsErr()) {
        return fill_error_from_failure(out_error, private_result.UnwrapErr());
    }
    auto private_key = std::move(private_result).Unwrap();
    const bool copied = copy_to_buffer(private_key, out_buffer, out_error);
    (void) SodiumInterop::SecureWipe(std::span<uint8_t>(private_key));
    return copied ? SIGNET_SUCCESS : SIGNET_ERROR_OUT_OF_MEMORY;
}

SignetErrorCode signet_private_key_get_public_key(
    SignetPublicKey** out_key,
    const SignetPrivateKey* key,
    SignetError* out_error) {
    if (!validate_output_handle(out_key, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    if (!validate_input_handle(key, "Private key", out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    return make_public_key(key->key_pair->GetPublicKey(), out_key, out_error);
}

SignetErrorCode signet_private_key_agree(
    SignetBuffer* out_shared_secret,
    const SignetPrivateKey* private_key,
    const SignetPublicKey* public_key,
    SignetError* out_error) {
    if (!validate_output_handle(out_shared_secret, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    if (!validate_input_handle(private_key, "Private key", out_error) ||
        !validate_input_handle(public_key, "Public key", out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    auto shared_result = private_key->key_pair->Agree(public_key->key);
    if (shared_result.IsErr()) {
        return fill_error_from_failure(out_error, shared_result.UnwrapErr());
    }
    auto shared_secret = std::move(shared_result).Unwrap();
    const bool copied = copy_to_buffer(shared_secret, out_shared_secret, out_error);
    (void) SodiumInterop::SecureWipe(std::span<uint8_t>(shared_secret));
    return copied ? SIGNET_SUCCESS : SIGNET_ERROR_OUT_OF_MEMORY;
}

SignetErrorCode signet_private_key_clone(
    SignetPrivateKey** out_key,
    const SignetPrivateKey* key,
    SignetError* out_error) {
    if (!validate_output_handle(out_key, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    if (!validate_input_handle(key, "Private key", out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    auto clone_result = key->key_pair->Clone();
    if (clone_result.IsErr()) {
        return fill_error_from_failure(out_error, clone_result.UnwrapErr());
    }
    return make_private_key(std::move(clone_result).Unwrap(), out_key, out_error);
}

SignetErrorCode signet_private_key_destroy(SignetPrivateKey* key) {
    delete key;
    return SIGNET_SUCCESS;
}

// ----------------------------------------------------------------------------
// Identity Key Pairs
// ----------------------------------------------------------------------------

SignetErrorCode signet_identity_key_pair_generate(
    SignetIdentityKeyPair** out_key_pair,
    SignetError* out_error) {
    if (const auto err = EnsureInitialized(); err != SIGNET_SUCCESS) {
        fill_error(out_error, err, std::string(ErrorMessages::SODIUM_INIT_FAILED));
        return err;
    }
    if (!validate_output_handle(out_key_pair, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    auto key_pair_result = Ed25519KeyPair::Generate();
    if (key_pair_result.IsErr()) {
        return fill_error_from_failure(out_error, key_pair_result.UnwrapErr());
    }
    auto* handle = new(std::nothrow) SignetIdentityKeyPair{};
    if (!handle) {
        fill_error(out_error, SIGNET_ERROR_OUT_OF_MEMORY, "Failed to allocate identity key pair");
        return SIGNET_ERROR_OUT_OF_MEMORY;
    }
    handle->key_pair = std::make_unique<Ed25519KeyPair>(std::move(key_pair_result).Unwrap());
    *out_key_pair = handle;
    return SIGNET_SUCCESS;
}

SignetErrorCode signet_identity_key_pair_get_public_key(
    SignetBuffer* out_buffer,
    const SignetIdentityKeyPair* key_pair,
    SignetError* out_error) {
    if (!validate_output_handle(out_buffer, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    if (!validate_input_handle(key_pair, "Identity key pair", out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    if (!copy_to_buffer(key_pair->key_pair->GetPublicKey(), out_buffer, out_error)) {
        return SIGNET_ERROR_OUT_OF_MEMORY;
    }
    return SIGNET_SUCCESS;
}

SignetErrorCode signet_identity_key_pair_sign(
    SignetBuffer* out_signature,
    const SignetIdentityKeyPair* key_pair,
    const uint8_t* message,
    const size_t message_length,
    SignetError* out_error) {
    if (!validate_output_handle(out_signature, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    if (!validate_input_handle(key_pair, "Identity key pair", out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    if (!validate_buffer_param(message, message_length, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    auto signature_result = key_pair->key_pair->Sign(std::span(message, message_length));
    if (signature_result.IsErr()) {
        return fill_error_from_failure(out_error, signature_result.UnwrapErr());
    }
    if (!copy_to_buffer(signature_result.Unwrap(), out_signature, out_error)) {
        return SIGNET_ERROR_OUT_OF_MEMORY;
    }
    return SIGNET_SUCCESS;
}

SignetErrorCode signet_identity_key_pair_clone(
    SignetIdentityKeyPair** out_key_pair,
    const SignetIdentityKeyPair* key_pair,
    SignetError* out_error) {
    if (!validate_output_handle(out_key_pair, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    if (!validate_input_handle(key_pair, "Identity key pair", out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    auto clone_result = key_pair->key_pair->Clone();
    if (clone_result.IsErr()) {
        return fill_error_from_failure(out_error, clone_result.UnwrapErr());
    }
    auto* handle = new(std::nothrow) SignetIdentityKeyPair{};
    if (!handle) {
        fill_error(out_error, SIGNET_ERROR_OUT_OF_MEMORY, "Failed to allocate identity key pair");
        return SIGNET_ERROR_OUT_OF_MEMORY;
    }
    handle->key_pair = std::make_unique<Ed25519KeyPair>(std::move(clone_result).Unwrap());
    *out_key_pair = handle;
    return SIGNET_SUCCESS;
}

SignetErrorCode signet_identity_key_pair_destroy(SignetIdentityKeyPair* key_pair) {
    delete key_pair;
    return SIGNET_SUCCESS;
}

SignetErrorCode signet_identity_verify(
    bool* out_valid,
    const uint8_t* public_key,
    const size_t public_key_length,
    const uint8_t* message,
    const size_t message_length,
    const uint8_t* signature,
    const size_t signature_length,
    SignetError* out_error) {
    if (const auto err = EnsureInitialized(); err != SIGNET_SUCCESS) {
        fill_error(out_error, err, std::string(ErrorMessages::SODIUM_INIT_FAILED));
        return err;
    }
    if (!validate_output_handle(out_valid, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    if (!validate_buffer_param(public_key, public_key_length, out_error) ||
        !validate_buffer_param(message, message_length, out_error) ||
        !validate_buffer_param(signature, signature_length, out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    if (public_key_length != Constants::ED_25519_PUBLIC_KEY_SIZE) {
        fill_error(out_error, SIGNET_ERROR_INVALID_KEY,
                   "Identity public key must be " +
                   std::to_string(Constants::ED_25519_PUBLIC_KEY_SIZE) + " bytes");
        return SIGNET_ERROR_INVALID_KEY;
    }
    *out_valid = SodiumInterop::VerifyDetached(
        std::span(public_key, public_key_length),
        std::span(message, message_length),
        std::span(signature, signature_length));
    return SIGNET_SUCCESS;
}

} // extern "C"
