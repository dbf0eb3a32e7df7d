/**
 * @file signet_internal.hpp
 * @brief Internal shared types and helpers for the signet C API
 *
 * This header is NOT part of the public API. It defines the opaque object
 * layouts and the helpers shared by the key and record API translation units.
 */

#ifndef SIGNET_INTERNAL_HPP
#define SIGNET_INTERNAL_HPP

#include "signet/c_api/signet_api.h"
#include "signet/models/key_materials/x25519_key_pair.hpp"
#include "signet/models/key_materials/ed25519_key_pair.hpp"
#include "signet/models/key_materials/signed_pre_key_material.hpp"
#include "signet/configuration/record_config.hpp"
#include "signet/core/result.hpp"
#include "signet/core/failures.hpp"
#include <memory>
#include <string>
#include <span>
#include <vector>

namespace signet::internal {

void track_allocated(SignetObjectKind kind, const void* object);
void track_destroyed(SignetObjectKind kind, const void* object);

/**
 * @brief Counts live instances of an opaque object kind
 *
 * Embedded as the first member of every opaque struct so that
 * signet_live_object_count follows construction and destruction exactly.
 */
template<SignetObjectKind Kind>
class LiveObjectTracker {
public:
    LiveObjectTracker() noexcept { track_allocated(Kind, this); }
    LiveObjectTracker(const LiveObjectTracker&) noexcept { track_allocated(Kind, this); }
    LiveObjectTracker& operator=(const LiveObjectTracker&) noexcept = default;
    ~LiveObjectTracker() { track_destroyed(Kind, this); }
};

} // namespace signet::internal

/**
 * @brief Opaque X25519 public point (32 raw bytes)
 */
struct SignetPublicKey {
    signet::internal::LiveObjectTracker<SIGNET_OBJECT_PUBLIC_KEY> tracker;
    std::vector<uint8_t> key;
};

/**
 * @brief Opaque X25519 private key; the scalar lives in secure memory
 */
struct SignetPrivateKey {
    signet::internal::LiveObjectTracker<SIGNET_OBJECT_PRIVATE_KEY> tracker;
    std::unique_ptr<signet::protocol::models::X25519KeyPair> key_pair;
};

struct SignetIdentityKeyPair {
    signet::internal::LiveObjectTracker<SIGNET_OBJECT_IDENTITY_KEY_PAIR> tracker;
    std::unique_ptr<signet::protocol::models::Ed25519KeyPair> key_pair;
};

struct SignetSignedPreKeyRecord {
    signet::internal::LiveObjectTracker<SIGNET_OBJECT_SIGNED_PRE_KEY_RECORD> tracker;
    std::unique_ptr<signet::protocol::models::SignedPreKeyMaterial> material;
};

namespace signet::internal {

using namespace signet::protocol;
using namespace signet::protocol::models;
using signet::protocol::configuration::RecordConfig;

/**
 * @brief Ensure libsodium is initialized
 * @return SIGNET_SUCCESS if initialized, error code otherwise
 */
SignetErrorCode EnsureInitialized();

/**
 * @brief Snapshot of the process-wide record configuration
 */
RecordConfig CurrentConfig();

void InstallConfig(const RecordConfig& config);

/**
 * @brief Fill an error structure with code and message
 */
void fill_error(SignetError* out_error, SignetErrorCode code, const std::string& message);

/**
 * @brief Convert a ProtocolFailure to an error code and fill the error struct
 * @return The corresponding SignetErrorCode
 */
SignetErrorCode fill_error_from_failure(SignetError* out_error, const ProtocolFailure& failure);

/**
 * @brief Validate a buffer parameter (data pointer vs length)
 * @return true if valid, false otherwise (fills out_error)
 */
bool validate_buffer_param(const uint8_t* data, size_t length, SignetError* out_error);

/**
 * @brief Validate an output pointer is not null
 * @return true if valid, false otherwise (fills out_error)
 */
bool validate_output_handle(const void* handle, SignetError* out_error);

/**
 * @brief Validate an input object pointer is not null
 */
bool validate_input_handle(const void* handle, const char* name, SignetError* out_error);

/**
 * @brief Copy data to an output buffer (allocates memory)
 * @return true on success, false on failure (fills out_error)
 */
bool copy_to_buffer(std::span<const uint8_t> input, SignetBuffer* out_buffer, SignetError* out_error);

/**
 * @brief Allocate a public key object holding a copy of the point
 */
SignetErrorCode make_public_key(
    std::span<const uint8_t> point,
    SignetPublicKey** out_key,
    SignetError* out_error);

/**
 * @brief Allocate a private key object taking ownership of the key pair
 */
SignetErrorCode make_private_key(
    X25519KeyPair key_pair,
    SignetPrivateKey** out_key,
    SignetError* out_error);

} // namespace signet::internal

#endif // SIGNET_INTERNAL_HPP
