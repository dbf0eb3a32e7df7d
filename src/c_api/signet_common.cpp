/**
 * @file signet_common.cpp
 * @brief Library-wide C API: initialization, configuration, errors, buffers
 */

#include "signet/c_api/signet_api.h"
#include "signet_internal.hpp"
#include "signet/crypto/sodium_interop.hpp"
#include "signet/debug/handle_logger.hpp"
#include "signet/core/constants.hpp"
#include <array>
#include <atomic>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <new>
#include <span>
#include <string>

using namespace signet::protocol;
using namespace signet::protocol::crypto;

// ============================================================================
// Internal Helper Implementations
// ============================================================================

namespace signet::internal {

namespace {

constexpr size_t OBJECT_KIND_COUNT = 4;

std::array<std::atomic<uint64_t>, OBJECT_KIND_COUNT>& live_counters() {
    static std::array<std::atomic<uint64_t>, OBJECT_KIND_COUNT> counters{};
    return counters;
}

const char* object_kind_name(const SignetObjectKind kind) {
    switch (kind) {
        case SIGNET_OBJECT_PUBLIC_KEY: return "SignetPublicKey";
        case SIGNET_OBJECT_PRIVATE_KEY: return "SignetPrivateKey";
        case SIGNET_OBJECT_IDENTITY_KEY_PAIR: return "SignetIdentityKeyPair";
        case SIGNET_OBJECT_SIGNED_PRE_KEY_RECORD: return "SignetSignedPreKeyRecord";
        default: return "Unknown";
    }
}

std::mutex& config_mutex() {
    static std::mutex mutex;
    return mutex;
}

RecordConfig& config_storage() {
    static RecordConfig config = RecordConfig::Default();
    return config;
}

} // namespace

void track_allocated(const SignetObjectKind kind, const void* object) {
    const auto index = static_cast<size_t>(kind);
    if (index < OBJECT_KIND_COUNT) {
        live_counters()[index].fetch_add(1, std::memory_order_relaxed);
    }
    debug::LogObjectAllocated(object_kind_name(kind), object);
}

void track_destroyed(const SignetObjectKind kind, const void* object) {
    const auto index = static_cast<size_t>(kind);
    if (index < OBJECT_KIND_COUNT) {
        live_counters()[index].fetch_sub(1, std::memory_order_relaxed);
    }
    debug::LogObjectDestroyed(object_kind_name(kind), object);
}

SignetErrorCode EnsureInitialized() {
    static std::once_flag init_flag;
    static std::atomic init_success{false};

    std::call_once(init_flag, [] {
        const auto result = SodiumInterop::Initialize();
        init_success.store(result.IsOk(), std::memory_order_release);
    });

    return init_success.load(std::memory_order_acquire)
               ? SIGNET_SUCCESS
               : SIGNET_ERROR_SODIUM_FAILURE;
}

RecordConfig CurrentConfig() {
    std::lock_guard lock(config_mutex());
    return config_storage();
}

void InstallConfig(const RecordConfig& config) {
    std::lock_guard lock(config_mutex());
    config_storage() = config;
}

void fill_error(SignetError* out_error, const SignetErrorCode code, const std::string& message) {
    debug::LogNativeFailure("signet", static_cast<int32_t>(code), message);
    if (out_error) {
        out_error->code = code;
#ifdef _WIN32
        out_error->message = _strdup(message.c_str());
#else
        out_error->message = strdup(message.c_str());
#endif
    }
}

SignetErrorCode fill_error_from_failure(SignetError* out_error, const ProtocolFailure& failure) {
    SignetErrorCode code = SIGNET_ERROR_GENERIC;

    switch (failure.type) {
        case ProtocolFailureType::KeyGeneration:
            code = SIGNET_ERROR_KEY_GENERATION;
            break;
        case ProtocolFailureType::DeriveKey:
            code = SIGNET_ERROR_DERIVE_KEY;
            break;
        case ProtocolFailureType::InvalidInput:
            code = SIGNET_ERROR_INVALID_INPUT;
            break;
        case ProtocolFailureType::InvalidKey:
            code = SIGNET_ERROR_INVALID_KEY;
            break;
        case ProtocolFailureType::Decode:
            code = SIGNET_ERROR_DECODE;
            break;
        case ProtocolFailureType::Encode:
            code = SIGNET_ERROR_ENCODE;
            break;
        case ProtocolFailureType::Signature:
            code = SIGNET_ERROR_SIGNATURE;
            break;
        case ProtocolFailureType::OutOfMemory:
            code = SIGNET_ERROR_OUT_OF_MEMORY;
            break;
        case ProtocolFailureType::InvalidState:
            code = SIGNET_ERROR_INVALID_STATE;
            break;
        case ProtocolFailureType::NullPointer:
            code = SIGNET_ERROR_NULL_POINTER;
            break;
        default:
            code = SIGNET_ERROR_GENERIC;
            break;
    }

    fill_error(out_error, code, failure.message);
    return code;
}

bool validate_buffer_param(const uint8_t* data, const size_t length, SignetError* out_error) {
    if (!data && length > 0) {
        fill_error(out_error, SIGNET_ERROR_NULL_POINTER, "Buffer data is null but length is non-zero");
        return false;
    }
    return true;
}

bool validate_output_handle(const void* handle, SignetError* out_error) {
    if (!handle) {
        fill_error(out_error, SIGNET_ERROR_NULL_POINTER, "Output pointer is null");
        return false;
    }
    return true;
}

bool validate_input_handle(const void* handle, const char* name, SignetError* out_error) {
    if (!handle) {
        fill_error(out_error, SIGNET_ERROR_NULL_POINTER, std::string(name) + " is null");
        return false;
    }
    return true;
}

bool copy_to_buffer(const std::span<const uint8_t> input, SignetBuffer* out_buffer, SignetError* out_error) {
    if (!out_buffer) {
        fill_error(out_error, SIGNET_ERROR_NULL_POINTER, "Output buffer is null");
        return false;
    }

    if (input.empty()) {
        out_buffer->data = nullptr;
        out_buffer->length = 0;
        return true;
    }

    auto* data = new(std::nothrow) uint8_t[input.size()];
    if (!data) {
        fill_error(out_error, SIGNET_ERROR_OUT_OF_MEMORY, "Failed to allocate output buffer");
        return false;
    }
    std::memcpy(data, input.data(), input.size());
    out_buffer->data = data;
    out_buffer->length = input.size();
    return true;
}

SignetErrorCode make_public_key(
    const std::span<const uint8_t> point,
    SignetPublicKey** out_key,
    SignetError* out_error) {
    auto* key = new(std::nothrow) SignetPublicKey{};
    if (!key) {
        fill_error(out_error, SIGNET_ERROR_OUT_OF_MEMORY, "Failed to allocate public key");
        return SIGNET_ERROR_OUT_OF_MEMORY;
    }
    key->key.assign(point.begin(), point.end());
    *out_key = key;
    return SIGNET_SUCCESS;
}

SignetErrorCode make_private_key(
    X25519KeyPair key_pair,
    SignetPrivateKey** out_key,
    SignetError* out_error) {
    auto* key = new(std::nothrow) SignetPrivateKey{};
    if (!key) {
        fill_error(out_error, SIGNET_ERROR_OUT_OF_MEMORY, "Failed to allocate private key");
        return SIGNET_ERROR_OUT_OF_MEMORY;
    }
    key->key_pair = std::make_unique<X25519KeyPair>(std::move(key_pair));
    *out_key = key;
    return SIGNET_SUCCESS;
}

} // namespace signet::internal

using namespace signet::internal;

extern "C" {

// ----------------------------------------------------------------------------
// Version & Initialization
// ----------------------------------------------------------------------------

const char* signet_version(void) {
    return "1.0.0";
}

SignetErrorCode signet_init(void) {
    if (const auto err = EnsureInitialized(); err != SIGNET_SUCCESS) {
        return err;
    }
    InstallConfig(RecordConfig::Default());
    return SIGNET_SUCCESS;
}

SignetErrorCode signet_init_with_config(
    const SignetConfig* config,
    SignetError* out_error) {
    if (!validate_input_handle(config, "Config", out_error)) {
        return SIGNET_ERROR_NULL_POINTER;
    }
    if (const auto err = EnsureInitialized(); err != SIGNET_SUCCESS) {
        fill_error(out_error, err, std::string(ErrorMessages::SODIUM_INIT_FAILED));
        return err;
    }

    auto record_config = config->verify_key_pair
                             ? RecordConfig::Default()
                             : RecordConfig::Permissive();
    record_config = record_config
        .WithMaxSignatureLength(config->max_signature_length)
        .WithMaxSerializedLength(config->max_serialized_length);
    if (!record_config.IsValid()) {
        fill_error(out_error, SIGNET_ERROR_INVALID_INPUT,
                   "Record limits must be non-zero");
        return SIGNET_ERROR_INVALID_INPUT;
    }

    InstallConfig(record_config);
    return SIGNET_SUCCESS;
}

void signet_shutdown(void) {
    InstallConfig(RecordConfig::Default());
}

uint64_t signet_live_object_count(const SignetObjectKind kind) {
    const auto index = static_cast<size_t>(kind);
    if (index >= OBJECT_KIND_COUNT) {
        return 0;
    }
    return live_counters()[index].load(std::memory_order_relaxed);
}

// ----------------------------------------------------------------------------
// Memory Management
// ----------------------------------------------------------------------------

void signet_buffer_free(SignetBuffer* buffer) {
    if (!buffer) {
        return;
    }
    if (buffer->data) {
        (void) SodiumInterop::SecureWipe(std::span(buffer->data, buffer->length));
        delete[] buffer->data;
    }
    buffer->data = nullptr;
    buffer->length = 0;
}

void signet_error_free(SignetError* error) {
    if (error && error->message) {
        free(error->message);
        error->message = nullptr;
    }
}

const char* signet_error_string(const SignetErrorCode code) {
    switch (code) {
        case SIGNET_SUCCESS: return "Success";
        case SIGNET_ERROR_GENERIC: return "Generic error";
        case SIGNET_ERROR_INVALID_INPUT: return "Invalid input";
        case SIGNET_ERROR_KEY_GENERATION: return "Key generation failed";
        case SIGNET_ERROR_DERIVE_KEY: return "Key derivation failed";
        case SIGNET_ERROR_INVALID_KEY: return "Invalid key";
        case SIGNET_ERROR_DECODE: return "Decoding failed";
        case SIGNET_ERROR_ENCODE: return "Encoding failed";
        case SIGNET_ERROR_SIGNATURE: return "Signature operation failed";
        case SIGNET_ERROR_OUT_OF_MEMORY: return "Out of memory";
        case SIGNET_ERROR_SODIUM_FAILURE: return "Libsodium operation failed";
        case SIGNET_ERROR_NULL_POINTER: return "Null pointer";
        case SIGNET_ERROR_INVALID_STATE: return "Invalid state";
        default: return "Unknown error";
    }
}

} // extern "C"
