#pragma once

/**
 * @file handle_logger.hpp
 * @brief Debug logging for native object lifetimes and handle ownership.
 *
 * SECURITY WARNING: record logging prints key material to stdout.
 * Only enable SIGNET_DEBUG_HANDLES for development/debugging of handle
 * lifetimes and leak hunting.
 * NEVER enable in production builds.
 *
 * Enable via CMake: -DSIGNET_DEBUG_HANDLES=ON
 */

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

namespace signet::debug {

// ============================================================================
// Layer identifiers - always defined so types are available
// ============================================================================

enum class Layer {
    Native,
    Handle
};

#ifdef SIGNET_DEBUG_HANDLES

inline std::string ToHex(std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(data.size() * 2);
    for (const auto byte : data) {
        result.push_back(hex_chars[(byte >> 4) & 0x0F]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

inline const char* LayerToString(Layer layer) {
    switch (layer) {
        case Layer::Native: return "NATIVE";
        case Layer::Handle: return "HANDLE";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// Core logging macros
// ============================================================================

#define SIGNET_LOG_OBJECT(layer, operation, type_name, ptr) \
    do { \
        fprintf(stdout, "[SIGNET-DEBUG] %s %s %s@%p\n", \
            ::signet::debug::LayerToString(layer), \
            operation, \
            type_name, \
            static_cast<const void*>(ptr)); \
        fflush(stdout); \
    } while(0)

#define SIGNET_LOG_BYTES(layer, operation, name, data) \
    do { \
        fprintf(stdout, "[SIGNET-DEBUG] %s %s %s: %s\n", \
            ::signet::debug::LayerToString(layer), \
            operation, \
            name, \
            ::signet::debug::ToHex(data).c_str()); \
        fflush(stdout); \
    } while(0)

#define SIGNET_LOG_VALUE(layer, operation, name, value) \
    do { \
        fprintf(stdout, "[SIGNET-DEBUG] %s %s %s: %s\n", \
            ::signet::debug::LayerToString(layer), \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define SIGNET_LOG_MSG(layer, operation, message) \
    do { \
        fprintf(stdout, "[SIGNET-DEBUG] %s %s %s\n", \
            ::signet::debug::LayerToString(layer), \
            operation, \
            message); \
        fflush(stdout); \
    } while(0)

// ============================================================================
// Native object lifetimes
// ============================================================================

inline void LogObjectAllocated(std::string_view type_name, const void* ptr) {
    SIGNET_LOG_OBJECT(Layer::Native, "ALLOC", std::string(type_name).c_str(), ptr);
}

inline void LogObjectDestroyed(std::string_view type_name, const void* ptr) {
    SIGNET_LOG_OBJECT(Layer::Native, "FREE", std::string(type_name).c_str(), ptr);
}

inline void LogNativeFailure(std::string_view operation, int32_t code, std::string_view message) {
    const std::string line = std::string(operation) + " failed (" + std::to_string(code) + "): " +
                             std::string(message);
    SIGNET_LOG_MSG(Layer::Native, "ERROR", line.c_str());
}

inline void LogRecordCreated(
    uint32_t id,
    uint64_t timestamp_ms,
    std::span<const uint8_t> public_key,
    std::span<const uint8_t> signature) {

    SIGNET_LOG_VALUE(Layer::Native, "RECORD", "id", id);
    SIGNET_LOG_VALUE(Layer::Native, "RECORD", "timestamp_ms", timestamp_ms);
    SIGNET_LOG_BYTES(Layer::Native, "RECORD", "public_key", public_key);
    SIGNET_LOG_BYTES(Layer::Native, "RECORD", "signature", signature);
}

// ============================================================================
// Handle ownership
// ============================================================================

inline void LogHandleAdopted(std::string_view type_name, const void* ptr) {
    SIGNET_LOG_OBJECT(Layer::Handle, "ADOPT", std::string(type_name).c_str(), ptr);
}

inline void LogHandleDestroyed(std::string_view type_name, const void* ptr) {
    SIGNET_LOG_OBJECT(Layer::Handle, "DESTROY", std::string(type_name).c_str(), ptr);
}

inline void LogHandleReleased(std::string_view type_name, const void* ptr) {
    SIGNET_LOG_OBJECT(Layer::Handle, "RELEASE", std::string(type_name).c_str(), ptr);
}

inline void LogBackstopFired(std::string_view type_name, const void* ptr, int32_t destroy_code) {
    SIGNET_LOG_OBJECT(Layer::Handle, "BACKSTOP", std::string(type_name).c_str(), ptr);
    SIGNET_LOG_VALUE(Layer::Handle, "BACKSTOP", "destroy_code", destroy_code);
}

#else // !SIGNET_DEBUG_HANDLES

// No-op implementations when SIGNET_DEBUG_HANDLES is not defined
#define SIGNET_LOG_OBJECT(layer, operation, type_name, ptr) ((void)0)
#define SIGNET_LOG_BYTES(layer, operation, name, data) ((void)0)
#define SIGNET_LOG_VALUE(layer, operation, name, value) ((void)0)
#define SIGNET_LOG_MSG(layer, operation, message) ((void)0)

inline void LogObjectAllocated(std::string_view, const void*) {}
inline void LogObjectDestroyed(std::string_view, const void*) {}
inline void LogNativeFailure(std::string_view, int32_t, std::string_view) {}
inline void LogRecordCreated(uint32_t, uint64_t, std::span<const uint8_t>, std::span<const uint8_t>) {}
inline void LogHandleAdopted(std::string_view, const void*) {}
inline void LogHandleDestroyed(std::string_view, const void*) {}
inline void LogHandleReleased(std::string_view, const void*) {}
inline void LogBackstopFired(std::string_view, const void*, int32_t) {}

#endif // SIGNET_DEBUG_HANDLES

} // namespace signet::debug
