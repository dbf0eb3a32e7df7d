#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace signet::protocol {
struct Constants {
    static constexpr size_t ED_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t ED_25519_SECRET_KEY_SIZE = 64;
    static constexpr size_t ED_25519_SIGNATURE_SIZE = 64;
    static constexpr size_t X_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t X_25519_PRIVATE_KEY_SIZE = 32;
    static constexpr size_t X_25519_SHARED_SECRET_SIZE = 32;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
    static constexpr int FAILURE = -1;
};
struct KeyConstants {
    static constexpr uint8_t KEY_TYPE_DJB = 0x05;
    static constexpr size_t KEY_TYPE_PREFIX_SIZE = 1;
    static constexpr size_t SERIALIZED_PUBLIC_KEY_SIZE =
        KEY_TYPE_PREFIX_SIZE + Constants::X_25519_PUBLIC_KEY_SIZE;
};
struct RecordConstants {
    static constexpr uint32_t DEFAULT_MAX_SIGNATURE_LENGTH = 1024;
    static constexpr uint32_t DEFAULT_MAX_SERIALIZED_LENGTH = 8192;
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view CONSTANT_TIME_COMPARISON_FAILED = "Constant-time comparison failed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view FAILED_TO_READ_SECURE_MEMORY = "Failed to read secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view NATIVE_OBJECT_DESTROYED = "Native object has been destroyed";
    static constexpr std::string_view PUBLIC_KEY_MISMATCH = "Public key does not match private key";
};
}
