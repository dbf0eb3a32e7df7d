#pragma once

#include "signet/core/result.hpp"
#include "signet/core/failures.hpp"
#include "signet/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace signet::protocol::crypto {

class SecureMemoryHandle;

/**
 * @brief Interop layer for libsodium cryptographic operations
 *
 * Every secret scalar produced here lives in a SecureMemoryHandle; temporaries
 * that had to be copied out of secure memory are wiped before returning.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium library
     *
     * Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Wipe a temporary that is only reachable through a const span
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<const uint8_t> buffer);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * @return Ok(true) if equal, Ok(false) if different (including size mismatch)
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    // ========================================================================
    // X25519
    // ========================================================================

    /**
     * @brief Generate an X25519 key pair
     *
     * @param key_purpose Description for error messages
     * @return Ok((secret key handle, public key bytes)) or Err
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
    GenerateX25519KeyPair(std::string_view key_purpose);

    /**
     * @brief Derive the X25519 public point for a secret scalar held in secure memory
     */
    static Result<std::vector<uint8_t>, ProtocolFailure>
    DeriveX25519PublicKey(const SecureMemoryHandle& secret_key);

    /**
     * @brief X25519 Diffie-Hellman
     *
     * Rejects low-order peer points (all-zero shared secret).
     */
    static Result<std::vector<uint8_t>, ProtocolFailure> ComputeX25519SharedSecret(
        const SecureMemoryHandle& secret_key,
        std::span<const uint8_t> peer_public_key);

    // ========================================================================
    // Ed25519
    // ========================================================================

    /**
     * @brief Generate an Ed25519 key pair
     *
     * @return Ok((secret key handle, public key bytes)) or Err
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
    GenerateEd25519KeyPair();

    static Result<std::vector<uint8_t>, ProtocolFailure> SignDetached(
        const SecureMemoryHandle& secret_key,
        std::span<const uint8_t> message);

    [[nodiscard]] static bool VerifyDetached(
        std::span<const uint8_t> public_key,
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature) noexcept;

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    /**
     * @brief Allocate guard-paged, locked memory using sodium_malloc
     *
     * @return Pointer to secure memory, or nullptr on failure
     */
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace signet::protocol::crypto
