#pragma once

#include "signet/core/result.hpp"
#include "signet/core/failures.hpp"

#include <span>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace signet::protocol::crypto {

/**
 * @brief RAII wrapper for libsodium secure memory
 *
 * Manages memory allocated via sodium_malloc: guard pages before/after,
 * locked in RAM, zeroed on free.
 *
 * Move-only. A moved-from handle is invalid and every operation on it
 * fails with InvalidOperation.
 */
class SecureMemoryHandle {
public:
    /**
     * @brief Allocate secure memory
     *
     * @param size Number of bytes to allocate (non-zero)
     */
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    ~SecureMemoryHandle();

    SecureMemoryHandle() noexcept : ptr_(nullptr), size_(0) {}

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    /**
     * @brief Allocate a second secure region holding the same bytes
     */
    Result<SecureMemoryHandle, SodiumFailure> Clone() const;

    /**
     * @brief Write data to secure memory; remaining bytes are zeroed
     */
    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    /**
     * @brief Read the whole region into output (must be >= Size())
     */
    Result<Unit, SodiumFailure> Read(std::span<uint8_t> output) const;

    Result<std::vector<uint8_t>, SodiumFailure> ReadBytes(size_t size) const;

    /**
     * @brief Execute a function with read-only access to the secure memory
     */
    template<typename F>
    auto WithReadAccess(F&& func) const -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;

        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Handle has been disposed"));
        }

        std::span<const uint8_t> secure_span(
            static_cast<const uint8_t*>(ptr_),
            size_);

        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(secure_span));
    }

    [[nodiscard]] bool IsInvalid() const noexcept {
        return ptr_ == nullptr;
    }

    [[nodiscard]] size_t Size() const noexcept {
        return size_;
    }

private:
    SecureMemoryHandle(void* ptr, size_t size) noexcept
        : ptr_(ptr), size_(size) {}

    void* ptr_;
    size_t size_;
};

} // namespace signet::protocol::crypto
