#pragma once

#include "signet/handles/native_handle.hpp"
#include "signet/handles/native_traits.hpp"
#include "signet/core/result.hpp"
#include "signet/core/failures.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace signet::protocol::handles {

/**
 * @brief Owning handle to a native Ed25519 identity key pair
 */
class IdentityKeyPair {
public:
    static Result<IdentityKeyPair, HandleFailure> Generate();

    [[nodiscard]] static IdentityKeyPair Adopt(SignetIdentityKeyPair* raw) noexcept;

    /// Detached Ed25519 verification; a wrong signature is Ok(false)
    static Result<bool, HandleFailure> Verify(
        std::span<const uint8_t> public_key,
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature);

    IdentityKeyPair() noexcept = default;
    IdentityKeyPair(IdentityKeyPair&&) noexcept = default;
    IdentityKeyPair& operator=(IdentityKeyPair&&) noexcept = default;
    IdentityKeyPair(const IdentityKeyPair&) = delete;
    IdentityKeyPair& operator=(const IdentityKeyPair&) = delete;

    [[nodiscard]] bool IsLive() const noexcept {
        return handle_.IsLive();
    }

    [[nodiscard]] Result<IdentityKeyPair, HandleFailure> Clone() const;
    Result<Unit, HandleFailure> Destroy();
    [[nodiscard]] SignetIdentityKeyPair* Release() noexcept;

    /// 32-byte Ed25519 public key
    [[nodiscard]] Result<std::vector<uint8_t>, HandleFailure> GetPublicKey() const;
    [[nodiscard]] Result<std::vector<uint8_t>, HandleFailure> Sign(std::span<const uint8_t> message) const;

private:
    explicit IdentityKeyPair(NativeHandle<IdentityKeyPairTraits> handle) noexcept
        : handle_(std::move(handle)) {}

    NativeHandle<IdentityKeyPairTraits> handle_;
};

} // namespace signet::protocol::handles
