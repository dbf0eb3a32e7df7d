#pragma once
#include "signet/crypto/sodium_secure_memory_handle.hpp"
#include "signet/core/result.hpp"
#include "signet/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace signet::protocol::models {
class X25519KeyPair {
public:
    static Result<X25519KeyPair, ProtocolFailure> Generate();
    static Result<X25519KeyPair, ProtocolFailure> FromPrivateKey(std::span<const uint8_t> private_key);
    X25519KeyPair(
        crypto::SecureMemoryHandle secret_key_handle,
        std::vector<uint8_t> public_key);
    X25519KeyPair(X25519KeyPair&&) noexcept = default;
    X25519KeyPair& operator=(X25519KeyPair&&) noexcept = default;
    X25519KeyPair(const X25519KeyPair&) = delete;
    X25519KeyPair& operator=(const X25519KeyPair&) = delete;
    [[nodiscard]] Result<X25519KeyPair, ProtocolFailure> Clone() const;
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> GetPrivateKeyCopy() const;
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Agree(
        std::span<const uint8_t> peer_public_key) const;
    [[nodiscard]] const crypto::SecureMemoryHandle& GetSecretKeyHandle() const noexcept {
        return secret_key_handle_;
    }
    [[nodiscard]] std::vector<uint8_t> GetPublicKeyCopy() const {
        return public_key_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept {
        return public_key_;
    }
    [[nodiscard]] crypto::SecureMemoryHandle TakeSecretKeyHandle() && {
        return std::move(secret_key_handle_);
    }
private:
    crypto::SecureMemoryHandle secret_key_handle_;
    std::vector<uint8_t> public_key_;
};
}
