#pragma once
#include "signet/crypto/sodium_secure_memory_handle.hpp"
#include "signet/core/result.hpp"
#include "signet/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace signet::protocol::models {
class Ed25519KeyPair {
public:
    static Result<Ed25519KeyPair, ProtocolFailure> Generate();
    Ed25519KeyPair(
        crypto::SecureMemoryHandle secret_key_handle,
        std::vector<uint8_t> public_key);
    Ed25519KeyPair(Ed25519KeyPair&&) noexcept = default;
    Ed25519KeyPair& operator=(Ed25519KeyPair&&) noexcept = default;
    Ed25519KeyPair(const Ed25519KeyPair&) = delete;
    Ed25519KeyPair& operator=(const Ed25519KeyPair&) = delete;
    [[nodiscard]] Result<Ed25519KeyPair, ProtocolFailure> Clone() const;
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Sign(std::span<const uint8_t> message) const;
    [[nodiscard]] const crypto::SecureMemoryHandle& GetSecretKeyHandle() const noexcept {
        return secret_key_handle_;
    }
    [[nodiscard]] std::vector<uint8_t> GetPublicKeyCopy() const {
        return public_key_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept {
        return public_key_;
    }
private:
    crypto::SecureMemoryHandle secret_key_handle_;
    std::vector<uint8_t> public_key_;
};
}
