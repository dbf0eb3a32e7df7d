#pragma once
#include "signet/models/key_materials/x25519_key_pair.hpp"
#include "signet/configuration/record_config.hpp"
#include "signet/core/result.hpp"
#include "signet/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace signet::protocol::models {
class SignedPreKeyMaterial {
public:
    /**
     * @brief Build a record from key material, checked against the config
     *
     * @param public_key 32-byte X25519 point
     * @return Err(InvalidKey) when the point does not match the private key and
     *         the config verifies key pairs, Err(InvalidInput) when the
     *         signature exceeds the configured length
     */
    static Result<SignedPreKeyMaterial, ProtocolFailure> Create(
        uint32_t id,
        uint64_t timestamp_ms,
        std::span<const uint8_t> public_key,
        const X25519KeyPair& private_key,
        std::span<const uint8_t> signature,
        const configuration::RecordConfig& config);
    /**
     * @brief Decode a record produced by Serialize
     *
     * Only the serialized length limit of the config applies. Key-pair and
     * signature limits are checked by Create and not repeated here.
     *
     * @return Err(Decode) for malformed bytes, a bad point, a private key that
     *         is not 32 bytes or a timestamp beyond the signed 64-bit range
     */
    static Result<SignedPreKeyMaterial, ProtocolFailure> Deserialize(
        std::span<const uint8_t> serialized,
        const configuration::RecordConfig& config);
    SignedPreKeyMaterial(
        uint32_t id,
        uint64_t timestamp_ms,
        X25519KeyPair key_pair,
        std::vector<uint8_t> public_key,
        std::vector<uint8_t> signature);
    SignedPreKeyMaterial(SignedPreKeyMaterial&&) noexcept = default;
    SignedPreKeyMaterial& operator=(SignedPreKeyMaterial&&) noexcept = default;
    SignedPreKeyMaterial(const SignedPreKeyMaterial&) = delete;
    SignedPreKeyMaterial& operator=(const SignedPreKeyMaterial&) = delete;
    [[nodiscard]] Result<SignedPreKeyMaterial, ProtocolFailure> Clone() const;
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Serialize() const;
    [[nodiscard]] uint32_t GetId() const noexcept {
        return id_;
    }
    [[nodiscard]] uint64_t GetTimestampMs() const noexcept {
        return timestamp_ms_;
    }
    [[nodiscard]] const X25519KeyPair& GetKeyPair() const noexcept {
        return key_pair_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept {
        return public_key_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetSignature() const noexcept {
        return signature_;
    }
private:
    uint32_t id_;
    uint64_t timestamp_ms_;
    X25519KeyPair key_pair_;
    std::vector<uint8_t> public_key_;
    std::vector<uint8_t> signature_;
};
}
