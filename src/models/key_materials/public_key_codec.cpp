#include "signet/models/key_materials/public_key_codec.hpp"
#include "signet/core/constants.hpp"

#include <string>

namespace signet::protocol::models {

std::vector<uint8_t> PublicKeyCodec::Encode(const std::span<const uint8_t> point) {
    std::vector<uint8_t> serialized;
    serialized.reserve(KeyConstants::KEY_TYPE_PREFIX_SIZE + point.size());
    serialized.push_back(KeyConstants::KEY_TYPE_DJB);
    serialized.insert(serialized.end(), point.begin(), point.end());
    return serialized;
}

Result<std::vector<uint8_t>, ProtocolFailure> PublicKeyCodec::Decode(
    const std::span<const uint8_t> serialized) {
    if (serialized.empty()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Decode("Public key is empty"));
    }
    if (serialized[0] != KeyConstants::KEY_TYPE_DJB) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Decode("Unknown public key type " + std::to_string(serialized[0])));
    }
    if (serialized.size() != KeyConstants::SERIALIZED_PUBLIC_KEY_SIZE) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Decode(
                "Public key must be " + std::to_string(KeyConstants::SERIALIZED_PUBLIC_KEY_SIZE) +
                " bytes, got " + std::to_string(serialized.size())));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(
        std::vector<uint8_t>(serialized.begin() + KeyConstants::KEY_TYPE_PREFIX_SIZE, serialized.end()));
}

}
