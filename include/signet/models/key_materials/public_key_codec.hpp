#pragma once
#include "signet/core/result.hpp"
#include "signet/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace signet::protocol::models {
/**
 * @brief Type-prefixed encoding of X25519 public points
 *
 * Serialized form is KEY_TYPE_DJB followed by the 32-byte point.
 */
class PublicKeyCodec {
public:
    [[nodiscard]] static std::vector<uint8_t> Encode(std::span<const uint8_t> point);
    static Result<std::vector<uint8_t>, ProtocolFailure> Decode(std::span<const uint8_t> serialized);
private:
    PublicKeyCodec() = delete;
};
}
