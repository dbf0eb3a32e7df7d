#pragma once

#include "signet/core/constants.hpp"

#include <cstdint>

namespace signet::protocol::configuration {

/// Validation limits applied by the native library to signed pre-key records
///
/// The configuration is process-wide: it is installed once through
/// `signet_init_with_config` and read by every record construction and
/// deserialization afterwards.
///
/// @example
/// ```cpp
/// auto config = RecordConfig::Default().WithMaxSignatureLength(64);
/// ```
class RecordConfig {
public:
    // =========================================================================
    // Factory Methods
    // =========================================================================

    /// Key pair verification on, default length limits
    [[nodiscard]] static constexpr RecordConfig Default() noexcept {
        return RecordConfig(
            true,
            RecordConstants::DEFAULT_MAX_SIGNATURE_LENGTH,
            RecordConstants::DEFAULT_MAX_SERIALIZED_LENGTH);
    }

    /// Accepts records whose public key was not derived from their private key
    ///
    /// Needed when importing records produced by peers that store a
    /// separately supplied public key.
    [[nodiscard]] static constexpr RecordConfig Permissive() noexcept {
        return RecordConfig(
            false,
            RecordConstants::DEFAULT_MAX_SIGNATURE_LENGTH,
            RecordConstants::DEFAULT_MAX_SERIALIZED_LENGTH);
    }

    [[nodiscard]] constexpr RecordConfig WithMaxSignatureLength(const uint32_t length) const noexcept {
        return RecordConfig(verify_key_pair_, length, max_serialized_length_);
    }

    [[nodiscard]] constexpr RecordConfig WithMaxSerializedLength(const uint32_t length) const noexcept {
        return RecordConfig(verify_key_pair_, max_signature_length_, length);
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] constexpr bool VerifiesKeyPair() const noexcept {
        return verify_key_pair_;
    }

    [[nodiscard]] constexpr uint32_t GetMaxSignatureLength() const noexcept {
        return max_signature_length_;
    }

    [[nodiscard]] constexpr uint32_t GetMaxSerializedLength() const noexcept {
        return max_serialized_length_;
    }

    /// Both limits must be non-zero
    [[nodiscard]] constexpr bool IsValid() const noexcept {
        return max_signature_length_ > 0 && max_serialized_length_ > 0;
    }

    [[nodiscard]] constexpr bool operator==(const RecordConfig& other) const noexcept {
        return verify_key_pair_ == other.verify_key_pair_ &&
               max_signature_length_ == other.max_signature_length_ &&
               max_serialized_length_ == other.max_serialized_length_;
    }

    [[nodiscard]] constexpr bool operator!=(const RecordConfig& other) const noexcept {
        return !(*this == other);
    }

private:
    constexpr RecordConfig(
        const bool verify_key_pair,
        const uint32_t max_signature_length,
        const uint32_t max_serialized_length) noexcept
        : verify_key_pair_(verify_key_pair)
        , max_signature_length_(max_signature_length)
        , max_serialized_length_(max_serialized_length) {}

    bool verify_key_pair_;
    uint32_t max_signature_length_;
    uint32_t max_serialized_length_;
};

} // namespace signet::protocol::configuration
