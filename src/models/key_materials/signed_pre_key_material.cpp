#include "signet/models/key_materials/signed_pre_key_material.hpp"
#include "signet/models/key_materials/public_key_codec.hpp"
#include "signet/crypto/sodium_interop.hpp"
#include "signet/core/constants.hpp"
#include "storage/signed_pre_key.pb.h"

#include <limits>
#include <string>

namespace signet::protocol::models {
    using crypto::SodiumInterop;
    using configuration::RecordConfig;

    namespace {
        void WipeString(std::string& value) {
            if (value.empty()) {
                return;
            }
            (void) SodiumInterop::SecureWipe(std::span<uint8_t>(
                reinterpret_cast<uint8_t*>(value.data()), value.size()));
        }

        std::span<const uint8_t> AsBytes(const std::string& value) {
            return {reinterpret_cast<const uint8_t*>(value.data()), value.size()};
        }

        Result<Unit, ProtocolFailure> ValidateSignature(
            const std::span<const uint8_t> signature,
            const RecordConfig& config) {
            if (signature.size() > config.GetMaxSignatureLength()) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::InvalidInput(
                        "Signature length " + std::to_string(signature.size()) +
                        " exceeds maximum " + std::to_string(config.GetMaxSignatureLength())));
            }
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }

        Result<Unit, ProtocolFailure> ValidateKeyPair(
            const std::span<const uint8_t> public_key,
            const X25519KeyPair& private_key,
            const RecordConfig& config) {
            if (public_key.size() != Constants::X_25519_PUBLIC_KEY_SIZE) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::InvalidKey(
                        "Public key must be " + std::to_string(Constants::X_25519_PUBLIC_KEY_SIZE) +
                        " bytes, got " + std::to_string(public_key.size())));
            }
            if (!config.VerifiesKeyPair()) {
                return Result<Unit, ProtocolFailure>::Ok(unit);
            }
            auto equals_result = SodiumInterop::ConstantTimeEquals(public_key, private_key.GetPublicKey());
            if (equals_result.IsErr()) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::FromSodiumFailure(equals_result.UnwrapErr()));
            }
            if (!equals_result.Unwrap()) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::InvalidKey(std::string(ErrorMessages::PUBLIC_KEY_MISMATCH)));
            }
            return Result<Unit, ProtocolFailure>::Ok(unit);
        }
    }

    SignedPreKeyMaterial::SignedPreKeyMaterial(
        const uint32_t id,
        const uint64_t timestamp_ms,
        X25519KeyPair key_pair,
        std::vector<uint8_t> public_key,
        std::vector<uint8_t> signature)
        : id_(id)
          , timestamp_ms_(timestamp_ms)
          , key_pair_(std::move(key_pair))
          , public_key_(std::move(public_key))
          , signature_(std::move(signature)) {
    }

    Result<SignedPreKeyMaterial, ProtocolFailure> SignedPreKeyMaterial::Create(
        const uint32_t id,
        const uint64_t timestamp_ms,
        const std::span<const uint8_t> public_key,
        const X25519KeyPair& private_key,
        const std::span<const uint8_t> signature,
        const RecordConfig& config) {
        if (auto key_check = ValidateKeyPair(public_key, private_key, config); key_check.IsErr()) {
            return std::move(key_check).PropagateErr<SignedPreKeyMaterial>();
        }
        if (auto signature_check = ValidateSignature(signature, config); signature_check.IsErr()) {
            return std::move(signature_check).PropagateErr<SignedPreKeyMaterial>();
        }
        auto key_pair_result = private_key.Clone();
        if (key_pair_result.IsErr()) {
            return std::move(key_pair_result).PropagateErr<SignedPreKeyMaterial>();
        }
        return Result<SignedPreKeyMaterial, ProtocolFailure>::Ok(
            SignedPreKeyMaterial(
                id,
                timestamp_ms,
                std::move(key_pair_result).Unwrap(),
                std::vector<uint8_t>(public_key.begin(), public_key.end()),
                std::vector<uint8_t>(signature.begin(), signature.end())));
    }

    Result<SignedPreKeyMaterial, ProtocolFailure> SignedPreKeyMaterial::Clone() const {
        auto key_pair_result = key_pair_.Clone();
        if (key_pair_result.IsErr()) {
            return std::move(key_pair_result).PropagateErr<SignedPreKeyMaterial>();
        }
        return Result<SignedPreKeyMaterial, ProtocolFailure>::Ok(
            SignedPreKeyMaterial(
                id_,
                timestamp_ms_,
                std::move(key_pair_result).Unwrap(),
                public_key_,
                signature_));
    }

    Result<std::vector<uint8_t>, ProtocolFailure> SignedPreKeyMaterial::Serialize() const {
        auto private_result = key_pair_.GetPrivateKeyCopy();
        if (private_result.IsErr()) {
            return std::move(private_result).PropagateErr<std::vector<uint8_t>>();
        }
        auto private_key = std::move(private_result).Unwrap();

        const auto encoded_public = PublicKeyCodec::Encode(public_key_);
        proto::storage::SignedPreKeyRecordStructure structure;
        structure.set_id(id_);
        structure.set_timestamp(timestamp_ms_);
        structure.set_public_key(encoded_public.data(), encoded_public.size());
        structure.set_private_key(private_key.data(), private_key.size());
        structure.set_signature(signature_.data(), signature_.size());
        (void) SodiumInterop::SecureWipe(std::span<uint8_t>(private_key));

        std::string serialized;
        const bool encoded = structure.SerializeToString(&serialized);
        WipeString(*structure.mutable_private_key());
        if (!encoded) {
            WipeString(serialized);
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::Encode("Failed to serialize signed pre-key record"));
        }
        std::vector<uint8_t> bytes(serialized.begin(), serialized.end());
        WipeString(serialized);
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(bytes));
    }

    Result<SignedPreKeyMaterial, ProtocolFailure> SignedPreKeyMaterial::Deserialize(
        const std::span<const uint8_t> serialized,
        const RecordConfig& config) {
        if (serialized.size() > config.GetMaxSerializedLength()) {
            return Result<SignedPreKeyMaterial, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput(
                    "Serialized record length " + std::to_string(serialized.size()) +
                    " exceeds maximum " + std::to_string(config.GetMaxSerializedLength())));
        }

        proto::storage::SignedPreKeyRecordStructure structure;
        if (!structure.ParseFromArray(serialized.data(), static_cast<int>(serialized.size()))) {
            return Result<SignedPreKeyMaterial, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Failed to parse signed pre-key record"));
        }

        if (structure.timestamp() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            WipeString(*structure.mutable_private_key());
            return Result<SignedPreKeyMaterial, ProtocolFailure>::Err(
                ProtocolFailure::Decode(
                    "Timestamp " + std::to_string(structure.timestamp()) + " ms is out of range"));
        }

        auto public_result = PublicKeyCodec::Decode(AsBytes(structure.public_key()));
        if (public_result.IsErr()) {
            WipeString(*structure.mutable_private_key());
            return std::move(public_result).PropagateErr<SignedPreKeyMaterial>();
        }
        if (structure.private_key().size() != Constants::X_25519_PRIVATE_KEY_SIZE) {
            WipeString(*structure.mutable_private_key());
            return Result<SignedPreKeyMaterial, ProtocolFailure>::Err(
                ProtocolFailure::Decode(
                    "Private key must be " + std::to_string(Constants::X_25519_PRIVATE_KEY_SIZE) +
                    " bytes, got " + std::to_string(structure.private_key().size())));
        }

        auto key_pair_result = X25519KeyPair::FromPrivateKey(AsBytes(structure.private_key()));
        WipeString(*structure.mutable_private_key());
        if (key_pair_result.IsErr()) {
            return std::move(key_pair_result).PropagateErr<SignedPreKeyMaterial>();
        }
        auto key_pair = std::move(key_pair_result).Unwrap();
        auto public_key = std::move(public_result).Unwrap();
        const auto signature = AsBytes(structure.signature());

        return Result<SignedPreKeyMaterial, ProtocolFailure>::Ok(
            SignedPreKeyMaterial(
                structure.id(),
                structure.timestamp(),
                std::move(key_pair),
                std::move(public_key),
                std::vector<uint8_t>(signature.begin(), signature.end())));
    }
}
