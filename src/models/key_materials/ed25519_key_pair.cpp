#include "signet/models/key_materials/ed25519_key_pair.hpp"
#include "signet/crypto/sodium_interop.hpp"

namespace signet::protocol::models {
    using crypto::SodiumInterop;

    Ed25519KeyPair::Ed25519KeyPair(
        crypto::SecureMemoryHandle secret_key_handle,
        std::vector<uint8_t> public_key)
        : secret_key_handle_(std::move(secret_key_handle))
          , public_key_(std::move(public_key)) {
    }

    Result<Ed25519KeyPair, ProtocolFailure> Ed25519KeyPair::Generate() {
        auto result = SodiumInterop::GenerateEd25519KeyPair();
        if (result.IsErr()) {
            return Result<Ed25519KeyPair, ProtocolFailure>::Err(std::move(result).UnwrapErr());
        }
        auto [handle, public_key] = std::move(result).Unwrap();
        return Result<Ed25519KeyPair, ProtocolFailure>::Ok(
            Ed25519KeyPair(std::move(handle), std::move(public_key)));
    }

    Result<Ed25519KeyPair, ProtocolFailure> Ed25519KeyPair::Clone() const {
        auto clone_result = secret_key_handle_.Clone();
        if (clone_result.IsErr()) {
            return Result<Ed25519KeyPair, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(clone_result.UnwrapErr()));
        }
        return Result<Ed25519KeyPair, ProtocolFailure>::Ok(
            Ed25519KeyPair(std::move(clone_result).Unwrap(), public_key_));
    }

    Result<std::vector<uint8_t>, ProtocolFailure> Ed25519KeyPair::Sign(
        const std::span<const uint8_t> message) const {
        return SodiumInterop::SignDetached(secret_key_handle_, message);
    }
}
