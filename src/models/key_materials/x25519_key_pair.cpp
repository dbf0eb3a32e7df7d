#include "signet/models/key_materials/x25519_key_pair.hpp"
#include "signet/crypto/sodium_interop.hpp"
#include "signet/core/constants.hpp"

#include <string>

namespace signet::protocol::models {
    using crypto::SodiumInterop;
    using crypto::SecureMemoryHandle;

    X25519KeyPair::X25519KeyPair(
        SecureMemoryHandle secret_key_handle,
        std::vector<uint8_t> public_key)
        : secret_key_handle_(std::move(secret_key_handle))
          , public_key_(std::move(public_key)) {
    }

    Result<X25519KeyPair, ProtocolFailure> X25519KeyPair::Generate() {
        auto result = SodiumInterop::GenerateX25519KeyPair("private key");
        if (result.IsErr()) {
            return Result<X25519KeyPair, ProtocolFailure>::Err(std::move(result).UnwrapErr());
        }
        auto [handle, public_key] = std::move(result).Unwrap();
        return Result<X25519KeyPair, ProtocolFailure>::Ok(
            X25519KeyPair(std::move(handle), std::move(public_key)));
    }

    Result<X25519KeyPair, ProtocolFailure> X25519KeyPair::FromPrivateKey(
        const std::span<const uint8_t> private_key) {
        if (private_key.size() != Constants::X_25519_PRIVATE_KEY_SIZE) {
            return Result<X25519KeyPair, ProtocolFailure>::Err(
                ProtocolFailure::InvalidKey(
                    "Private key must be " + std::to_string(Constants::X_25519_PRIVATE_KEY_SIZE) +
                    " bytes, got " + std::to_string(private_key.size())));
        }
        auto handle_result = SecureMemoryHandle::Allocate(Constants::X_25519_PRIVATE_KEY_SIZE);
        if (handle_result.IsErr()) {
            return Result<X25519KeyPair, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(handle_result.UnwrapErr()));
        }
        auto handle = std::move(handle_result).Unwrap();
        if (auto write_result = handle.Write(private_key); write_result.IsErr()) {
            return Result<X25519KeyPair, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(write_result.UnwrapErr()));
        }
        auto public_result = SodiumInterop::DeriveX25519PublicKey(handle);
        if (public_result.IsErr()) {
            return Result<X25519KeyPair, ProtocolFailure>::Err(std::move(public_result).UnwrapErr());
        }
        return Result<X25519KeyPair, ProtocolFailure>::Ok(
            X25519KeyPair(std::move(handle), std::move(public_result).Unwrap()));
    }

    Result<X25519KeyPair, ProtocolFailure> X25519KeyPair::Clone() const {
        auto clone_result = secret_key_handle_.Clone();
        if (clone_result.IsErr()) {
            return Result<X25519KeyPair, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(clone_result.UnwrapErr()));
        }
        return Result<X25519KeyPair, ProtocolFailure>::Ok(
            X25519KeyPair(std::move(clone_result).Unwrap(), public_key_));
    }

    Result<std::vector<uint8_t>, ProtocolFailure> X25519KeyPair::GetPrivateKeyCopy() const {
        auto read_result = secret_key_handle_.ReadBytes(Constants::X_25519_PRIVATE_KEY_SIZE);
        if (read_result.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(read_result.UnwrapErr()));
        }
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(read_result).Unwrap());
    }

    Result<std::vector<uint8_t>, ProtocolFailure> X25519KeyPair::Agree(
        const std::span<const uint8_t> peer_public_key) const {
        return SodiumInterop::ComputeX25519SharedSecret(secret_key_handle_, peer_public_key);
    }
}
