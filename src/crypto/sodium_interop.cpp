#include "signet/crypto/sodium_interop.hpp"
#include "signet/crypto/sodium_secure_memory_handle.hpp"

#include <algorithm>
#include <string>

namespace signet::protocol::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Secure Memory Operations
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    if (buffer.size() > MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                "Buffer size " + std::to_string(buffer.size()) +
                " exceeds maximum " + std::to_string(MAX_BUFFER_SIZE)));
    }

    if (buffer.size() <= Constants::SMALL_BUFFER_THRESHOLD) {
        return WipeSmallBuffer(buffer);
    }
    return WipeLargeBuffer(buffer);
}

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<const uint8_t> buffer) {
    return SecureWipe(std::span<uint8_t>(
        const_cast<uint8_t*>(buffer.data()),
        buffer.size()));
}

Result<Unit, SodiumFailure> SodiumInterop::WipeSmallBuffer(std::span<uint8_t> buffer) {
    volatile uint8_t* vbuf = buffer.data();
    for (size_t i = 0; i < buffer.size(); ++i) {
        vbuf[i] = 0;
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeLargeBuffer(std::span<uint8_t> buffer) {
    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {

    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }

    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }

    const int result = sodium_memcmp(a.data(), b.data(), a.size());
    return Result<bool, SodiumFailure>::Ok(result == 0);
}

// ============================================================================
// X25519
// ============================================================================

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
SodiumInterop::GenerateX25519KeyPair(std::string_view key_purpose) {
    using KeyPairResult = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>;

    auto sk_handle_result = SecureMemoryHandle::Allocate(Constants::X_25519_PRIVATE_KEY_SIZE);
    if (sk_handle_result.IsErr()) {
        return KeyPairResult::Err(
            ProtocolFailure::FromSodiumFailure(sk_handle_result.UnwrapErr()));
    }
    SecureMemoryHandle sk_handle = std::move(sk_handle_result).Unwrap();

    std::vector<uint8_t> sk_bytes = GetRandomBytes(Constants::X_25519_PRIVATE_KEY_SIZE);
    auto write_result = sk_handle.Write(std::span<const uint8_t>(sk_bytes));
    (void)SecureWipe(std::span<uint8_t>(sk_bytes));
    if (write_result.IsErr()) {
        return KeyPairResult::Err(
            ProtocolFailure::FromSodiumFailure(write_result.UnwrapErr()));
    }

    auto pk_result = DeriveX25519PublicKey(sk_handle);
    if (pk_result.IsErr()) {
        return KeyPairResult::Err(ProtocolFailure::KeyGeneration(
            "Failed to derive " + std::string(key_purpose) + " public key: " +
            pk_result.UnwrapErr().message));
    }

    return KeyPairResult::Ok(
        std::make_pair(std::move(sk_handle), std::move(pk_result).Unwrap()));
}

Result<std::vector<uint8_t>, ProtocolFailure>
SodiumInterop::DeriveX25519PublicKey(const SecureMemoryHandle& secret_key) {
    if (secret_key.Size() != Constants::X_25519_PRIVATE_KEY_SIZE) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidKey("X25519 secret key must be " +
                std::to_string(Constants::X_25519_PRIVATE_KEY_SIZE) + " bytes"));
    }

    std::vector<uint8_t> pk_bytes(Constants::X_25519_PUBLIC_KEY_SIZE);
    auto derive_result = secret_key.WithReadAccess([&](std::span<const uint8_t> sk) {
        return crypto_scalarmult_base(pk_bytes.data(), sk.data());
    });
    if (derive_result.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(derive_result.UnwrapErr()));
    }
    if (derive_result.Unwrap() != SodiumConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey("crypto_scalarmult_base failed"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(pk_bytes));
}

Result<std::vector<uint8_t>, ProtocolFailure> SodiumInterop::ComputeX25519SharedSecret(
    const SecureMemoryHandle& secret_key,
    std::span<const uint8_t> peer_public_key) {
    if (peer_public_key.size() != Constants::X_25519_PUBLIC_KEY_SIZE) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidKey("Peer X25519 public key must be " +
                std::to_string(Constants::X_25519_PUBLIC_KEY_SIZE) + " bytes"));
    }

    std::vector<uint8_t> shared(Constants::X_25519_SHARED_SECRET_SIZE);
    auto dh_result = secret_key.WithReadAccess([&](std::span<const uint8_t> sk) {
        return crypto_scalarmult(shared.data(), sk.data(), peer_public_key.data());
    });
    if (dh_result.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(dh_result.UnwrapErr()));
    }
    if (dh_result.Unwrap() != SodiumConstants::SUCCESS) {
        (void)SecureWipe(std::span<uint8_t>(shared));
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::DeriveKey("X25519 agreement produced a low-order result"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(shared));
}

// ============================================================================
// Ed25519
// ============================================================================

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
SodiumInterop::GenerateEd25519KeyPair() {
    using KeyPairResult = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>;

    std::vector<uint8_t> pk(Constants::ED_25519_PUBLIC_KEY_SIZE);
    std::vector<uint8_t> sk(Constants::ED_25519_SECRET_KEY_SIZE);

    if (crypto_sign_keypair(pk.data(), sk.data()) != SodiumConstants::SUCCESS) {
        (void)SecureWipe(std::span<uint8_t>(sk));
        return KeyPairResult::Err(
            ProtocolFailure::KeyGeneration("Failed to generate Ed25519 key pair"));
    }

    auto handle_result = SecureMemoryHandle::Allocate(Constants::ED_25519_SECRET_KEY_SIZE);
    if (handle_result.IsErr()) {
        (void)SecureWipe(std::span<uint8_t>(sk));
        return KeyPairResult::Err(
            ProtocolFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    auto handle = std::move(handle_result).Unwrap();
    auto write_result = handle.Write(std::span<const uint8_t>(sk));
    (void)SecureWipe(std::span<uint8_t>(sk));
    if (write_result.IsErr()) {
        return KeyPairResult::Err(
            ProtocolFailure::FromSodiumFailure(write_result.UnwrapErr()));
    }

    return KeyPairResult::Ok(std::make_pair(std::move(handle), std::move(pk)));
}

Result<std::vector<uint8_t>, ProtocolFailure> SodiumInterop::SignDetached(
    const SecureMemoryHandle& secret_key,
    std::span<const uint8_t> message) {
    if (secret_key.Size() != Constants::ED_25519_SECRET_KEY_SIZE) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidKey("Ed25519 secret key must be " +
                std::to_string(Constants::ED_25519_SECRET_KEY_SIZE) + " bytes"));
    }

    std::vector<uint8_t> signature(crypto_sign_BYTES);
    unsigned long long sig_len = 0;
    auto sign_result = secret_key.WithReadAccess([&](std::span<const uint8_t> sk) {
        return crypto_sign_detached(
            signature.data(),
            &sig_len,
            message.data(),
            message.size(),
            sk.data());
    });
    if (sign_result.IsErr()) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::FromSodiumFailure(sign_result.UnwrapErr()));
    }
    if (sign_result.Unwrap() != SodiumConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Signature("crypto_sign_detached failed"));
    }
    if (sig_len != Constants::ED_25519_SIGNATURE_SIZE) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Signature("Generated signature has incorrect size"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(signature));
}

bool SodiumInterop::VerifyDetached(
    std::span<const uint8_t> public_key,
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature) noexcept {
    if (public_key.size() != Constants::ED_25519_PUBLIC_KEY_SIZE ||
        signature.size() != Constants::ED_25519_SIGNATURE_SIZE) {
        return false;
    }
    return crypto_sign_verify_detached(
               signature.data(),
               message.data(),
               message.size(),
               public_key.data()) == SodiumConstants::SUCCESS;
}

// ============================================================================
// Random Number Generation
// ============================================================================

std::vector<uint8_t> SodiumInterop::GetRandomBytes(size_t size) {
    std::vector<uint8_t> buffer(size);
    randombytes_buf(buffer.data(), size);
    return buffer;
}

// ============================================================================
// Memory Allocation
// ============================================================================

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

} // namespace signet::protocol::crypto
