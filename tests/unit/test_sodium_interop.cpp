#include <catch2/catch_test_macros.hpp>
#include "signet/crypto/sodium_interop.hpp"
#include "signet/crypto/sodium_secure_memory_handle.hpp"
#include "signet/core/constants.hpp"
#include <algorithm>
using namespace signet::protocol;
using namespace signet::protocol::crypto;
TEST_CASE("SodiumInterop - Initialization", "[sodium][crypto]") {
    SECTION("Initialize succeeds") {
        auto result = SodiumInterop::Initialize();
        REQUIRE(result.IsOk());
        REQUIRE(SodiumInterop::IsInitialized());
    }
    SECTION("Multiple Initialize calls are safe") {
        REQUIRE(SodiumInterop::Initialize().IsOk());
        REQUIRE(SodiumInterop::Initialize().IsOk());
    }
}

TEST_CASE("SodiumInterop - Secure Wipe", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Wipe empty buffer succeeds") {
        std::vector<uint8_t> buffer;
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
    }
    SECTION("Small buffer is zeroed") {
        std::vector<uint8_t> buffer(100, 0xFF);
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
        REQUIRE(std::all_of(buffer.begin(), buffer.end(), [](uint8_t b) { return b == 0; }));
    }
    SECTION("Large buffer is zeroed") {
        std::vector<uint8_t> buffer(10000, 0xFF);
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
        REQUIRE(std::all_of(buffer.begin(), buffer.end(), [](uint8_t b) { return b == 0; }));
    }
}

TEST_CASE("SodiumInterop - Constant Time Comparison", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Equal buffers return true") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4, 5};
        REQUIRE(SodiumInterop::ConstantTimeEquals(a, b).Unwrap());
    }
    SECTION("Different buffers return false") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4, 6};
        REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, b).Unwrap());
    }
    SECTION("Different sizes return false") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4};
        REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, b).Unwrap());
    }
}

TEST_CASE("SodiumInterop - X25519", "[sodium][crypto][keygen]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Generate valid key pair") {
        auto result = SodiumInterop::GenerateX25519KeyPair("test");
        REQUIRE(result.IsOk());
        auto [sk_handle, pk_bytes] = std::move(result).Unwrap();
        REQUIRE(sk_handle.Size() == Constants::X_25519_PRIVATE_KEY_SIZE);
        REQUIRE(pk_bytes.size() == Constants::X_25519_PUBLIC_KEY_SIZE);
    }
    SECTION("Derived public key matches generated public key") {
        auto [sk_handle, pk_bytes] = SodiumInterop::GenerateX25519KeyPair("test").Unwrap();
        auto derived = SodiumInterop::DeriveX25519PublicKey(sk_handle);
        REQUIRE(derived.IsOk());
        REQUIRE(derived.Unwrap() == pk_bytes);
    }
    SECTION("Both sides agree on the shared secret") {
        auto [sk_a, pk_a] = SodiumInterop::GenerateX25519KeyPair("a").Unwrap();
        auto [sk_b, pk_b] = SodiumInterop::GenerateX25519KeyPair("b").Unwrap();
        auto shared_ab = SodiumInterop::ComputeX25519SharedSecret(sk_a, pk_b);
        auto shared_ba = SodiumInterop::ComputeX25519SharedSecret(sk_b, pk_a);
        REQUIRE(shared_ab.IsOk());
        REQUIRE(shared_ba.IsOk());
        REQUIRE(shared_ab.Unwrap() == shared_ba.Unwrap());
        REQUIRE(shared_ab.Unwrap().size() == Constants::X_25519_SHARED_SECRET_SIZE);
    }
    SECTION("Low-order peer point is rejected") {
        auto [sk, pk] = SodiumInterop::GenerateX25519KeyPair("test").Unwrap();
        const std::vector<uint8_t> zero_point(Constants::X_25519_PUBLIC_KEY_SIZE, 0);
        auto shared = SodiumInterop::ComputeX25519SharedSecret(sk, zero_point);
        REQUIRE(shared.IsErr());
        REQUIRE(shared.UnwrapErr().type == ProtocolFailureType::DeriveKey);
    }
    SECTION("Wrong-size peer point is rejected") {
        auto [sk, pk] = SodiumInterop::GenerateX25519KeyPair("test").Unwrap();
        const std::vector<uint8_t> short_point(31, 9);
        auto shared = SodiumInterop::ComputeX25519SharedSecret(sk, short_point);
        REQUIRE(shared.UnwrapErr().type == ProtocolFailureType::InvalidKey);
    }
}

TEST_CASE("SodiumInterop - Ed25519", "[sodium][crypto][keygen]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto [sk, pk] = SodiumInterop::GenerateEd25519KeyPair().Unwrap();
    REQUIRE(sk.Size() == Constants::ED_25519_SECRET_KEY_SIZE);
    REQUIRE(pk.size() == Constants::ED_25519_PUBLIC_KEY_SIZE);
    const std::vector<uint8_t> message = {'s', 'i', 'g', 'n', 'e', 't'};
    SECTION("Signature verifies") {
        auto signature = SodiumInterop::SignDetached(sk, message).Unwrap();
        REQUIRE(signature.size() == Constants::ED_25519_SIGNATURE_SIZE);
        REQUIRE(SodiumInterop::VerifyDetached(pk, message, signature));
    }
    SECTION("Tampered message fails verification") {
        auto signature = SodiumInterop::SignDetached(sk, message).Unwrap();
        auto tampered = message;
        tampered[0] ^= 0x01;
        REQUIRE_FALSE(SodiumInterop::VerifyDetached(pk, tampered, signature));
    }
    SECTION("Malformed signature length fails verification") {
        const std::vector<uint8_t> short_signature(10, 0);
        REQUIRE_FALSE(SodiumInterop::VerifyDetached(pk, message, short_signature));
    }
}

TEST_CASE("SodiumInterop - Random Number Generation", "[sodium][crypto][random]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto bytes1 = SodiumInterop::GetRandomBytes(32);
    auto bytes2 = SodiumInterop::GetRandomBytes(32);
    REQUIRE(bytes1.size() == 32);
    REQUIRE(bytes1 != bytes2);
}
