#include <catch2/catch_test_macros.hpp>
#include "signet/handles/library.hpp"
#include "signet/handles/public_key.hpp"
#include "signet/handles/private_key.hpp"
#include "signet/handles/identity_key_pair.hpp"
#include "signet/c_api/signet_api.h"
#include <vector>
using namespace signet::protocol;
using namespace signet::protocol::handles;

TEST_CASE("PublicKey - Handle operations", "[handles][keys]") {
    REQUIRE(Library::Initialize().IsOk());
    auto private_key = PrivateKey::Generate().Unwrap();
    auto public_key = private_key.GetPublicKey().Unwrap();

    SECTION("Serialized form is type-prefixed") {
        auto serialized = public_key.Serialize().Unwrap();
        auto raw = public_key.GetPublicKeyBytes().Unwrap();
        REQUIRE(serialized.size() == 33);
        REQUIRE(serialized[0] == 0x05);
        REQUIRE(std::vector<uint8_t>(serialized.begin() + 1, serialized.end()) == raw);
    }
    SECTION("Deserialized key equals the original") {
        auto restored = PublicKey::Deserialize(public_key.Serialize().Unwrap());
        REQUIRE(restored.IsOk());
        REQUIRE(restored.Unwrap().Equals(public_key).Unwrap());
        REQUIRE(restored.Unwrap().Compare(public_key).Unwrap() == 0);
    }
    SECTION("Distinct keys compare unequal in both directions") {
        auto other = PrivateKey::Generate().Unwrap().GetPublicKey().Unwrap();
        const auto forward = public_key.Compare(other).Unwrap();
        const auto backward = other.Compare(public_key).Unwrap();
        REQUIRE(forward != 0);
        REQUIRE(forward == -backward);
    }
    SECTION("Malformed bytes fail with a deserialization error") {
        const std::vector<uint8_t> garbage = {0x07, 0x01};
        auto result = PublicKey::Deserialize(garbage);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().IsDeserialization());
        REQUIRE(result.UnwrapErr().native_code == SIGNET_ERROR_DECODE);
    }
    SECTION("Comparing against a destroyed key fails with InvalidState") {
        auto other = public_key.Clone().Unwrap();
        REQUIRE(other.Destroy().IsOk());
        REQUIRE(public_key.Equals(other).UnwrapErr().IsInvalidState());
        REQUIRE(other.Serialize().UnwrapErr().IsInvalidState());
    }
}

TEST_CASE("PrivateKey - Handle operations", "[handles][keys]") {
    REQUIRE(Library::Initialize().IsOk());
    auto alice = PrivateKey::Generate().Unwrap();
    auto bob = PrivateKey::Generate().Unwrap();

    SECTION("Two parties agree on the same secret") {
        auto alice_shared = alice.Agree(bob.GetPublicKey().Unwrap());
        auto bob_shared = bob.Agree(alice.GetPublicKey().Unwrap());
        REQUIRE(alice_shared.IsOk());
        REQUIRE(bob_shared.IsOk());
        REQUIRE(alice_shared.Unwrap() == bob_shared.Unwrap());
        REQUIRE(alice_shared.Unwrap().size() == 32);
    }
    SECTION("Serialized private key restores the same public key") {
        auto restored = PrivateKey::Deserialize(alice.Serialize().Unwrap()).Unwrap();
        REQUIRE(restored.GetPublicKey().Unwrap().Equals(alice.GetPublicKey().Unwrap()).Unwrap());
    }
    SECTION("Wrong-length private key fails with a deserialization error") {
        const std::vector<uint8_t> short_key(16, 0x01);
        auto result = PrivateKey::Deserialize(short_key);
        REQUIRE(result.UnwrapErr().IsDeserialization());
    }
    SECTION("Release then Adopt keeps one live object") {
        const auto before = Library::LiveObjectCount(SIGNET_OBJECT_PRIVATE_KEY);
        {
            auto key = PrivateKey::Generate().Unwrap();
            auto* raw = key.Release();
            REQUIRE(raw != nullptr);
            REQUIRE(key.Serialize().UnwrapErr().IsInvalidState());
            auto adopted = PrivateKey::Adopt(raw);
            REQUIRE(adopted.Serialize().IsOk());
            REQUIRE(Library::LiveObjectCount(SIGNET_OBJECT_PRIVATE_KEY) == before + 1);
        }
        REQUIRE(Library::LiveObjectCount(SIGNET_OBJECT_PRIVATE_KEY) == before);
    }
}

TEST_CASE("IdentityKeyPair - Signing", "[handles][keys][signature]") {
    REQUIRE(Library::Initialize().IsOk());
    auto identity = IdentityKeyPair::Generate().Unwrap();
    const auto identity_public = identity.GetPublicKey().Unwrap();
    const std::vector<uint8_t> message = {0xDE, 0xAD, 0xBE, 0xEF};

    SECTION("Signature verifies under the identity key") {
        auto signature = identity.Sign(message).Unwrap();
        REQUIRE(signature.size() == 64);
        REQUIRE(IdentityKeyPair::Verify(identity_public, message, signature).Unwrap());
    }
    SECTION("Signature does not verify under another identity") {
        auto signature = identity.Sign(message).Unwrap();
        auto other = IdentityKeyPair::Generate().Unwrap();
        REQUIRE_FALSE(IdentityKeyPair::Verify(other.GetPublicKey().Unwrap(), message, signature).Unwrap());
    }
    SECTION("Clone signs verifiably after the original is destroyed") {
        auto clone = identity.Clone().Unwrap();
        REQUIRE(identity.Destroy().IsOk());
        REQUIRE(identity.Sign(message).UnwrapErr().IsInvalidState());
        auto signature = clone.Sign(message).Unwrap();
        REQUIRE(IdentityKeyPair::Verify(identity_public, message, signature).Unwrap());
    }
    SECTION("Malformed identity public key is a native failure") {
        const std::vector<uint8_t> short_key(5, 0x01);
        const std::vector<uint8_t> signature(64, 0x00);
        auto result = IdentityKeyPair::Verify(short_key, message, signature);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().native_code == SIGNET_ERROR_INVALID_KEY);
    }
}
