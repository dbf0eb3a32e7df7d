#include <catch2/catch_test_macros.hpp>
#include "signet/handles/library.hpp"
#include "signet/handles/identity_key_pair.hpp"
#include "signet/handles/private_key.hpp"
#include "signet/handles/public_key.hpp"
#include "signet/handles/signed_pre_key_record.hpp"
#include "signet/core/timestamp.hpp"
#include "signet/c_api/signet_api.h"
#include <chrono>
#include <map>
#include <memory>
#include <vector>

using namespace signet::protocol;
using namespace signet::protocol::handles;
using namespace std::chrono_literals;

struct PublishedBundle {
    std::vector<uint8_t> identity_public_key;
    uint32_t signed_pre_key_id = 0;
    std::vector<uint8_t> signed_pre_key_record;
};

struct PreKeyOwner {
    std::unique_ptr<IdentityKeyPair> identity;
    std::map<uint32_t, SignedPreKeyRecord> records;

    [[nodiscard]] static Result<PreKeyOwner, HandleFailure> Create() {
        PreKeyOwner owner;
        auto identity_result = IdentityKeyPair::Generate();
        if (identity_result.IsErr()) {
            return Result<PreKeyOwner, HandleFailure>::Err(std::move(identity_result).UnwrapErr());
        }
        owner.identity = std::make_unique<IdentityKeyPair>(std::move(identity_result).Unwrap());
        return Result<PreKeyOwner, HandleFailure>::Ok(std::move(owner));
    }

    Result<uint32_t, HandleFailure> Rotate(const uint32_t id, const Timestamp timestamp) {
        auto record_result = SignedPreKeyRecord::Generate(id, timestamp, *identity);
        if (record_result.IsErr()) {
            return Result<uint32_t, HandleFailure>::Err(std::move(record_result).UnwrapErr());
        }
        records.insert_or_assign(id, std::move(record_result).Unwrap());
        return Result<uint32_t, HandleFailure>::Ok(id);
    }

    [[nodiscard]] Result<PublishedBundle, HandleFailure> Publish(const uint32_t id) const {
        PublishedBundle bundle;
        auto identity_public = identity->GetPublicKey();
        if (identity_public.IsErr()) {
            return Result<PublishedBundle, HandleFailure>::Err(std::move(identity_public).UnwrapErr());
        }
        auto serialized = records.at(id).Serialize();
        if (serialized.IsErr()) {
            return Result<PublishedBundle, HandleFailure>::Err(std::move(serialized).UnwrapErr());
        }
        bundle.identity_public_key = std::move(identity_public).Unwrap();
        bundle.signed_pre_key_id = id;
        bundle.signed_pre_key_record = std::move(serialized).Unwrap();
        return Result<PublishedBundle, HandleFailure>::Ok(std::move(bundle));
    }
};

TEST_CASE("End-to-end - Published pre-key establishes a shared secret", "[integration][record]") {
    REQUIRE(Library::Initialize().IsOk());
    const auto records_before = Library::LiveObjectCount(SIGNET_OBJECT_SIGNED_PRE_KEY_RECORD);
    const auto private_before = Library::LiveObjectCount(SIGNET_OBJECT_PRIVATE_KEY);
    const auto public_before = Library::LiveObjectCount(SIGNET_OBJECT_PUBLIC_KEY);

    {
        auto bob = PreKeyOwner::Create().Unwrap();
        REQUIRE(bob.Rotate(1, Timestamp{1672531200500ms}).IsOk());
        auto bundle = bob.Publish(1).Unwrap();

        auto received = SignedPreKeyRecord::Deserialize(bundle.signed_pre_key_record).Unwrap();
        REQUIRE(received.GetId().Unwrap() == bundle.signed_pre_key_id);
        REQUIRE(received.VerifySignature(bundle.identity_public_key).Unwrap());

        auto alice_ephemeral = PrivateKey::Generate().Unwrap();
        auto bob_pre_key_public = received.GetPublicKey().Unwrap();
        auto alice_secret = alice_ephemeral.Agree(bob_pre_key_public).Unwrap();

        auto bob_pre_key_private = bob.records.at(1).GetPrivateKey().Unwrap();
        auto bob_secret = bob_pre_key_private.Agree(alice_ephemeral.GetPublicKey().Unwrap()).Unwrap();

        REQUIRE(alice_secret == bob_secret);
    }

    REQUIRE(Library::LiveObjectCount(SIGNET_OBJECT_SIGNED_PRE_KEY_RECORD) == records_before);
    REQUIRE(Library::LiveObjectCount(SIGNET_OBJECT_PRIVATE_KEY) == private_before);
    REQUIRE(Library::LiveObjectCount(SIGNET_OBJECT_PUBLIC_KEY) == public_before);
}

TEST_CASE("End-to-end - Rotation replaces and retires records", "[integration][record]") {
    REQUIRE(Library::Initialize().IsOk());
    const auto records_before = Library::LiveObjectCount(SIGNET_OBJECT_SIGNED_PRE_KEY_RECORD);

    {
        auto bob = PreKeyOwner::Create().Unwrap();
        for (uint32_t id = 1; id <= 5; ++id) {
            REQUIRE(bob.Rotate(id, Timestamp{1672531200000ms + std::chrono::hours(24 * id)}).IsOk());
        }
        REQUIRE(Library::LiveObjectCount(SIGNET_OBJECT_SIGNED_PRE_KEY_RECORD) == records_before + 5);

        REQUIRE(bob.records.at(3).Destroy().IsOk());
        bob.records.erase(3);
        REQUIRE(Library::LiveObjectCount(SIGNET_OBJECT_SIGNED_PRE_KEY_RECORD) == records_before + 4);

        REQUIRE(bob.Rotate(5, Timestamp{1672531200000ms}).IsOk());
        REQUIRE(Library::LiveObjectCount(SIGNET_OBJECT_SIGNED_PRE_KEY_RECORD) == records_before + 4);
        REQUIRE(FormatTimestamp(bob.records.at(5).GetTimestamp().Unwrap()) == "2023-01-01T00:00:00.000Z");

        for (const auto& [id, record] : bob.records) {
            auto bundle = bob.Publish(id).Unwrap();
            auto received = SignedPreKeyRecord::Deserialize(bundle.signed_pre_key_record).Unwrap();
            REQUIRE(received.GetId().Unwrap() == id);
            REQUIRE(received.GetTimestamp().Unwrap() == record.GetTimestamp().Unwrap());
        }
    }

    REQUIRE(Library::LiveObjectCount(SIGNET_OBJECT_SIGNED_PRE_KEY_RECORD) == records_before);
}

TEST_CASE("End-to-end - Tampered bundle is detected", "[integration][record][security]") {
    REQUIRE(Library::Initialize().IsOk());
    auto bob = PreKeyOwner::Create().Unwrap();
    auto mallory = PreKeyOwner::Create().Unwrap();
    REQUIRE(bob.Rotate(1, Timestamp{1672531200500ms}).IsOk());
    REQUIRE(mallory.Rotate(1, Timestamp{1672531200500ms}).IsOk());

    auto bundle = bob.Publish(1).Unwrap();
    bundle.signed_pre_key_record = mallory.Publish(1).Unwrap().signed_pre_key_record;

    auto received = SignedPreKeyRecord::Deserialize(bundle.signed_pre_key_record).Unwrap();
    REQUIRE_FALSE(received.VerifySignature(bundle.identity_public_key).Unwrap());

    auto truncated = bundle.signed_pre_key_record;
    truncated.resize(truncated.size() / 2);
    auto result = SignedPreKeyRecord::Deserialize(truncated);
    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().IsDeserialization());
}
