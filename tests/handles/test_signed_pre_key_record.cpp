#include <catch2/catch_test_macros.hpp>
#include "signet/handles/library.hpp"
#include "signet/handles/signed_pre_key_record.hpp"
#include "signet/core/timestamp.hpp"
#include "signet/c_api/signet_api.h"
#include <algorithm>
#include <chrono>
#include <string>
#include <vector>
using namespace signet::protocol;
using namespace signet::protocol::handles;
using namespace std::chrono_literals;

namespace {

const std::vector<uint8_t> kSignature = {0x01, 0x02, 0x03};

SignedPreKeyRecord MakeRecord(const PrivateKey& private_key, const uint32_t id = 42) {
    const auto timestamp = ParseTimestamp("2023-01-01T00:00:00.500Z").Unwrap();
    return SignedPreKeyRecord::CreateFromPrivateKey(id, timestamp, private_key, kSignature).Unwrap();
}

uint64_t LiveRecords() {
    return Library::LiveObjectCount(SIGNET_OBJECT_SIGNED_PRE_KEY_RECORD);
}

struct ScopedRecordConfig {
    explicit ScopedRecordConfig(const configuration::RecordConfig& config) {
        REQUIRE(Library::Initialize(config).IsOk());
    }

    ~ScopedRecordConfig() {
        (void) Library::Initialize();
    }
};

} // namespace

TEST_CASE("SignedPreKeyRecord - End to end", "[handles][record]") {
    REQUIRE(Library::Initialize().IsOk());
    auto private_key = PrivateKey::Generate().Unwrap();
    auto public_key = private_key.GetPublicKey().Unwrap();
    const auto timestamp = ParseTimestamp("2023-01-01T00:00:00.500Z").Unwrap();

    auto record = SignedPreKeyRecord::Create(42, timestamp, public_key, private_key, kSignature).Unwrap();
    REQUIRE(record.GetId().Unwrap() == 42);
    REQUIRE(FormatTimestamp(record.GetTimestamp().Unwrap()) == "2023-01-01T00:00:00.500Z");
    REQUIRE(record.GetSignature().Unwrap() == kSignature);

    auto restored = SignedPreKeyRecord::Deserialize(record.Serialize().Unwrap()).Unwrap();
    REQUIRE(restored.GetId().Unwrap() == 42);
    REQUIRE(restored.GetTimestamp().Unwrap() == record.GetTimestamp().Unwrap());
    REQUIRE(restored.GetSignature().Unwrap() == kSignature);
    REQUIRE(restored.GetPublicKey().Unwrap().Equals(public_key).Unwrap());
    REQUIRE(restored.GetPrivateKey().Unwrap().Serialize().Unwrap() == private_key.Serialize().Unwrap());
}

TEST_CASE("SignedPreKeyRecord - Timestamp truncation", "[handles][record][timestamp]") {
    REQUIRE(Library::Initialize().IsOk());
    auto private_key = PrivateKey::Generate().Unwrap();

    SECTION("Sub-millisecond precision truncates down") {
        const std::chrono::sys_time<std::chrono::microseconds> instant{1672531200999999us};
        auto record = SignedPreKeyRecord::CreateFromPrivateKey(1, instant, private_key, kSignature).Unwrap();
        REQUIRE(record.GetTimestamp().Unwrap() == Timestamp{1672531200999ms});
    }
    SECTION("Nanosecond input from RFC 3339") {
        const auto instant = ParseTimestamp("2023-01-01T00:00:00.999999999Z").Unwrap();
        auto record = SignedPreKeyRecord::CreateFromPrivateKey(1, instant, private_key, kSignature).Unwrap();
        REQUIRE(FormatTimestamp(record.GetTimestamp().Unwrap()) == "2023-01-01T00:00:00.999Z");
    }
    SECTION("Pre-epoch instants are rejected before any native call") {
        const auto before = LiveRecords();
        const std::chrono::sys_time<std::chrono::milliseconds> instant{-1ms};
        auto result = SignedPreKeyRecord::CreateFromPrivateKey(1, instant, private_key, kSignature);
        REQUIRE(result.UnwrapErr().type == HandleFailureType::InvalidArgument);
        REQUIRE(LiveRecords() == before);
    }
}

TEST_CASE("SignedPreKeyRecord - Derivation consistency", "[handles][record]") {
    REQUIRE(Library::Initialize().IsOk());
    auto private_key = PrivateKey::Generate().Unwrap();
    auto derived = MakeRecord(private_key);
    auto explicit_record = SignedPreKeyRecord::Create(
        42,
        ParseTimestamp("2023-01-01T00:00:00.500Z").Unwrap(),
        private_key.GetPublicKey().Unwrap(),
        private_key,
        kSignature).Unwrap();

    REQUIRE(derived.GetPublicKey().Unwrap().Equals(private_key.GetPublicKey().Unwrap()).Unwrap());
    REQUIRE(derived.Serialize().Unwrap() == explicit_record.Serialize().Unwrap());
}

TEST_CASE("SignedPreKeyRecord - Clone independence", "[handles][record]") {
    REQUIRE(Library::Initialize().IsOk());
    auto private_key = PrivateKey::Generate().Unwrap();
    auto record = MakeRecord(private_key);
    auto clone = record.Clone().Unwrap();

    REQUIRE(clone.Serialize().Unwrap() == record.Serialize().Unwrap());
    REQUIRE(clone.Destroy().IsOk());
    REQUIRE(record.GetId().Unwrap() == 42);
    REQUIRE(record.GetSignature().Unwrap() == kSignature);
}

TEST_CASE("SignedPreKeyRecord - Destroyed handle safety", "[handles][record][lifecycle]") {
    REQUIRE(Library::Initialize().IsOk());
    auto private_key = PrivateKey::Generate().Unwrap();

    SECTION("Every operation fails with InvalidState after Destroy") {
        auto record = MakeRecord(private_key);
        REQUIRE(record.Destroy().IsOk());
        REQUIRE_FALSE(record.IsLive());
        REQUIRE(record.Serialize().UnwrapErr().IsInvalidState());
        REQUIRE(record.GetSignature().UnwrapErr().IsInvalidState());
        REQUIRE(record.GetId().UnwrapErr().IsInvalidState());
        REQUIRE(record.GetTimestamp().UnwrapErr().IsInvalidState());
        REQUIRE(record.GetPublicKey().UnwrapErr().IsInvalidState());
        REQUIRE(record.GetPrivateKey().UnwrapErr().IsInvalidState());
        REQUIRE(record.Clone().UnwrapErr().IsInvalidState());
        REQUIRE(record.GetId().UnwrapErr().message ==
                "SignedPreKeyRecord: Native object has been destroyed");
    }
    SECTION("Second Destroy fails with InvalidState") {
        auto record = MakeRecord(private_key);
        REQUIRE(record.Destroy().IsOk());
        REQUIRE(record.Destroy().UnwrapErr().IsInvalidState());
    }
    SECTION("Moved-from handle is Destroyed") {
        auto record = MakeRecord(private_key);
        auto target = std::move(record);
        REQUIRE(record.GetId().UnwrapErr().IsInvalidState());
        REQUIRE(target.GetId().Unwrap() == 42);
    }
    SECTION("Destroyed key handles are rejected at construction") {
        auto dead_key = private_key.Clone().Unwrap();
        REQUIRE(dead_key.Destroy().IsOk());
        const auto timestamp = ParseTimestamp("2023-01-01T00:00:00Z").Unwrap();
        auto result = SignedPreKeyRecord::CreateFromPrivateKey(1, timestamp, dead_key, kSignature);
        REQUIRE(result.UnwrapErr().IsInvalidState());
    }
}

TEST_CASE("SignedPreKeyRecord - Native failures", "[handles][record][errors]") {
    REQUIRE(Library::Initialize().IsOk());
    auto private_key = PrivateKey::Generate().Unwrap();
    const auto before = LiveRecords();

    SECTION("Garbage fails with a deserialization error and allocates nothing") {
        const std::vector<uint8_t> garbage = {0xFF, 0xFF, 0xFF, 0xFF};
        auto result = SignedPreKeyRecord::Deserialize(garbage);
        REQUIRE(result.IsErr());
        const auto& failure = result.UnwrapErr();
        REQUIRE(failure.IsDeserialization());
        REQUIRE(failure.IsNativeOperation());
        REQUIRE(failure.native_code == SIGNET_ERROR_DECODE);
        REQUIRE(failure.message.rfind("SignedPreKeyRecord::Deserialize: ", 0) == 0);
        REQUIRE(LiveRecords() == before);
    }
    SECTION("Mismatched key material fails with a native operation error") {
        auto stranger = PrivateKey::Generate().Unwrap().GetPublicKey().Unwrap();
        const auto timestamp = ParseTimestamp("2023-01-01T00:00:00Z").Unwrap();
        auto result = SignedPreKeyRecord::Create(1, timestamp, stranger, private_key, kSignature);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().IsNativeOperation());
        REQUIRE_FALSE(result.UnwrapErr().IsDeserialization());
        REQUIRE(result.UnwrapErr().native_code == SIGNET_ERROR_INVALID_KEY);
        REQUIRE(LiveRecords() == before);
    }
    SECTION("Oversized signature is rejected under a tight config") {
        const ScopedRecordConfig scoped(configuration::RecordConfig::Default().WithMaxSignatureLength(2));
        const auto timestamp = ParseTimestamp("2023-01-01T00:00:00Z").Unwrap();
        auto result = SignedPreKeyRecord::CreateFromPrivateKey(1, timestamp, private_key, kSignature);
        REQUIRE(result.UnwrapErr().native_code == SIGNET_ERROR_INVALID_INPUT);
    }
    SECTION("Timestamp beyond the signed range fails at decode") {
        auto bytes = MakeRecord(private_key).Serialize().Unwrap();
        REQUIRE(bytes.size() > 9);
        REQUIRE(bytes[bytes.size() - 9] == 0x29);
        std::fill(bytes.end() - 8, bytes.end(), uint8_t{0xFF});
        auto result = SignedPreKeyRecord::Deserialize(bytes);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().IsDeserialization());
        REQUIRE(result.UnwrapErr().native_code == SIGNET_ERROR_DECODE);
        REQUIRE(LiveRecords() == before);
    }
}

TEST_CASE("SignedPreKeyRecord - Decode ignores the installed config", "[handles][record][serialization]") {
    REQUIRE(Library::Initialize().IsOk());
    auto private_key = PrivateKey::Generate().Unwrap();
    auto stranger = PrivateKey::Generate().Unwrap().GetPublicKey().Unwrap();
    const auto timestamp = ParseTimestamp("2023-01-01T00:00:00Z").Unwrap();

    SECTION("Record built without key-pair verification decodes under the default config") {
        std::vector<uint8_t> bytes;
        {
            const ScopedRecordConfig scoped(configuration::RecordConfig::Permissive());
            auto record = SignedPreKeyRecord::Create(5, timestamp, stranger, private_key, kSignature).Unwrap();
            bytes = record.Serialize().Unwrap();
        }
        auto restored = SignedPreKeyRecord::Deserialize(bytes);
        REQUIRE(restored.IsOk());
        REQUIRE(restored.Unwrap().GetId().Unwrap() == 5);
        REQUIRE(restored.Unwrap().GetPublicKey().Unwrap().Equals(stranger).Unwrap());
        REQUIRE(restored.Unwrap().Serialize().Unwrap() == bytes);
    }
    SECTION("Signature longer than the current limit still decodes") {
        auto bytes = MakeRecord(private_key).Serialize().Unwrap();
        const ScopedRecordConfig scoped(configuration::RecordConfig::Default().WithMaxSignatureLength(2));
        auto restored = SignedPreKeyRecord::Deserialize(bytes);
        REQUIRE(restored.IsOk());
        REQUIRE(restored.Unwrap().GetSignature().Unwrap() == kSignature);
    }
}

TEST_CASE("SignedPreKeyRecord - Ownership", "[handles][record][lifecycle]") {
    REQUIRE(Library::Initialize().IsOk());
    auto private_key = PrivateKey::Generate().Unwrap();
    const auto before = LiveRecords();

    SECTION("Destructor reclaims a record never destroyed") {
        {
            auto record = MakeRecord(private_key);
            REQUIRE(LiveRecords() == before + 1);
        }
        REQUIRE(LiveRecords() == before);
    }
    SECTION("Release then Adopt destroys exactly once") {
        {
            auto record = MakeRecord(private_key);
            auto* raw = record.Release();
            REQUIRE(raw != nullptr);
            REQUIRE(record.GetId().UnwrapErr().IsInvalidState());
            auto adopted = SignedPreKeyRecord::Adopt(raw);
            REQUIRE(adopted.GetId().Unwrap() == 42);
        }
        REQUIRE(LiveRecords() == before);
    }
    SECTION("Released record can be destroyed through the C API") {
        auto record = MakeRecord(private_key);
        auto* raw = record.Release();
        REQUIRE(LiveRecords() == before + 1);
        REQUIRE(signet_signed_pre_key_record_destroy(raw) == SIGNET_SUCCESS);
        REQUIRE(LiveRecords() == before);
    }
}

TEST_CASE("SignedPreKeyRecord - Generate and verify", "[handles][record][signature]") {
    REQUIRE(Library::Initialize().IsOk());
    auto identity = IdentityKeyPair::Generate().Unwrap();
    auto record = SignedPreKeyRecord::Generate(7, Timestamp{1672531200500ms}, identity).Unwrap();

    REQUIRE(record.GetId().Unwrap() == 7);
    REQUIRE(record.GetSignature().Unwrap().size() == 64);
    REQUIRE(record.VerifySignature(identity.GetPublicKey().Unwrap()).Unwrap());

    auto other = IdentityKeyPair::Generate().Unwrap();
    REQUIRE_FALSE(record.VerifySignature(other.GetPublicKey().Unwrap()).Unwrap());
}
