#include <catch2/catch_test_macros.hpp>
#include "signet/configuration/record_config.hpp"
using namespace signet::protocol;
using namespace signet::protocol::configuration;
TEST_CASE("RecordConfig - Factories", "[config]") {
    SECTION("Default verifies key pairs") {
        constexpr auto config = RecordConfig::Default();
        STATIC_REQUIRE(config.VerifiesKeyPair());
        REQUIRE(config.GetMaxSignatureLength() == RecordConstants::DEFAULT_MAX_SIGNATURE_LENGTH);
        REQUIRE(config.GetMaxSerializedLength() == RecordConstants::DEFAULT_MAX_SERIALIZED_LENGTH);
        REQUIRE(config.IsValid());
    }
    SECTION("Permissive skips key pair verification") {
        constexpr auto config = RecordConfig::Permissive();
        STATIC_REQUIRE_FALSE(config.VerifiesKeyPair());
        REQUIRE(config.IsValid());
        REQUIRE(config != RecordConfig::Default());
    }
}
TEST_CASE("RecordConfig - Builders", "[config]") {
    SECTION("WithMaxSignatureLength keeps other fields") {
        const auto config = RecordConfig::Permissive().WithMaxSignatureLength(64);
        REQUIRE(config.GetMaxSignatureLength() == 64);
        REQUIRE(config.GetMaxSerializedLength() == RecordConstants::DEFAULT_MAX_SERIALIZED_LENGTH);
        REQUIRE_FALSE(config.VerifiesKeyPair());
    }
    SECTION("Zero limits are invalid") {
        REQUIRE_FALSE(RecordConfig::Default().WithMaxSignatureLength(0).IsValid());
        REQUIRE_FALSE(RecordConfig::Default().WithMaxSerializedLength(0).IsValid());
    }
    SECTION("Equality compares every field") {
        REQUIRE(RecordConfig::Default().WithMaxSerializedLength(100) ==
                RecordConfig::Default().WithMaxSerializedLength(100));
        REQUIRE(RecordConfig::Default().WithMaxSerializedLength(100) !=
                RecordConfig::Default().WithMaxSerializedLength(101));
    }
}
