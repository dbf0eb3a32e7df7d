/**
 * @file signed_pre_key_example.cpp
 * @brief Generate, publish and verify a signed pre-key record
 */

#include "signet/handles/library.hpp"
#include "signet/handles/identity_key_pair.hpp"
#include "signet/handles/signed_pre_key_record.hpp"
#include "signet/core/timestamp.hpp"

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <chrono>
#include <string_view>
#include <vector>

using namespace signet::protocol;
using namespace signet::protocol::handles;

void print_hex(const std::string_view label, const std::vector<uint8_t>& data) {
    fmt::print("   {}: {:02x}\n", label, fmt::join(data, ""));
}

int fail(const std::string_view step, const HandleFailure& failure) {
    fmt::print(stderr, "{} failed: {} (native code {})\n", step, failure.message, failure.native_code);
    return 1;
}

int main() {
    fmt::print("=== Signet - Signed Pre-Key Example (v{}) ===\n\n", Library::Version());

    fmt::print("1. Initializing native library...\n");
    if (auto init = Library::Initialize(); init.IsErr()) {
        return fail("Initialize", init.UnwrapErr());
    }
    fmt::print("   ✓ Initialized successfully\n\n");

    fmt::print("2. Generating identity key pair...\n");
    auto identity_result = IdentityKeyPair::Generate();
    if (identity_result.IsErr()) {
        return fail("IdentityKeyPair::Generate", identity_result.UnwrapErr());
    }
    auto identity = std::move(identity_result).Unwrap();
    auto identity_public = identity.GetPublicKey();
    if (identity_public.IsErr()) {
        return fail("IdentityKeyPair::GetPublicKey", identity_public.UnwrapErr());
    }
    print_hex("Identity public key", identity_public.Unwrap());
    fmt::print("\n");

    fmt::print("3. Generating signed pre-key record...\n");
    const auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    auto record_result = SignedPreKeyRecord::Generate(1, now, identity);
    if (record_result.IsErr()) {
        return fail("SignedPreKeyRecord::Generate", record_result.UnwrapErr());
    }
    auto record = std::move(record_result).Unwrap();
    fmt::print("   Id:        {}\n", record.GetId().Unwrap());
    fmt::print("   Timestamp: {}\n", FormatTimestamp(record.GetTimestamp().Unwrap()));
    print_hex("Public key", record.GetPublicKey().Unwrap().Serialize().Unwrap());
    print_hex("Signature", record.GetSignature().Unwrap());
    fmt::print("   Private key: [kept in native secure memory]\n\n");

    fmt::print("4. Serializing and restoring...\n");
    auto serialized = record.Serialize();
    if (serialized.IsErr()) {
        return fail("SignedPreKeyRecord::Serialize", serialized.UnwrapErr());
    }
    fmt::print("   ✓ Serialized to {} bytes\n", serialized.Unwrap().size());
    auto restored_result = SignedPreKeyRecord::Deserialize(serialized.Unwrap());
    if (restored_result.IsErr()) {
        return fail("SignedPreKeyRecord::Deserialize", restored_result.UnwrapErr());
    }
    auto restored = std::move(restored_result).Unwrap();
    fmt::print("   ✓ Restored record {}\n\n", restored.GetId().Unwrap());

    fmt::print("5. Verifying signature against the identity key...\n");
    auto verified = restored.VerifySignature(identity_public.Unwrap());
    if (verified.IsErr()) {
        return fail("SignedPreKeyRecord::VerifySignature", verified.UnwrapErr());
    }
    fmt::print("   {} Signature {}\n\n", verified.Unwrap() ? "✓" : "✗",
               verified.Unwrap() ? "valid" : "INVALID");

    fmt::print("6. Destroying handles...\n");
    if (auto destroyed = record.Destroy(); destroyed.IsErr()) {
        return fail("SignedPreKeyRecord::Destroy", destroyed.UnwrapErr());
    }
    fmt::print("   ✓ Record destroyed; restored copy is reclaimed on scope exit\n\n");

    fmt::print("=== Example completed ===\n");
    return verified.Unwrap() ? 0 : 1;
}
