#pragma once

#include "signet/handles/native_handle.hpp"
#include "signet/handles/native_traits.hpp"
#include "signet/handles/public_key.hpp"
#include "signet/handles/private_key.hpp"
#include "signet/handles/identity_key_pair.hpp"
#include "signet/core/timestamp.hpp"
#include "signet/core/result.hpp"
#include "signet/core/failures.hpp"

#include <chrono>
#include <cstdint>
#include <span>
#include <vector>

namespace signet::protocol::handles {

/**
 * @brief Owning handle to a native signed pre-key record
 *
 * Fields are read through the native library on every access; nothing is
 * cached on this side. Every operation on a destroyed (or released, or
 * moved-from) handle fails with InvalidState.
 *
 * @example
 * ```cpp
 * auto record = SignedPreKeyRecord::Create(
 *     42, timestamp, public_key, private_key, signature);
 * auto bytes = record.Unwrap().Serialize();
 * ```
 */
class SignedPreKeyRecord {
public:
    // =========================================================================
    // Lifecycle
    // =========================================================================

    /**
     * @brief Build a record from existing key material
     *
     * The timestamp is floored to whole milliseconds. Pre-epoch instants fail
     * with InvalidArgument; a destroyed key handle fails with InvalidState;
     * key material the native library rejects fails with NativeOperation.
     */
    template<typename Duration>
    static Result<SignedPreKeyRecord, HandleFailure> Create(
        const uint32_t id,
        const std::chrono::sys_time<Duration> timestamp,
        const PublicKey& public_key,
        const PrivateKey& private_key,
        const std::span<const uint8_t> signature) {
        auto millis = ToEpochMillis(timestamp);
        if (millis.IsErr()) {
            return std::move(millis).template PropagateErr<SignedPreKeyRecord>();
        }
        return CreateAtMillis(id, millis.Unwrap(), public_key, private_key, signature);
    }

    /**
     * @brief Build a record deriving the public key from the private key
     *
     * A failure to derive the public key is returned unchanged.
     */
    template<typename Duration>
    static Result<SignedPreKeyRecord, HandleFailure> CreateFromPrivateKey(
        const uint32_t id,
        const std::chrono::sys_time<Duration> timestamp,
        const PrivateKey& private_key,
        const std::span<const uint8_t> signature) {
        auto public_key = private_key.GetPublicKey();
        if (public_key.IsErr()) {
            return std::move(public_key).template PropagateErr<SignedPreKeyRecord>();
        }
        return Create(id, timestamp, public_key.Unwrap(), private_key, signature);
    }

    /**
     * @brief Fresh private key, signed by the identity over its serialized public key
     */
    static Result<SignedPreKeyRecord, HandleFailure> Generate(
        uint32_t id,
        Timestamp timestamp,
        const IdentityKeyPair& identity);

    static Result<SignedPreKeyRecord, HandleFailure> Deserialize(std::span<const uint8_t> serialized);

    [[nodiscard]] static SignedPreKeyRecord Adopt(SignetSignedPreKeyRecord* raw) noexcept;

    SignedPreKeyRecord() noexcept = default;
    SignedPreKeyRecord(SignedPreKeyRecord&&) noexcept = default;
    SignedPreKeyRecord& operator=(SignedPreKeyRecord&&) noexcept = default;
    SignedPreKeyRecord(const SignedPreKeyRecord&) = delete;
    SignedPreKeyRecord& operator=(const SignedPreKeyRecord&) = delete;

    [[nodiscard]] bool IsLive() const noexcept {
        return handle_.IsLive();
    }

    [[nodiscard]] Result<SignedPreKeyRecord, HandleFailure> Clone() const;

    /**
     * @brief Destroy the native record now
     *
     * A second call fails with InvalidState.
     */
    Result<Unit, HandleFailure> Destroy();

    /**
     * @brief Hand the native record to the caller without destroying it
     *
     * The destructor will no longer destroy it; the caller must, either by
     * Adopt into another handle or by signet_signed_pre_key_record_destroy.
     */
    [[nodiscard]] SignetSignedPreKeyRecord* Release() noexcept;

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] Result<std::vector<uint8_t>, HandleFailure> Serialize() const;
    [[nodiscard]] Result<std::vector<uint8_t>, HandleFailure> GetSignature() const;
    [[nodiscard]] Result<uint32_t, HandleFailure> GetId() const;
    [[nodiscard]] Result<Timestamp, HandleFailure> GetTimestamp() const;
    [[nodiscard]] Result<PublicKey, HandleFailure> GetPublicKey() const;
    [[nodiscard]] Result<PrivateKey, HandleFailure> GetPrivateKey() const;

    /**
     * @brief Check the stored signature against an identity public key
     *
     * The signed message is the serialized record public key.
     */
    [[nodiscard]] Result<bool, HandleFailure> VerifySignature(
        std::span<const uint8_t> identity_public_key) const;

private:
    explicit SignedPreKeyRecord(NativeHandle<SignedPreKeyRecordTraits> handle) noexcept
        : handle_(std::move(handle)) {}

    static Result<SignedPreKeyRecord, HandleFailure> CreateAtMillis(
        uint32_t id,
        uint64_t timestamp_ms,
        const PublicKey& public_key,
        const PrivateKey& private_key,
        std::span<const uint8_t> signature);

    NativeHandle<SignedPreKeyRecordTraits> handle_;
};

} // namespace signet::protocol::handles
