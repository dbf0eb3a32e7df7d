#include "signet/handles/signed_pre_key_record.hpp"
#include "signet/handles/call_adapter.hpp"

namespace signet::protocol::handles {

Result<SignedPreKeyRecord, HandleFailure> SignedPreKeyRecord::CreateAtMillis(
    const uint32_t id,
    const uint64_t timestamp_ms,
    const PublicKey& public_key,
    const PrivateKey& private_key,
    const std::span<const uint8_t> signature) {
    auto public_native = public_key.Native();
    if (public_native.IsErr()) {
        return std::move(public_native).PropagateErr<SignedPreKeyRecord>();
    }
    auto private_native = private_key.Native();
    if (private_native.IsErr()) {
        return std::move(private_native).PropagateErr<SignedPreKeyRecord>();
    }
    auto raw_result = InvokeNativeForObject<SignetSignedPreKeyRecord>("SignedPreKeyRecord::Create",
        [&](SignetSignedPreKeyRecord** out, SignetError* error) {
            return signet_signed_pre_key_record_new(
                out,
                id,
                timestamp_ms,
                public_native.Unwrap(),
                private_native.Unwrap(),
                signature.data(),
                signature.size(),
                error);
        });
    if (raw_result.IsErr()) {
        return std::move(raw_result).PropagateErr<SignedPreKeyRecord>();
    }
    return Result<SignedPreKeyRecord, HandleFailure>::Ok(Adopt(raw_result.Unwrap()));
}

Result<SignedPreKeyRecord, HandleFailure> SignedPreKeyRecord::Generate(
    const uint32_t id,
    const Timestamp timestamp,
    const IdentityKeyPair& identity) {
    auto private_key = PrivateKey::Generate();
    if (private_key.IsErr()) {
        return std::move(private_key).PropagateErr<SignedPreKeyRecord>();
    }
    auto public_key = private_key.Unwrap().GetPublicKey();
    if (public_key.IsErr()) {
        return std::move(public_key).PropagateErr<SignedPreKeyRecord>();
    }
    auto serialized_public = public_key.Unwrap().Serialize();
    if (serialized_public.IsErr()) {
        return std::move(serialized_public).PropagateErr<SignedPreKeyRecord>();
    }
    auto signature = identity.Sign(serialized_public.Unwrap());
    if (signature.IsErr()) {
        return std::move(signature).PropagateErr<SignedPreKeyRecord>();
    }
    return Create(id, timestamp, public_key.Unwrap(), private_key.Unwrap(), signature.Unwrap());
}

Result<SignedPreKeyRecord, HandleFailure> SignedPreKeyRecord::Deserialize(
    const std::span<const uint8_t> serialized) {
    auto raw_result = InvokeNativeForObject<SignetSignedPreKeyRecord>("SignedPreKeyRecord::Deserialize",
        [serialized](SignetSignedPreKeyRecord** out, SignetError* error) {
            return signet_signed_pre_key_record_deserialize(out, serialized.data(), serialized.size(), error);
        }, NativeFailureKind::Deserialization);
    if (raw_result.IsErr()) {
        return std::move(raw_result).PropagateErr<SignedPreKeyRecord>();
    }
    return Result<SignedPreKeyRecord, HandleFailure>::Ok(Adopt(raw_result.Unwrap()));
}

SignedPreKeyRecord SignedPreKeyRecord::Adopt(SignetSignedPreKeyRecord* raw) noexcept {
    return SignedPreKeyRecord(NativeHandle<SignedPreKeyRecordTraits>::Adopt(raw));
}

Result<SignedPreKeyRecord, HandleFailure> SignedPreKeyRecord::Clone() const {
    return handle_.Clone().Map([](NativeHandle<SignedPreKeyRecordTraits> handle) {
        return SignedPreKeyRecord(std::move(handle));
    });
}

Result<Unit, HandleFailure> SignedPreKeyRecord::Destroy() {
    return handle_.Destroy();
}

SignetSignedPreKeyRecord* SignedPreKeyRecord::Release() noexcept {
    return handle_.Release();
}

Result<std::vector<uint8_t>, HandleFailure> SignedPreKeyRecord::Serialize() const {
    auto native = handle_.Get();
    if (native.IsErr()) {
        return std::move(native).PropagateErr<std::vector<uint8_t>>();
    }
    return InvokeNativeForBytes("SignedPreKeyRecord::Serialize",
        [raw = native.Unwrap()](SignetBuffer* out, SignetError* error) {
            return signet_signed_pre_key_record_serialize(out, raw, error);
        });
}

Result<std::vector<uint8_t>, HandleFailure> SignedPreKeyRecord::GetSignature() const {
    auto native = handle_.Get();
    if (native.IsErr()) {
        return std::move(native).PropagateErr<std::vector<uint8_t>>();
    }
    return InvokeNativeForBytes("SignedPreKeyRecord::GetSignature",
        [raw = native.Unwrap()](SignetBuffer* out, SignetError* error) {
            return signet_signed_pre_key_record_get_signature(out, raw, error);
        });
}

Result<uint32_t, HandleFailure> SignedPreKeyRecord::GetId() const {
    auto native = handle_.Get();
    if (native.IsErr()) {
        return std::move(native).PropagateErr<uint32_t>();
    }
    uint32_t id = 0;
    auto call = InvokeNative("SignedPreKeyRecord::GetId", [&](SignetError* error) {
        return signet_signed_pre_key_record_get_id(&id, native.Unwrap(), error);
    });
    if (call.IsErr()) {
        return std::move(call).PropagateErr<uint32_t>();
    }
    return Result<uint32_t, HandleFailure>::Ok(id);
}

Result<Timestamp, HandleFailure> SignedPreKeyRecord::GetTimestamp() const {
    auto native = handle_.Get();
    if (native.IsErr()) {
        return std::move(native).PropagateErr<Timestamp>();
    }
    uint64_t timestamp_ms = 0;
    auto call = InvokeNative("SignedPreKeyRecord::GetTimestamp", [&](SignetError* error) {
        return signet_signed_pre_key_record_get_timestamp(&timestamp_ms, native.Unwrap(), error);
    });
    if (call.IsErr()) {
        return std::move(call).PropagateErr<Timestamp>();
    }
    return FromEpochMillis(timestamp_ms);
}

Result<PublicKey, HandleFailure> SignedPreKeyRecord::GetPublicKey() const {
    auto native = handle_.Get();
    if (native.IsErr()) {
        return std::move(native).PropagateErr<PublicKey>();
    }
    auto raw_result = InvokeNativeForObject<SignetPublicKey>("SignedPreKeyRecord::GetPublicKey",
        [raw = native.Unwrap()](SignetPublicKey** out, SignetError* error) {
            return signet_signed_pre_key_record_get_public_key(out, raw, error);
        });
    if (raw_result.IsErr()) {
        return std::move(raw_result).PropagateErr<PublicKey>();
    }
    return Result<PublicKey, HandleFailure>::Ok(PublicKey::Adopt(raw_result.Unwrap()));
}

Result<PrivateKey, HandleFailure> SignedPreKeyRecord::GetPrivateKey() const {
    auto native = handle_.Get();
    if (native.IsErr()) {
        return std::move(native).PropagateErr<PrivateKey>();
    }
    auto raw_result = InvokeNativeForObject<SignetPrivateKey>("SignedPreKeyRecord::GetPrivateKey",
        [raw = native.Unwrap()](SignetPrivateKey** out, SignetError* error) {
            return signet_signed_pre_key_record_get_private_key(out, raw, error);
        });
    if (raw_result.IsErr()) {
        return std::move(raw_result).PropagateErr<PrivateKey>();
    }
    return Result<PrivateKey, HandleFailure>::Ok(PrivateKey::Adopt(raw_result.Unwrap()));
}

Result<bool, HandleFailure> SignedPreKeyRecord::VerifySignature(
    const std::span<const uint8_t> identity_public_key) const {
    auto public_key = GetPublicKey();
    if (public_key.IsErr()) {
        return std::move(public_key).PropagateErr<bool>();
    }
    auto serialized_public = public_key.Unwrap().Serialize();
    if (serialized_public.IsErr()) {
        return std::move(serialized_public).PropagateErr<bool>();
    }
    auto signature = GetSignature();
    if (signature.IsErr()) {
        return std::move(signature).PropagateErr<bool>();
    }
    return IdentityKeyPair::Verify(identity_public_key, serialized_public.Unwrap(), signature.Unwrap());
}

} // namespace signet::protocol::handles
