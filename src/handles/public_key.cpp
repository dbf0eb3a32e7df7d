#include "signet/handles/public_key.hpp"
#include "signet/handles/call_adapter.hpp"

namespace signet::protocol::handles {

Result<PublicKey, HandleFailure> PublicKey::Deserialize(const std::span<const uint8_t> serialized) {
    auto raw_result = InvokeNativeForObject<SignetPublicKey>("PublicKey::Deserialize",
        [serialized](SignetPublicKey** out, SignetError* error) {
            return signet_public_key_deserialize(out, serialized.data(), serialized.size(), error);
        }, NativeFailureKind::Deserialization);
    if (raw_result.IsErr()) {
        return std::move(raw_result).PropagateErr<PublicKey>();
    }
    return Result<PublicKey, HandleFailure>::Ok(Adopt(raw_result.Unwrap()));
}

PublicKey PublicKey::Adopt(SignetPublicKey* raw) noexcept {
    return PublicKey(NativeHandle<PublicKeyTraits>::Adopt(raw));
}

Result<PublicKey, HandleFailure> PublicKey::Clone() const {
    return handle_.Clone().Map([](NativeHandle<PublicKeyTraits> handle) {
        return PublicKey(std::move(handle));
    });
}

Result<Unit, HandleFailure> PublicKey::Destroy() {
    return handle_.Destroy();
}

SignetPublicKey* PublicKey::Release() noexcept {
    return handle_.Release();
}

Result<std::vector<uint8_t>, HandleFailure> PublicKey::Serialize() const {
    auto native = handle_.Get();
    if (native.IsErr()) {
        return std::move(native).PropagateErr<std::vector<uint8_t>>();
    }
    return InvokeNativeForBytes("PublicKey::Serialize",
        [raw = native.Unwrap()](SignetBuffer* out, SignetError* error) {
            return signet_public_key_serialize(out, raw, error);
        });
}

Result<std::vector<uint8_t>, HandleFailure> PublicKey::GetPublicKeyBytes() const {
    auto native = handle_.Get();
    if (native.IsErr()) {
        return std::move(native).PropagateErr<std::vector<uint8_t>>();
    }
    return InvokeNativeForBytes("PublicKey::GetPublicKeyBytes",
        [raw = native.Unwrap()](SignetBuffer* out, SignetError* error) {
            return signet_public_key_get_public_key_bytes(out, raw, error);
        });
}

Result<int32_t, HandleFailure> PublicKey::Compare(const PublicKey& other) const {
    auto native = handle_.Get();
    if (native.IsErr()) {
        return std::move(native).PropagateErr<int32_t>();
    }
    auto other_native = other.handle_.Get();
    if (other_native.IsErr()) {
        return std::move(other_native).PropagateErr<int32_t>();
    }
    int32_t order = 0;
    auto call = InvokeNative("PublicKey::Compare",
        [&](SignetError* error) {
            return signet_public_key_compare(&order, native.Unwrap(), other_native.Unwrap(), error);
        });
    if (call.IsErr()) {
        return std::move(call).PropagateErr<int32_t>();
    }
    return Result<int32_t, HandleFailure>::Ok(order);
}

Result<bool, HandleFailure> PublicKey::Equals(const PublicKey& other) const {
    return Compare(other).Map([](const int32_t order) { return order == 0; });
}

} // namespace signet::protocol::handles
