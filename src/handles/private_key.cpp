#include "signet/handles/private_key.hpp"
#include "signet/handles/call_adapter.hpp"

namespace signet::protocol::handles {

Result<PrivateKey, HandleFailure> PrivateKey::Generate() {
    auto raw_result = InvokeNativeForObject<SignetPrivateKey>("PrivateKey::Generate",
        [](SignetPrivateKey** out, SignetError* error) {
            return signet_private_key_generate(out, error);
        });
    if (raw_result.IsErr()) {
        return std::move(raw_result).PropagateErr<PrivateKey>();
    }
    return Result<PrivateKey, HandleFailure>::Ok(Adopt(raw_result.Unwrap()));
}

Result<PrivateKey, HandleFailure> PrivateKey::Deserialize(const std::span<const uint8_t> serialized) {
    auto raw_result = InvokeNativeForObject<SignetPrivateKey>("PrivateKey::Deserialize",
        [serialized](SignetPrivateKey** out, SignetError* error) {
            return signet_private_key_deserialize(out, serialized.data(), serialized.size(), error);
        }, NativeFailureKind::Deserialization);
    if (raw_result.IsErr()) {
        return std::move(raw_result).PropagateErr<PrivateKey>();
    }
    return Result<PrivateKey, HandleFailure>::Ok(Adopt(raw_result.Unwrap()));
}

PrivateKey PrivateKey::Adopt(SignetPrivateKey* raw) noexcept {
    return PrivateKey(NativeHandle<PrivateKeyTraits>::Adopt(raw));
}

Result<PrivateKey, HandleFailure> PrivateKey::Clone() const {
    return handle_.Clone().Map([](NativeHandle<PrivateKeyTraits> handle) {
        return PrivateKey(std::move(handle));
    });
}

Result<Unit, HandleFailure> PrivateKey::Destroy() {
    return handle_.Destroy();
}

SignetPrivateKey* PrivateKey::Release() noexcept {
    return handle_.Release();
}

Result<std::vector<uint8_t>, HandleFailure> PrivateKey::Serialize() const {
    auto native = handle_.Get();
    if (native.IsErr()) {
        return std::move(native).PropagateErr<std::vector<uint8_t>>();
    }
    return InvokeNativeForBytes("PrivateKey::Serialize",
        [raw = native.Unwrap()](SignetBuffer* out, SignetError* error) {
            return signet_private_key_serialize(out, raw, error);
        });
}

Result<PublicKey, HandleFailure> PrivateKey::GetPublicKey() const {
    auto native = handle_.Get();
    if (native.IsErr()) {
        return std::move(native).PropagateErr<PublicKey>();
    }
    auto raw_result = InvokeNativeForObject<SignetPublicKey>("PrivateKey::GetPublicKey",
        [raw = native.Unwrap()](SignetPublicKey** out, SignetError* error) {
            return signet_private_key_get_public_key(out, raw, error);
        });
    if (raw_result.IsErr()) {
        return std::move(raw_result).PropagateErr<PublicKey>();
    }
    return Result<PublicKey, HandleFailure>::Ok(PublicKey::Adopt(raw_result.Unwrap()));
}

Result<std::vector<uint8_t>, HandleFailure> PrivateKey::Agree(const PublicKey& peer) const {
    auto native = handle_.Get();
    if (native.IsErr()) {
        return std::move(native).PropagateErr<std::vector<uint8_t>>();
    }
    auto peer_native = peer.Native();
    if (peer_native.IsErr()) {
        return std::move(peer_native).PropagateErr<std::vector<uint8_t>>();
    }
    return InvokeNativeForBytes("PrivateKey::Agree",
        [raw = native.Unwrap(), peer_raw = peer_native.Unwrap()](SignetBuffer* out, SignetError* error) {
            return signet_private_key_agree(out, raw, peer_raw, error);
        });
}

} // namespace signet::protocol::handles
