#include "signet/handles/identity_key_pair.hpp"
#include "signet/handles/call_adapter.hpp"

namespace signet::protocol::handles {

Result<IdentityKeyPair, HandleFailure> IdentityKeyPair::Generate() {
    auto raw_result = InvokeNativeForObject<SignetIdentityKeyPair>("IdentityKeyPair::Generate",
        [](SignetIdentityKeyPair** out, SignetError* error) {
            return signet_identity_key_pair_generate(out, error);
        });
    if (raw_result.IsErr()) {
        return std::move(raw_result).PropagateErr<IdentityKeyPair>();
    }
    return Result<IdentityKeyPair, HandleFailure>::Ok(Adopt(raw_result.Unwrap()));
}

IdentityKeyPair IdentityKeyPair::Adopt(SignetIdentityKeyPair* raw) noexcept {
    return IdentityKeyPair(NativeHandle<IdentityKeyPairTraits>::Adopt(raw));
}

Result<bool, HandleFailure> IdentityKeyPair::Verify(
    const std::span<const uint8_t> public_key,
    const std::span<const uint8_t> message,
    const std::span<const uint8_t> signature) {
    bool valid = false;
    auto call = InvokeNative("IdentityKeyPair::Verify", [&](SignetError* error) {
        return signet_identity_verify(
            &valid,
            public_key.data(), public_key.size(),
            message.data(), message.size(),
            signature.data(), signature.size(),
            error);
    });
    if (call.IsErr()) {
        return std::move(call).PropagateErr<bool>();
    }
    return Result<bool, HandleFailure>::Ok(valid);
}

Result<IdentityKeyPair, HandleFailure> IdentityKeyPair::Clone() const {
    return handle_.Clone().Map([](NativeHandle<IdentityKeyPairTraits> handle) {
        return IdentityKeyPair(std::move(handle));
    });
}

Result<Unit, HandleFailure> IdentityKeyPair::Destroy() {
    return handle_.Destroy();
}

SignetIdentityKeyPair* IdentityKeyPair::Release() noexcept {
    return handle_.Release();
}

Result<std::vector<uint8_t>, HandleFailure> IdentityKeyPair::GetPublicKey() const {
    auto native = handle_.Get();
    if (native.IsErr()) {
        return std::move(native).PropagateErr<std::vector<uint8_t>>();
    }
    return InvokeNativeForBytes("IdentityKeyPair::GetPublicKey",
        [raw = native.Unwrap()](SignetBuffer* out, SignetError* error) {
            return signet_identity_key_pair_get_public_key(out, raw, error);
        });
}

Result<std::vector<uint8_t>, HandleFailure> IdentityKeyPair::Sign(const std::span<const uint8_t> message) const {
    auto native = handle_.Get();
    if (native.IsErr()) {
        return std::move(native).PropagateErr<std::vector<uint8_t>>();
    }
    return InvokeNativeForBytes("IdentityKeyPair::Sign",
        [raw = native.Unwrap(), message](SignetBuffer* out, SignetError* error) {
            return signet_identity_key_pair_sign(out, raw, message.data(), message.size(), error);
        });
}

} // namespace signet::protocol::handles
