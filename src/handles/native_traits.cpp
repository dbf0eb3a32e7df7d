#include "signet/handles/native_traits.hpp"
#include "signet/handles/call_adapter.hpp"

namespace signet::protocol::handles {

int32_t PublicKeyTraits::Destroy(native_type* raw) noexcept {
    return static_cast<int32_t>(signet_public_key_destroy(raw));
}

Result<SignetPublicKey*, HandleFailure> PublicKeyTraits::Clone(const native_type* raw) {
    return InvokeNativeForObject<SignetPublicKey>("PublicKey::Clone",
        [raw](SignetPublicKey** out, SignetError* error) {
            return signet_public_key_clone(out, raw, error);
        });
}

int32_t PrivateKeyTraits::Destroy(native_type* raw) noexcept {
    return static_cast<int32_t>(signet_private_key_destroy(raw));
}

Result<SignetPrivateKey*, HandleFailure> PrivateKeyTraits::Clone(const native_type* raw) {
    return InvokeNativeForObject<SignetPrivateKey>("PrivateKey::Clone",
        [raw](SignetPrivateKey** out, SignetError* error) {
            return signet_private_key_clone(out, raw, error);
        });
}

int32_t IdentityKeyPairTraits::Destroy(native_type* raw) noexcept {
    return static_cast<int32_t>(signet_identity_key_pair_destroy(raw));
}

Result<SignetIdentityKeyPair*, HandleFailure> IdentityKeyPairTraits::Clone(const native_type* raw) {
    return InvokeNativeForObject<SignetIdentityKeyPair>("IdentityKeyPair::Clone",
        [raw](SignetIdentityKeyPair** out, SignetError* error) {
            return signet_identity_key_pair_clone(out, raw, error);
        });
}

int32_t SignedPreKeyRecordTraits::Destroy(native_type* raw) noexcept {
    return static_cast<int32_t>(signet_signed_pre_key_record_destroy(raw));
}

Result<SignetSignedPreKeyRecord*, HandleFailure> SignedPreKeyRecordTraits::Clone(const native_type* raw) {
    return InvokeNativeForObject<SignetSignedPreKeyRecord>("SignedPreKeyRecord::Clone",
        [raw](SignetSignedPreKeyRecord** out, SignetError* error) {
            return signet_signed_pre_key_record_clone(out, raw, error);
        });
}

} // namespace signet::protocol::handles
