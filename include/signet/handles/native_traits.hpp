#pragma once

#include "signet/c_api/signet_api.h"
#include "signet/core/result.hpp"
#include "signet/core/failures.hpp"

#include <cstdint>
#include <string_view>

namespace signet::protocol::handles {

struct PublicKeyTraits {
    using native_type = SignetPublicKey;
    static constexpr std::string_view kName = "PublicKey";
    static int32_t Destroy(native_type* raw) noexcept;
    static Result<native_type*, HandleFailure> Clone(const native_type* raw);
};

struct PrivateKeyTraits {
    using native_type = SignetPrivateKey;
    static constexpr std::string_view kName = "PrivateKey";
    static int32_t Destroy(native_type* raw) noexcept;
    static Result<native_type*, HandleFailure> Clone(const native_type* raw);
};

struct IdentityKeyPairTraits {
    using native_type = SignetIdentityKeyPair;
    static constexpr std::string_view kName = "IdentityKeyPair";
    static int32_t Destroy(native_type* raw) noexcept;
    static Result<native_type*, HandleFailure> Clone(const native_type* raw);
};

struct SignedPreKeyRecordTraits {
    using native_type = SignetSignedPreKeyRecord;
    static constexpr std::string_view kName = "SignedPreKeyRecord";
    static int32_t Destroy(native_type* raw) noexcept;
    static Result<native_type*, HandleFailure> Clone(const native_type* raw);
};

} // namespace signet::protocol::handles
