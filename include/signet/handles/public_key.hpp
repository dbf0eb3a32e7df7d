#pragma once

#include "signet/handles/native_handle.hpp"
#include "signet/handles/native_traits.hpp"
#include "signet/core/result.hpp"
#include "signet/core/failures.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace signet::protocol::handles {

/**
 * @brief Owning handle to a native X25519 public key
 */
class PublicKey {
public:
    /**
     * @param serialized 33-byte type-prefixed form
     */
    static Result<PublicKey, HandleFailure> Deserialize(std::span<const uint8_t> serialized);

    [[nodiscard]] static PublicKey Adopt(SignetPublicKey* raw) noexcept;

    PublicKey() noexcept = default;
    PublicKey(PublicKey&&) noexcept = default;
    PublicKey& operator=(PublicKey&&) noexcept = default;
    PublicKey(const PublicKey&) = delete;
    PublicKey& operator=(const PublicKey&) = delete;

    [[nodiscard]] bool IsLive() const noexcept {
        return handle_.IsLive();
    }

    [[nodiscard]] Result<PublicKey, HandleFailure> Clone() const;
    Result<Unit, HandleFailure> Destroy();
    [[nodiscard]] SignetPublicKey* Release() noexcept;

    [[nodiscard]] Result<std::vector<uint8_t>, HandleFailure> Serialize() const;

    /// The bare 32-byte point
    [[nodiscard]] Result<std::vector<uint8_t>, HandleFailure> GetPublicKeyBytes() const;

    /// Negative, zero or positive in byte order of the points
    [[nodiscard]] Result<int32_t, HandleFailure> Compare(const PublicKey& other) const;
    [[nodiscard]] Result<bool, HandleFailure> Equals(const PublicKey& other) const;

    /// Borrow the native object for one synchronous call
    [[nodiscard]] Result<SignetPublicKey*, HandleFailure> Native() const {
        return handle_.Get();
    }

private:
    explicit PublicKey(NativeHandle<PublicKeyTraits> handle) noexcept
        : handle_(std::move(handle)) {}

    NativeHandle<PublicKeyTraits> handle_;
};

} // namespace signet::protocol::handles
