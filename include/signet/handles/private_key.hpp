#pragma once

#include "signet/handles/native_handle.hpp"
#include "signet/handles/native_traits.hpp"
#include "signet/handles/public_key.hpp"
#include "signet/core/result.hpp"
#include "signet/core/failures.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace signet::protocol::handles {

/**
 * @brief Owning handle to a native X25519 private key
 */
class PrivateKey {
public:
    static Result<PrivateKey, HandleFailure> Generate();

    /**
     * @param serialized 32-byte scalar
     */
    static Result<PrivateKey, HandleFailure> Deserialize(std::span<const uint8_t> serialized);

    [[nodiscard]] static PrivateKey Adopt(SignetPrivateKey* raw) noexcept;

    PrivateKey() noexcept = default;
    PrivateKey(PrivateKey&&) noexcept = default;
    PrivateKey& operator=(PrivateKey&&) noexcept = default;
    PrivateKey(const PrivateKey&) = delete;
    PrivateKey& operator=(const PrivateKey&) = delete;

    [[nodiscard]] bool IsLive() const noexcept {
        return handle_.IsLive();
    }

    [[nodiscard]] Result<PrivateKey, HandleFailure> Clone() const;
    Result<Unit, HandleFailure> Destroy();
    [[nodiscard]] SignetPrivateKey* Release() noexcept;

    [[nodiscard]] Result<std::vector<uint8_t>, HandleFailure> Serialize() const;
    [[nodiscard]] Result<PublicKey, HandleFailure> GetPublicKey() const;

    /// X25519 shared secret with the peer's public key
    [[nodiscard]] Result<std::vector<uint8_t>, HandleFailure> Agree(const PublicKey& peer) const;

    [[nodiscard]] Result<SignetPrivateKey*, HandleFailure> Native() const {
        return handle_.Get();
    }

private:
    explicit PrivateKey(NativeHandle<PrivateKeyTraits> handle) noexcept
        : handle_(std::move(handle)) {}

    NativeHandle<PrivateKeyTraits> handle_;
};

} // namespace signet::protocol::handles
