#pragma once

#include "signet/c_api/signet_api.h"
#include "signet/core/result.hpp"
#include "signet/core/failures.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace signet::protocol::handles {

/**
 * @brief Which HandleFailure a native error code becomes
 */
enum class NativeFailureKind {
    NativeOperation,
    Deserialization
};

/**
 * @brief Error slot handed to one native call
 *
 * Owns the strdup-ed message the native library may leave behind and frees
 * it on scope exit.
 */
class NativeErrorSlot {
public:
    NativeErrorSlot() noexcept = default;
    ~NativeErrorSlot();

    NativeErrorSlot(const NativeErrorSlot&) = delete;
    NativeErrorSlot& operator=(const NativeErrorSlot&) = delete;

    [[nodiscard]] SignetError* Out() noexcept {
        return &error_;
    }

    /**
     * @brief Build the HandleFailure for a failed call
     *
     * The message is the native message prefixed with the operation name.
     */
    [[nodiscard]] HandleFailure ToFailure(
        std::string_view operation,
        SignetErrorCode code,
        NativeFailureKind kind) const;

private:
    SignetError error_{SIGNET_SUCCESS, nullptr};
};

/**
 * @brief Library-owned bytes returned by one native call
 *
 * The bytes are released back to the native allocator on every path.
 */
class OwnedBuffer {
public:
    OwnedBuffer() noexcept = default;
    ~OwnedBuffer();

    OwnedBuffer(const OwnedBuffer&) = delete;
    OwnedBuffer& operator=(const OwnedBuffer&) = delete;

    [[nodiscard]] SignetBuffer* Out() noexcept {
        return &buffer_;
    }

    [[nodiscard]] std::vector<uint8_t> CopyOut() const;

private:
    SignetBuffer buffer_{nullptr, 0};
};

/**
 * @brief Run one fallible native call and translate its error
 *
 * @param call Invocable taking SignetError* and returning SignetErrorCode
 */
template<typename Call>
Result<Unit, HandleFailure> InvokeNative(
    const std::string_view operation,
    Call&& call,
    const NativeFailureKind kind = NativeFailureKind::NativeOperation) {
    NativeErrorSlot slot;
    const SignetErrorCode code = std::forward<Call>(call)(slot.Out());
    if (code != SIGNET_SUCCESS) {
        return Result<Unit, HandleFailure>::Err(slot.ToFailure(operation, code, kind));
    }
    return Result<Unit, HandleFailure>::Ok(unit);
}

/**
 * @brief Run a native call that fills an owned buffer and copy the bytes out
 *
 * @param call Invocable taking (SignetBuffer*, SignetError*)
 */
template<typename Call>
Result<std::vector<uint8_t>, HandleFailure> InvokeNativeForBytes(
    const std::string_view operation,
    Call&& call) {
    OwnedBuffer buffer;
    auto result = InvokeNative(operation, [&](SignetError* error) {
        return std::forward<Call>(call)(buffer.Out(), error);
    });
    if (result.IsErr()) {
        return std::move(result).template PropagateErr<std::vector<uint8_t>>();
    }
    return Result<std::vector<uint8_t>, HandleFailure>::Ok(buffer.CopyOut());
}

/**
 * @brief Run a native call that produces a new native object
 *
 * @param call Invocable taking (Native**, SignetError*)
 * @return the raw object, owned by the caller
 */
template<typename Native, typename Call>
Result<Native*, HandleFailure> InvokeNativeForObject(
    const std::string_view operation,
    Call&& call,
    const NativeFailureKind kind = NativeFailureKind::NativeOperation) {
    Native* object = nullptr;
    auto result = InvokeNative(operation, [&](SignetError* error) {
        return std::forward<Call>(call)(&object, error);
    }, kind);
    if (result.IsErr()) {
        return std::move(result).template PropagateErr<Native*>();
    }
    if (!object) {
        return Result<Native*, HandleFailure>::Err(
            HandleFailure::NativeOperation(
                SIGNET_ERROR_NULL_POINTER,
                std::string(operation) + ": native library returned no object"));
    }
    return Result<Native*, HandleFailure>::Ok(object);
}

} // namespace signet::protocol::handles
