#pragma once

#include "signet/core/result.hpp"
#include "signet/core/failures.hpp"
#include "signet/core/constants.hpp"
#include "signet/debug/handle_logger.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace signet::protocol::handles {

/**
 * @brief Sole owner of one native object
 *
 * Traits supplies:
 * - `native_type`, the opaque native struct
 * - `kName`, a printable type name
 * - `static int32_t Destroy(native_type*) noexcept`, returning 0 on success
 * - `static Result<native_type*, HandleFailure> Clone(const native_type*)`
 *
 * States: Live (owns a pointer) and Destroyed (owns nothing). A handle leaves
 * Live through Destroy, Release, being moved from, or its destructor, and the
 * native destroy runs at most once over all of these.
 */
template<typename Traits>
class NativeHandle {
public:
    using native_type = typename Traits::native_type;

    NativeHandle() noexcept = default;

    /**
     * @brief Take ownership of a raw native pointer
     *
     * A null pointer yields a handle that is already Destroyed.
     */
    [[nodiscard]] static NativeHandle Adopt(native_type* raw) noexcept {
        if (raw) {
            debug::LogHandleAdopted(Traits::kName, raw);
        }
        return NativeHandle(raw);
    }

    ~NativeHandle() {
        Backstop();
    }

    NativeHandle(NativeHandle&& other) noexcept
        : raw_(std::exchange(other.raw_, nullptr)) {}

    NativeHandle& operator=(NativeHandle&& other) noexcept {
        if (this != &other) {
            Backstop();
            raw_ = std::exchange(other.raw_, nullptr);
        }
        return *this;
    }

    NativeHandle(const NativeHandle&) = delete;
    NativeHandle& operator=(const NativeHandle&) = delete;

    [[nodiscard]] bool IsLive() const noexcept {
        return raw_ != nullptr;
    }

    /**
     * @brief Borrow the native pointer for one synchronous call
     */
    [[nodiscard]] Result<native_type*, HandleFailure> Get() const {
        if (!raw_) {
            return Result<native_type*, HandleFailure>::Err(Disposed());
        }
        return Result<native_type*, HandleFailure>::Ok(raw_);
    }

    /**
     * @brief Destroy the native object now
     *
     * The handle is disarmed before the native destroy runs, so the
     * destructor never touches the object again even if destroy fails.
     */
    Result<Unit, HandleFailure> Destroy() {
        if (!raw_) {
            return Result<Unit, HandleFailure>::Err(Disposed());
        }
        native_type* raw = std::exchange(raw_, nullptr);
        const int32_t code = Traits::Destroy(raw);
        debug::LogHandleDestroyed(Traits::kName, raw);
        if (code != 0) {
            return Result<Unit, HandleFailure>::Err(
                HandleFailure::NativeOperation(
                    code, std::string(Traits::kName) + "::Destroy: native destroy failed"));
        }
        return Result<Unit, HandleFailure>::Ok(unit);
    }

    /**
     * @brief Give up ownership without destroying
     *
     * The caller becomes responsible for the single destroy. Returns null
     * if the handle was not Live.
     */
    [[nodiscard]] native_type* Release() noexcept {
        native_type* raw = std::exchange(raw_, nullptr);
        if (raw) {
            debug::LogHandleReleased(Traits::kName, raw);
        }
        return raw;
    }

    [[nodiscard]] Result<NativeHandle, HandleFailure> Clone() const {
        if (!raw_) {
            return Result<NativeHandle, HandleFailure>::Err(Disposed());
        }
        auto clone_result = Traits::Clone(raw_);
        if (clone_result.IsErr()) {
            return std::move(clone_result).template PropagateErr<NativeHandle>();
        }
        return Result<NativeHandle, HandleFailure>::Ok(Adopt(clone_result.Unwrap()));
    }

private:
    explicit NativeHandle(native_type* raw) noexcept
        : raw_(raw) {}

    static HandleFailure Disposed() {
        return HandleFailure::InvalidState(
            std::string(Traits::kName) + ": " + std::string(ErrorMessages::NATIVE_OBJECT_DESTROYED));
    }

    void Backstop() noexcept {
        if (!raw_) {
            return;
        }
        native_type* raw = std::exchange(raw_, nullptr);
        const int32_t code = Traits::Destroy(raw);
        debug::LogBackstopFired(Traits::kName, raw, code);
    }

    native_type* raw_ = nullptr;
};

} // namespace signet::protocol::handles
