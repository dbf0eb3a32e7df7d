#pragma once

#include "signet/c_api/signet_api.h"
#include "signet/configuration/record_config.hpp"
#include "signet/core/result.hpp"
#include "signet/core/failures.hpp"

#include <cstdint>
#include <string_view>

namespace signet::protocol::handles {

/**
 * @brief Process-wide setup of the native library
 */
class Library {
public:
    /**
     * @brief Initialize libsodium and install record validation limits
     *
     * Safe to call repeatedly; the last configuration wins.
     */
    static Result<Unit, HandleFailure> Initialize(
        const configuration::RecordConfig& config = configuration::RecordConfig::Default());

    [[nodiscard]] static std::string_view Version() noexcept;

    /**
     * @brief Native objects of the given kind currently allocated
     */
    [[nodiscard]] static uint64_t LiveObjectCount(SignetObjectKind kind) noexcept;

private:
    Library() = delete;
};

} // namespace signet::protocol::handles
