#pragma once

#include "signet/core/result.hpp"
#include "signet/core/failures.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace signet::protocol {

/// Record timestamps carry whole milliseconds since the UTC epoch
using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

/**
 * @brief Milliseconds since the epoch, floored
 *
 * Sub-millisecond precision is discarded. Instants before the epoch are
 * rejected with InvalidArgument.
 */
template<typename Duration>
Result<uint64_t, HandleFailure> ToEpochMillis(const std::chrono::sys_time<Duration> instant) {
    const auto millis = std::chrono::floor<std::chrono::milliseconds>(instant);
    const auto count = millis.time_since_epoch().count();
    if (count < 0) {
        return Result<uint64_t, HandleFailure>::Err(
            HandleFailure::InvalidArgument("Timestamp precedes the Unix epoch"));
    }
    return Result<uint64_t, HandleFailure>::Ok(static_cast<uint64_t>(count));
}

Result<Timestamp, HandleFailure> FromEpochMillis(uint64_t millis);

/**
 * @brief RFC 3339 UTC with millisecond precision, e.g. 2023-01-01T00:00:00.500Z
 */
std::string FormatTimestamp(Timestamp timestamp);

/**
 * @brief Parse RFC 3339 UTC (`Z` suffix, 0-9 fractional digits)
 */
Result<std::chrono::sys_time<std::chrono::nanoseconds>, HandleFailure> ParseTimestamp(std::string_view text);

} // namespace signet::protocol
