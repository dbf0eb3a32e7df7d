#include "signet/core/timestamp.hpp"

#include <fmt/core.h>

#include <charconv>
#include <limits>

namespace signet::protocol {

namespace {

using std::chrono::days;
using std::chrono::hours;
using std::chrono::milliseconds;
using std::chrono::minutes;
using std::chrono::nanoseconds;
using std::chrono::seconds;

Result<std::chrono::sys_time<nanoseconds>, HandleFailure> Malformed(const std::string_view text) {
    return Result<std::chrono::sys_time<nanoseconds>, HandleFailure>::Err(
        HandleFailure::InvalidArgument(fmt::format("Malformed RFC 3339 timestamp '{}'", text)));
}

bool ReadNumber(const std::string_view text, const size_t offset, const size_t width, int& value) {
    if (offset + width > text.size()) {
        return false;
    }
    const char* first = text.data() + offset;
    const char* last = first + width;
    for (const char* it = first; it != last; ++it) {
        if (*it < '0' || *it > '9') {
            return false;
        }
    }
    const auto [ptr, ec] = std::from_chars(first, last, value);
    return ec == std::errc() && ptr == last;
}

bool Expect(const std::string_view text, const size_t offset, const char expected) {
    return offset < text.size() && text[offset] == expected;
}

} // namespace

Result<Timestamp, HandleFailure> FromEpochMillis(const uint64_t millis) {
    if (millis > static_cast<uint64_t>(std::numeric_limits<milliseconds::rep>::max())) {
        return Result<Timestamp, HandleFailure>::Err(
            HandleFailure::InvalidArgument(
                fmt::format("Timestamp {} ms is out of range", millis)));
    }
    return Result<Timestamp, HandleFailure>::Ok(
        Timestamp(milliseconds(static_cast<milliseconds::rep>(millis))));
}

std::string FormatTimestamp(const Timestamp timestamp) {
    const auto day_point = std::chrono::floor<days>(timestamp);
    const std::chrono::year_month_day date(day_point);
    const std::chrono::hh_mm_ss time(timestamp - day_point);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
        static_cast<int>(date.year()),
        static_cast<unsigned>(date.month()),
        static_cast<unsigned>(date.day()),
        time.hours().count(),
        time.minutes().count(),
        time.seconds().count(),
        time.subseconds().count());
}

Result<std::chrono::sys_time<nanoseconds>, HandleFailure> ParseTimestamp(const std::string_view text) {
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    if (!ReadNumber(text, 0, 4, year) || !Expect(text, 4, '-') ||
        !ReadNumber(text, 5, 2, month) || !Expect(text, 7, '-') ||
        !ReadNumber(text, 8, 2, day) || !Expect(text, 10, 'T') ||
        !ReadNumber(text, 11, 2, hour) || !Expect(text, 13, ':') ||
        !ReadNumber(text, 14, 2, minute) || !Expect(text, 16, ':') ||
        !ReadNumber(text, 17, 2, second)) {
        return Malformed(text);
    }

    size_t offset = 19;
    nanoseconds fraction{0};
    if (Expect(text, offset, '.')) {
        ++offset;
        int64_t value = 0;
        size_t digits = 0;
        while (offset < text.size() && text[offset] >= '0' && text[offset] <= '9') {
            if (digits == 9) {
                return Malformed(text);
            }
            value = value * 10 + (text[offset] - '0');
            ++digits;
            ++offset;
        }
        if (digits == 0) {
            return Malformed(text);
        }
        for (size_t i = digits; i < 9; ++i) {
            value *= 10;
        }
        fraction = nanoseconds(value);
    }
    if (!Expect(text, offset, 'Z') || offset + 1 != text.size()) {
        return Malformed(text);
    }

    const std::chrono::year_month_day date{
        std::chrono::year(year),
        std::chrono::month(static_cast<unsigned>(month)),
        std::chrono::day(static_cast<unsigned>(day))};
    if (!date.ok() || hour > 23 || minute > 59 || second > 59) {
        return Malformed(text);
    }

    const auto instant = std::chrono::sys_days(date) + hours(hour) + minutes(minute) +
                         seconds(second) + fraction;
    return Result<std::chrono::sys_time<nanoseconds>, HandleFailure>::Ok(instant);
}

} // namespace signet::protocol
