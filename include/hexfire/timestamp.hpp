#pragma once

#include "hexfire/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace hexfire {

    constexpr std::int64_t kSecondsPerDay = 86400;

    // UTC calendar day [start, end) containing an instant.
    struct DayBucket {
        std::string label; // YYYY-MM-DD
        std::int64_t start = 0;
        std::int64_t end = 0;
    };

    // Parses an ISO-8601 instant into epoch seconds. Wall-clock fields are read as UTC; a trailing
    // offset is accepted and ignored. Returns nullopt instead of throwing on anything unparseable.
    std::optional<double> ParseTimestamp(const std::string &raw);
    std::optional<double> ParseTimestamp(const std::optional<std::string> &raw);

    // Candidate time field by priority: time_floor, then time, then timestamp. Empty strings are skipped.
    std::optional<std::string> ResolveTimeField(const FireProperties &props);

    struct ResolvedTime {
        std::string raw;
        double epoch = 0.0;
    };

    std::optional<ResolvedTime> ResolveTime(const FireProperties &props);

    DayBucket DayBucketFor(double epoch);

    // Strict YYYY-MM-DD. Returns midnight UTC as epoch seconds; throws std::invalid_argument otherwise.
    std::int64_t ParseDate(const std::string &text);

    // 2024-07-01T12:00:00Z, with microseconds when the instant has a fractional part.
    std::string FormatTimestamp(double epoch);

    std::int64_t DaysFromCivil(int y, unsigned m, unsigned d) noexcept;

} // namespace hexfire
