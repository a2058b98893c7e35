#pragma once

#include <devscore/core/types.h>

#include <optional>
#include <string>

namespace devscore {

/**
 * @brief Utility for parsing the timestamps carried by state-change events
 */
class TimeParser {
public:
    /**
     * @brief Parse a timestamp string into a time point
     *
     * Supported formats:
     * - ISO 8601: "2024-01-01T09:30:00Z", "2024-01-01T09:30:00.250-06:00", "2024-01-01"
     * - Unix timestamp in seconds or milliseconds: "1704067200"
     *
     * Timestamps without an offset are taken as UTC.
     *
     * @param timeStr String to parse
     * @return Parsed time point or InvalidTimestamp
     */
    static Result<TimePoint> parse(const std::string& timeStr);

    /**
     * @brief Parse an ISO 8601 date/time string
     * @return Parsed time point or nullopt if invalid format
     */
    static std::optional<TimePoint> parseISO8601(const std::string& isoStr);

    /**
     * @brief Parse a Unix timestamp
     * @return Parsed time point or nullopt if invalid
     */
    static std::optional<TimePoint> parseUnixTimestamp(const std::string& timestampStr);

    /**
     * @brief Seconds since the epoch, or nullopt outside the clock's range
     */
    static std::optional<TimePoint> fromUnixSeconds(long long seconds);

    /**
     * @brief Format a time point as an ISO 8601 UTC string
     */
    static std::string formatISO8601(const TimePoint& tp);
};

} // namespace devscore
