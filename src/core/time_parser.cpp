#include <devscore/core/time_parser.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace devscore {

namespace {

// Counts outside the clock's nanosecond range would overflow on conversion.
template <typename Unit> std::optional<TimePoint> sinceEpoch(long long count) {
    using Duration = TimePoint::duration;
    constexpr auto maxCount = std::chrono::duration_cast<Unit>(Duration::max()).count();
    constexpr auto minCount = std::chrono::duration_cast<Unit>(Duration::min()).count();
    if (count > maxCount || count < minCount)
        return std::nullopt;
    return TimePoint{std::chrono::duration_cast<Duration>(Unit(count))};
}

// Broken-down UTC time to a time point. mktime() would apply the host zone.
std::optional<TimePoint> fromUtcTm(const std::tm& tm) {
    std::tm copy = tm;
    copy.tm_isdst = 0;
    errno = 0;
    const std::time_t t = ::timegm(&copy);
    if (t == static_cast<std::time_t>(-1) && errno == EOVERFLOW)
        return std::nullopt;
    return sinceEpoch<std::chrono::seconds>(static_cast<long long>(t));
}

bool allDigits(const std::string& s, size_t from, size_t to) {
    if (from >= to)
        return false;
    return std::all_of(s.begin() + static_cast<std::ptrdiff_t>(from),
                       s.begin() + static_cast<std::ptrdiff_t>(to),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // namespace

Result<TimePoint> TimeParser::parse(const std::string& timeStr) {
    if (timeStr.empty()) {
        return Error{ErrorCode::MissingTimestamp, "Empty time string"};
    }

    if (auto tp = parseISO8601(timeStr)) {
        return tp.value();
    }

    if (auto tp = parseUnixTimestamp(timeStr)) {
        return tp.value();
    }

    if (allDigits(timeStr, 0, timeStr.size())) {
        return Error{ErrorCode::InvalidTimestamp,
                     "Unix timestamp '" + timeStr + "' is out of range"};
    }

    return Error{ErrorCode::InvalidTimestamp,
                 "Invalid time format '" + timeStr +
                     "'. Supported formats: ISO 8601 (2024-01-01T09:00:00Z) or Unix timestamp"};
}

std::optional<TimePoint> TimeParser::parseISO8601(const std::string& isoStr) {
    std::tm tm = {};
    std::istringstream ss(isoStr);

    // Full ISO 8601 first (YYYY-MM-DDTHH:MM:SS), space separator also accepted
    std::string normalized = isoStr;
    if (normalized.size() > 10 && normalized[10] == ' ')
        normalized[10] = 'T';
    ss.str(normalized);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (!ss.fail()) {
        std::string rest;
        ss >> rest;

        // Fractional seconds
        std::chrono::microseconds fraction{0};
        if (!rest.empty() && rest[0] == '.') {
            size_t end = 1;
            while (end < rest.size() && std::isdigit(static_cast<unsigned char>(rest[end])))
                ++end;
            std::string digits = rest.substr(1, end - 1);
            if (digits.empty())
                return std::nullopt;
            digits.resize(6, '0');
            fraction = std::chrono::microseconds(std::stol(digits.substr(0, 6)));
            rest = rest.substr(end);
        }

        auto base = fromUtcTm(tm);
        if (!base)
            return std::nullopt;
        auto tp = *base + fraction;

        if (rest == "Z" || rest == "z" || rest.empty()) {
            return tp;
        }
        if (rest.size() >= 3 && (rest[0] == '+' || rest[0] == '-') && allDigits(rest, 1, 3)) {
            // Offset like +00:00, -05:00 or -0500
            const int sign = (rest[0] == '+') ? 1 : -1;
            const int hours = std::stoi(rest.substr(1, 2));
            int minutes = 0;
            if (rest.size() == 6 && rest[3] == ':' && allDigits(rest, 4, 6)) {
                minutes = std::stoi(rest.substr(4, 2));
            } else if (rest.size() == 5 && allDigits(rest, 3, 5)) {
                minutes = std::stoi(rest.substr(3, 2));
            } else if (rest.size() != 3) {
                return std::nullopt;
            }
            auto offset = std::chrono::hours(hours) + std::chrono::minutes(minutes);
            return tp - (sign * offset);
        }
        return std::nullopt;
    }

    // Date-only (YYYY-MM-DD), start of day UTC
    if (isoStr.size() != 10)
        return std::nullopt;
    tm = {};
    ss.clear();
    ss.str(isoStr);
    ss >> std::get_time(&tm, "%Y-%m-%d");
    if (!ss.fail()) {
        tm.tm_hour = 0;
        tm.tm_min = 0;
        tm.tm_sec = 0;
        return fromUtcTm(tm);
    }

    return std::nullopt;
}

std::optional<TimePoint> TimeParser::parseUnixTimestamp(const std::string& timestampStr) {
    if (!allDigits(timestampStr, 0, timestampStr.size()) || timestampStr.size() > 18) {
        return std::nullopt;
    }

    const long long timestamp = std::stoll(timestampStr);

    // Seconds are 10 digits until 2286; 13 digits means milliseconds
    if (timestampStr.length() > 11) {
        return sinceEpoch<std::chrono::milliseconds>(timestamp);
    }
    return fromUnixSeconds(timestamp);
}

std::optional<TimePoint> TimeParser::fromUnixSeconds(long long seconds) {
    return sinceEpoch<std::chrono::seconds>(seconds);
}

std::string TimeParser::formatISO8601(const TimePoint& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    ::gmtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace devscore
