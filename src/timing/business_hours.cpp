#include <devscore/timing/business_hours.h>

#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/local_time/local_time.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/make_shared.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <exception>

namespace devscore::timing {

namespace bg = boost::gregorian;
namespace blt = boost::local_time;
namespace bpt = boost::posix_time;

namespace {

const bpt::ptime kEpoch(bg::date(1970, 1, 1));

bpt::ptime toPtime(TimePoint tp) {
    const auto us =
        std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
    return kEpoch + bpt::microseconds(us);
}

bpt::time_duration hoursToDuration(double hours) {
    return bpt::microseconds(static_cast<int64_t>(std::llround(hours * 3600.0 * 1e6)));
}

double durationHours(const bpt::time_duration& d) {
    return static_cast<double>(d.total_microseconds()) / (3600.0 * 1e6);
}

bg::date localDate(const bpt::ptime& utc, const blt::time_zone_ptr& zone) {
    return blt::local_date_time(utc, zone).local_time().date();
}

// Local wall-clock time on a given day to UTC. Times that do not exist or are
// ambiguous around a DST switch fall back to the zone's standard offset.
bpt::ptime localToUtc(bg::date day, bpt::time_duration td, const blt::time_zone_ptr& zone) {
    if (td >= bpt::hours(24)) {
        day += bg::days(td.hours() / 24);
        td -= bpt::hours(24 * (td.hours() / 24));
    }
    blt::local_date_time ldt(day, td, zone, blt::local_date_time::NOT_DATE_TIME_ON_ERROR);
    if (!ldt.is_not_a_date_time())
        return ldt.utc_time();
    return bpt::ptime(day, td) - zone->base_utc_offset();
}

bool looksLikePosixSpec(const std::string& name) {
    size_t letters = 0;
    while (letters < name.size() && std::isalpha(static_cast<unsigned char>(name[letters])))
        ++letters;
    return letters >= 3 && name.find('/') == std::string::npos;
}

} // namespace

Result<blt::time_zone_ptr> resolveTimeZone(const config::BusinessHoursConfig& config) {
    const std::string& name = config.timezone;

    if (!config.timezoneDatabase.empty()) {
        blt::tz_database db;
        try {
            db.load_from_file(config.timezoneDatabase);
        } catch (const std::exception& e) {
            return Error{ErrorCode::UnknownTimeZone, "Failed to load time zone database '" +
                                                         config.timezoneDatabase +
                                                         "': " + e.what()};
        }
        if (auto zone = db.time_zone_from_region(name)) {
            return zone;
        }
        if (!looksLikePosixSpec(name)) {
            return Error{ErrorCode::UnknownTimeZone,
                         "Region '" + name + "' not found in " + config.timezoneDatabase};
        }
    }

    if (!looksLikePosixSpec(name)) {
        return Error{ErrorCode::UnknownTimeZone,
                     "'" + name +
                         "' is not a POSIX zone spec; region names need a zone database file"};
    }

    try {
        return blt::time_zone_ptr(boost::make_shared<blt::posix_time_zone>(name));
    } catch (const std::exception& e) {
        return Error{ErrorCode::UnknownTimeZone,
                     "Invalid POSIX zone spec '" + name + "': " + e.what()};
    }
}

BusinessHoursCalculator::BusinessHoursCalculator(config::BusinessHoursConfig config,
                                                 blt::time_zone_ptr zone)
    : config_(std::move(config)), zone_(std::move(zone)) {}

Result<BusinessHoursCalculator>
BusinessHoursCalculator::create(const config::BusinessHoursConfig& config) {
    if (auto valid = config.validate(); !valid) {
        return valid.error();
    }
    auto zone = resolveTimeZone(config);
    if (!zone) {
        return zone.error();
    }
    spdlog::debug("BusinessHoursCalculator: window {}..{}h, cap {}h/day, zone '{}'",
                  config.officeStartHour, config.officeEndHour, config.maxHoursPerDay,
                  config.timezone);
    return BusinessHoursCalculator(config, zone.value());
}

double BusinessHoursCalculator::overlapHours(TimePoint start, TimePoint end) const {
    if (end <= start)
        return 0.0;

    const bpt::ptime from = toPtime(start);
    const bpt::ptime to = toPtime(end);
    const bpt::time_duration officeStart = hoursToDuration(config_.officeStartHour);
    const bpt::time_duration officeEnd = hoursToDuration(config_.officeEndHour);

    double total = 0.0;
    const bg::date lastDay = localDate(to, zone_);
    for (bg::date day = localDate(from, zone_); day <= lastDay; day += bg::days(1)) {
        if (!config_.workingWeekdays[day.day_of_week().as_number()])
            continue;

        const bpt::ptime windowStart = std::max(from, localToUtc(day, officeStart, zone_));
        const bpt::ptime windowEnd = std::min(to, localToUtc(day, officeEnd, zone_));
        if (windowStart >= windowEnd)
            continue;

        total += std::min(durationHours(windowEnd - windowStart), config_.maxHoursPerDay);
    }
    return total;
}

Result<double> overlapHours(TimePoint start, TimePoint end,
                            const config::BusinessHoursConfig& config) {
    auto calculator = BusinessHoursCalculator::create(config);
    if (!calculator) {
        return calculator.error();
    }
    return calculator.value().overlapHours(start, end);
}

} // namespace devscore::timing
