#pragma once

#include <devscore/config/engine_config.h>
#include <devscore/core/types.h>

#include <boost/date_time/local_time/local_time_types.hpp>

#include <string>

namespace devscore::timing {

/**
 * @brief Resolve the configured zone into Boost.DateTime zone rules.
 *
 * Accepts a POSIX zone spec, or an IANA region name when a zone database CSV
 * is configured. Fails with UnknownTimeZone.
 */
Result<boost::local_time::time_zone_ptr>
resolveTimeZone(const config::BusinessHoursConfig& config);

/**
 * @brief Measures how much of a wall-clock interval falls in working time.
 *
 * Construction validates the config and resolves the zone once; after that
 * the calculator is immutable and safe to share between threads.
 */
class BusinessHoursCalculator {
public:
    static Result<BusinessHoursCalculator> create(const config::BusinessHoursConfig& config);

    /**
     * @brief Working hours inside [start, end).
     *
     * The interval is split into local calendar days in the configured zone.
     * Each working weekday contributes its overlap with the office window,
     * capped at maxHoursPerDay; other days contribute nothing. Returns 0 for
     * end <= start.
     */
    double overlapHours(TimePoint start, TimePoint end) const;

    const config::BusinessHoursConfig& config() const { return config_; }

private:
    BusinessHoursCalculator(config::BusinessHoursConfig config,
                            boost::local_time::time_zone_ptr zone);

    config::BusinessHoursConfig config_;
    boost::local_time::time_zone_ptr zone_;
};

/**
 * @brief One-shot form of BusinessHoursCalculator::overlapHours.
 */
Result<double> overlapHours(TimePoint start, TimePoint end,
                            const config::BusinessHoursConfig& config);

} // namespace devscore::timing
