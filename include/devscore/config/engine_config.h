#pragma once

#include <devscore/config/state_category.h>
#include <devscore/core/types.h>

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace devscore::config {

/**
 * @brief Office-hours window used to turn wall-clock spans into working hours.
 *
 * Hours are local wall-clock hours in @ref timezone. Weekdays are indexed
 * Sunday = 0 through Saturday = 6.
 */
struct BusinessHoursConfig {
    double officeStartHour = 9.0;
    double officeEndHour = 17.0;
    double maxHoursPerDay = 8.0;

    // POSIX zone spec as understood by Boost.DateTime ("CST-06",
    // "EST-05EDT,M3.2.0/2,M11.1.0/2", "UTC"), or an IANA region name when
    // timezoneDatabase points at a Boost zone CSV.
    std::string timezone = "CST-06";
    std::string timezoneDatabase;

    std::array<bool, 7> workingWeekdays = {false, true, true, true, true, true, false};

    Result<void> validate() const;
};

/**
 * @brief One row of the delivery tier table.
 *
 * Tiers are evaluated in order and the first tier whose exclusive upper bound
 * exceeds daysAheadBehind wins; the last tier has no upper bound.
 */
struct DeliveryTier {
    std::string name;
    std::optional<int> upperBoundDays; // exclusive; nullopt = unbounded
    double score = 100.0;
    double mitigationHours = 0.0;
    double bonusHoursPerDayEarly = 0.0; // informational timing bonus for early tiers
};

/**
 * @brief Default tier table:
 * | days      | tier           | score | mitigation |
 * |-----------|----------------|------:|-----------:|
 * | <= -5     | very_early     |   130 |          0 |
 * | -4..-3    | early          |   120 |          0 |
 * | -2..-1    | slightly_early |   110 |          0 |
 * | 0         | on_time        |   100 |          0 |
 * | 1..3      | late_1_3       |    95 |          2 |
 * | 4..7      | late_4_7       |    90 |          4 |
 * | 8..14     | late_8_14      |    85 |          6 |
 * | >= 15     | late_15_plus   |    70 |          8 |
 */
std::vector<DeliveryTier> defaultDeliveryTiers();

struct EfficiencyConfig {
    double completionBonusPct = 0.20;
    double maxEfficiencyCap = 150.0;

    // Caps credited active hours at multiplier x estimate when set.
    std::optional<double> activeHoursCapMultiplier;

    std::vector<DeliveryTier> deliveryTiers = defaultDeliveryTiers();

    Result<void> validate() const;
};

struct DeveloperScoreWeights {
    double fairEfficiency = 0.25;
    double delivery = 0.50;
    double completionRate = 0.15;
    double onTime = 0.10;

    static constexpr double kTolerance = 1e-6;

    double sum() const { return fairEfficiency + delivery + completionRate + onTime; }

    /**
     * @brief InvalidWeights unless the four weights are non-negative and sum to 1.0.
     */
    Result<void> validate() const;
};

struct SummaryConfig {
    size_t minItemsForScoring = 3;
    size_t bottleneckLimit = 5;
    bool applyConfidenceAdjustment = false;
};

/**
 * @brief Everything a scoring run needs, passed by value into each call.
 */
struct EngineConfig {
    StateCategoryConfig states;
    BusinessHoursConfig businessHours;
    EfficiencyConfig efficiency;
    DeveloperScoreWeights weights;
    SummaryConfig summary;

    Result<void> validate() const;
};

} // namespace devscore::config
