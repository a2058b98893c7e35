#pragma once

#include <devscore/config/engine_config.h>
#include <devscore/core/types.h>
#include <devscore/timing/state_transition_stack.h>

#include <map>
#include <optional>
#include <string>

namespace devscore::scoring {

/**
 * @brief Delivery timing of a completed item against its target date.
 */
struct DeliveryTiming {
    int daysAheadBehind = 0; // negative = early
    std::string tier;
    double deliveryScore = 100.0;
    double mitigationHours = 0.0;
    double timingBonusHours = 0.0;
};

/**
 * @brief Per-item scoring result.
 *
 * Optional fields are absent when the value is undefined for the item (no
 * timing data, zero denominator, not eligible) and are then left out of every
 * aggregate rather than counted as zero.
 */
struct WorkItemMetrics {
    WorkItemId itemId = 0;

    double estimatedHours = 0.0;
    double activeHours = 0.0;    // credited after the optional estimate cap
    double rawActiveHours = 0.0; // as accumulated
    double pausedHours = 0.0;
    double completionBonusHours = 0.0;
    double latePenaltyMitigationHours = 0.0;
    double timingBonusHours = 0.0;

    std::optional<double> fairEfficiencyPct;        // in [0, maxEfficiencyCap]
    std::optional<double> traditionalEfficiencyPct; // estimate / active, capped
    std::optional<double> deliveryScore;
    std::optional<int> daysAheadBehind;
    std::optional<std::string> deliveryTier;

    bool isCompleted = false;
    bool eligible = false; // counts toward efficiency averages
    std::string ineligibleReason;
    bool ignored = false; // final state explicitly ignored (Removed, Cancelled)
    bool hasTransitionData = false;

    bool wasReopened = false;
    int reopenCount = 0;
    double postReopenActiveHours = 0.0;
    std::map<std::string, double> stateHours;

    bool hasTiming() const { return daysAheadBehind.has_value(); }
};

/**
 * @brief Turns a TimeBreakdown plus estimate and delivery dates into
 * WorkItemMetrics. Every step is a pure function of its arguments.
 */
class EfficiencyCalculator {
public:
    static Result<EfficiencyCalculator> create(const config::EfficiencyConfig& config = {});

    /**
     * @brief Score one item.
     *
     * A missing or zero estimate, or fewer than two state events, makes the
     * item ineligible (still scored for completion and delivery). A negative
     * or non-finite estimate fails with InvalidEstimate.
     */
    Result<WorkItemMetrics> score(const timing::TimeBreakdown& breakdown,
                                  std::optional<double> estimatedHours, bool isCompleted,
                                  std::optional<TimePoint> targetDate,
                                  std::optional<TimePoint> closedDate) const;

    /**
     * @brief estimatedHours x completionBonusPct when completed, else 0.
     */
    double completionBonus(double estimatedHours, bool isCompleted) const;

    /**
     * @brief Timing for completed items with both dates; nullopt otherwise.
     */
    std::optional<DeliveryTiming> deliveryTiming(bool isCompleted,
                                                 std::optional<TimePoint> targetDate,
                                                 std::optional<TimePoint> closedDate) const;

    /**
     * @brief First tier whose exclusive upper bound exceeds daysAheadBehind.
     */
    const config::DeliveryTier& lookupTier(int daysAheadBehind) const;

    /**
     * @brief (active + bonus) / (estimate + mitigation) x 100 clamped to
     * [0, maxEfficiencyCap]; nullopt for a zero denominator.
     */
    std::optional<double> fairEfficiency(double activeHours, double completionBonusHours,
                                         double estimatedHours, double mitigationHours) const;

    /**
     * @brief floor((closed - target) / 1 day).
     */
    static int daysBetween(TimePoint targetDate, TimePoint closedDate);

    const config::EfficiencyConfig& getConfig() const { return config_; }

private:
    explicit EfficiencyCalculator(config::EfficiencyConfig config);

    config::EfficiencyConfig config_;
};

} // namespace devscore::scoring
