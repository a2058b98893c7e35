#include <devscore/scoring/efficiency_calculator.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace devscore::scoring {

EfficiencyCalculator::EfficiencyCalculator(config::EfficiencyConfig config)
    : config_(std::move(config)) {}

Result<EfficiencyCalculator> EfficiencyCalculator::create(const config::EfficiencyConfig& config) {
    if (auto valid = config.validate(); !valid) {
        return valid.error();
    }
    return EfficiencyCalculator(config);
}

double EfficiencyCalculator::completionBonus(double estimatedHours, bool isCompleted) const {
    if (!isCompleted || estimatedHours <= 0.0)
        return 0.0;
    return estimatedHours * config_.completionBonusPct;
}

int EfficiencyCalculator::daysBetween(TimePoint targetDate, TimePoint closedDate) {
    using Days = std::chrono::duration<double, std::ratio<86400>>;
    const double days = std::chrono::duration_cast<Days>(closedDate - targetDate).count();
    return static_cast<int>(std::floor(days));
}

const config::DeliveryTier& EfficiencyCalculator::lookupTier(int daysAheadBehind) const {
    for (const auto& tier : config_.deliveryTiers) {
        if (!tier.upperBoundDays || daysAheadBehind < *tier.upperBoundDays)
            return tier;
    }
    // validate() guarantees an unbounded last tier
    return config_.deliveryTiers.back();
}

std::optional<DeliveryTiming>
EfficiencyCalculator::deliveryTiming(bool isCompleted, std::optional<TimePoint> targetDate,
                                     std::optional<TimePoint> closedDate) const {
    if (!isCompleted || !targetDate || !closedDate)
        return std::nullopt;

    DeliveryTiming timing;
    timing.daysAheadBehind = daysBetween(*targetDate, *closedDate);
    const auto& tier = lookupTier(timing.daysAheadBehind);
    timing.tier = tier.name;
    timing.deliveryScore = tier.score;
    timing.mitigationHours = tier.mitigationHours;
    if (timing.daysAheadBehind < 0) {
        timing.timingBonusHours =
            static_cast<double>(-timing.daysAheadBehind) * tier.bonusHoursPerDayEarly;
    }
    return timing;
}

std::optional<double> EfficiencyCalculator::fairEfficiency(double activeHours,
                                                           double completionBonusHours,
                                                           double estimatedHours,
                                                           double mitigationHours) const {
    const double denominator = estimatedHours + mitigationHours;
    if (denominator <= 0.0)
        return std::nullopt;
    const double pct = (activeHours + completionBonusHours) / denominator * 100.0;
    return std::clamp(pct, 0.0, config_.maxEfficiencyCap);
}

Result<WorkItemMetrics> EfficiencyCalculator::score(const timing::TimeBreakdown& breakdown,
                                                    std::optional<double> estimatedHours,
                                                    bool isCompleted,
                                                    std::optional<TimePoint> targetDate,
                                                    std::optional<TimePoint> closedDate) const {
    if (estimatedHours && (!std::isfinite(*estimatedHours) || *estimatedHours < 0.0)) {
        return Error{ErrorCode::InvalidEstimate,
                     "Estimated hours must be a finite, non-negative number"};
    }

    WorkItemMetrics m;
    m.estimatedHours = estimatedHours.value_or(0.0);
    m.rawActiveHours = breakdown.activeHours;
    m.pausedHours = breakdown.pausedHours;
    m.hasTransitionData = breakdown.hasTransitions;
    m.wasReopened = breakdown.wasReopened;
    m.reopenCount = breakdown.reopenCount;
    m.postReopenActiveHours = breakdown.postReopenActiveHours;
    m.stateHours = breakdown.stateHours;

    if (breakdown.shouldIgnore) {
        m.ignored = true;
        m.ineligibleReason = "ignored_state";
        return m;
    }

    m.isCompleted = isCompleted;
    const bool hasEstimate = m.estimatedHours > 0.0;

    // Without an estimate there is nothing to hold active time against.
    if (!hasEstimate) {
        m.activeHours = 0.0;
    } else if (config_.activeHoursCapMultiplier) {
        m.activeHours =
            std::min(m.rawActiveHours, m.estimatedHours * *config_.activeHoursCapMultiplier);
    } else {
        m.activeHours = m.rawActiveHours;
    }

    m.completionBonusHours = completionBonus(m.estimatedHours, isCompleted);

    if (auto timing = deliveryTiming(isCompleted, targetDate, closedDate)) {
        m.daysAheadBehind = timing->daysAheadBehind;
        m.deliveryTier = timing->tier;
        m.deliveryScore = timing->deliveryScore;
        m.latePenaltyMitigationHours = timing->mitigationHours;
        m.timingBonusHours = timing->timingBonusHours;
    }

    if (!hasEstimate) {
        m.ineligibleReason = "no_estimate";
    } else if (!breakdown.hasTransitions) {
        m.ineligibleReason = "no_transitions";
    } else {
        m.eligible = true;
    }

    if (m.eligible) {
        m.fairEfficiencyPct = fairEfficiency(m.activeHours, m.completionBonusHours,
                                             m.estimatedHours, m.latePenaltyMitigationHours);
        if (m.activeHours > 0.0) {
            m.traditionalEfficiencyPct =
                std::min(m.estimatedHours / m.activeHours * 100.0, config_.maxEfficiencyCap);
        }
    }

    spdlog::debug("score item {}: est={:.2f}h active={:.2f}h bonus={:.2f}h mitigation={:.2f}h "
                  "eligible={} reason='{}'",
                  m.itemId, m.estimatedHours, m.activeHours, m.completionBonusHours,
                  m.latePenaltyMitigationHours, m.eligible, m.ineligibleReason);
    return m;
}

} // namespace devscore::scoring
