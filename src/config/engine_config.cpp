#include <devscore/config/config_helpers.h>
#include <devscore/config/engine_config.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <sstream>

namespace devscore::config {

std::vector<DeliveryTier> defaultDeliveryTiers() {
    return {
        {"very_early", -4, 130.0, 0.0, 1.0},     {"early", -2, 120.0, 0.0, 0.5},
        {"slightly_early", 0, 110.0, 0.0, 0.25}, {"on_time", 1, 100.0, 0.0, 0.0},
        {"late_1_3", 4, 95.0, 2.0, 0.0},         {"late_4_7", 8, 90.0, 4.0, 0.0},
        {"late_8_14", 15, 85.0, 6.0, 0.0},       {"late_15_plus", std::nullopt, 70.0, 8.0, 0.0},
    };
}

Result<void> BusinessHoursConfig::validate() const {
    if (!std::isfinite(officeStartHour) || !std::isfinite(officeEndHour) ||
        officeStartHour < 0.0 || officeEndHour > 24.0 || officeStartHour >= officeEndHour) {
        std::ostringstream msg;
        msg << "Office hours must satisfy 0 <= start < end <= 24 (got " << officeStartHour
            << ".." << officeEndHour << ")";
        return Error{ErrorCode::InvalidConfiguration, msg.str()};
    }
    if (!std::isfinite(maxHoursPerDay) || maxHoursPerDay <= 0.0) {
        return Error{ErrorCode::InvalidConfiguration, "maxHoursPerDay must be positive"};
    }
    if (timezone.empty()) {
        return Error{ErrorCode::InvalidConfiguration, "Time zone must not be empty"};
    }
    if (std::none_of(workingWeekdays.begin(), workingWeekdays.end(), [](bool d) { return d; })) {
        return Error{ErrorCode::InvalidConfiguration, "At least one working weekday is required"};
    }
    return {};
}

Result<void> EfficiencyConfig::validate() const {
    if (!is_finite_non_negative(completionBonusPct)) {
        return Error{ErrorCode::InvalidConfiguration, "completionBonusPct must be >= 0"};
    }
    if (!std::isfinite(maxEfficiencyCap) || maxEfficiencyCap <= 0.0) {
        return Error{ErrorCode::InvalidConfiguration, "maxEfficiencyCap must be positive"};
    }
    if (activeHoursCapMultiplier &&
        (!std::isfinite(*activeHoursCapMultiplier) || *activeHoursCapMultiplier <= 0.0)) {
        return Error{ErrorCode::InvalidConfiguration, "activeHoursCapMultiplier must be positive"};
    }
    if (deliveryTiers.empty()) {
        return Error{ErrorCode::InvalidConfiguration, "At least one delivery tier is required"};
    }

    std::optional<int> previousBound;
    for (size_t i = 0; i < deliveryTiers.size(); ++i) {
        const auto& tier = deliveryTiers[i];
        const bool last = (i + 1 == deliveryTiers.size());
        if (tier.name.empty()) {
            return Error{ErrorCode::InvalidConfiguration, "Delivery tier without a name"};
        }
        if (!last && !tier.upperBoundDays) {
            return Error{ErrorCode::InvalidConfiguration,
                         "Only the last delivery tier may be unbounded ('" + tier.name + "')"};
        }
        if (last && tier.upperBoundDays) {
            return Error{ErrorCode::InvalidConfiguration,
                         "The last delivery tier must be unbounded ('" + tier.name + "')"};
        }
        if (tier.upperBoundDays && previousBound && *tier.upperBoundDays <= *previousBound) {
            return Error{ErrorCode::InvalidConfiguration,
                         "Delivery tier bounds must be strictly increasing ('" + tier.name + "')"};
        }
        if (!std::isfinite(tier.score) || !is_finite_non_negative(tier.mitigationHours) ||
            !is_finite_non_negative(tier.bonusHoursPerDayEarly)) {
            return Error{ErrorCode::InvalidConfiguration,
                         "Delivery tier '" + tier.name + "' has an invalid score or hours"};
        }
        if (tier.upperBoundDays)
            previousBound = tier.upperBoundDays;
    }
    return {};
}

Result<void> DeveloperScoreWeights::validate() const {
    for (double w : {fairEfficiency, delivery, completionRate, onTime}) {
        if (!is_finite_non_negative(w)) {
            return Error{ErrorCode::InvalidWeights, "Score weights must be finite and >= 0"};
        }
    }
    const double total = sum();
    if (std::abs(total - 1.0) > kTolerance) {
        std::ostringstream msg;
        msg << "Score weights must sum to 1.0 (fair_efficiency=" << fairEfficiency
            << ", delivery=" << delivery << ", completion_rate=" << completionRate
            << ", on_time=" << onTime << ", sum=" << total << ")";
        return Error{ErrorCode::InvalidWeights, msg.str()};
    }
    return {};
}

Result<void> EngineConfig::validate() const {
    for (auto result : {states.validate(), businessHours.validate(), efficiency.validate(),
                        weights.validate()}) {
        if (!result) {
            spdlog::error("Configuration rejected: {}", result.error().message);
            return result.error();
        }
    }
    return {};
}

} // namespace devscore::config
