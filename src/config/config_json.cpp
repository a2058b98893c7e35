#include <devscore/config/config_json.h>

#include <spdlog/spdlog.h>

#include <fstream>
#include <set>
#include <stdexcept>

namespace devscore::config {

using nlohmann::json;

namespace {

// Semantic errors found while reading a structurally valid document.
struct ConfigValueError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

void warnUnknownKeys(const json& j, const std::set<std::string>& known, const char* section) {
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!known.contains(it.key())) {
            spdlog::warn("Ignoring unknown config key '{}{}{}'", section, *section ? "." : "",
                         it.key());
        }
    }
}

void requireObject(const json& j, const char* section) {
    if (!j.is_object()) {
        throw ConfigValueError(std::string(section) + " must be an object");
    }
}

template <typename T> void readInto(const json& j, const char* key, T& out) {
    if (auto it = j.find(key); it != j.end()) {
        out = it->get<T>();
    }
}

template <typename T> void readOptional(const json& j, const char* key, std::optional<T>& out) {
    if (auto it = j.find(key); it != j.end()) {
        if (it->is_null())
            out.reset();
        else
            out = it->get<T>();
    }
}

void applyStates(const json& j, StateCategoryConfig& states) {
    requireObject(j, "states");
    warnUnknownKeys(j, {"assigned", "productive", "paused", "completion", "ignored", "unmapped"},
                    "states");
    readInto(j, "assigned", states.assignedStates);
    readInto(j, "productive", states.productiveStates);
    readInto(j, "paused", states.pausedStates);
    readInto(j, "completion", states.completionStates);
    readInto(j, "ignored", states.ignoredStates);

    if (auto it = j.find("unmapped"); it != j.end()) {
        if (it->is_null()) {
            states.unmappedCategory.reset();
        } else {
            const auto name = it->get<std::string>();
            auto category = stateCategoryFromString(name);
            if (!category) {
                throw ConfigValueError("states.unmapped: unknown category '" + name + "'");
            }
            states.unmappedCategory = *category;
        }
    }
}

void applyBusinessHours(const json& j, BusinessHoursConfig& hours) {
    requireObject(j, "business_hours");
    warnUnknownKeys(j,
                    {"office_start_hour", "office_end_hour", "max_hours_per_day", "timezone",
                     "timezone_database", "working_weekdays"},
                    "business_hours");
    readInto(j, "office_start_hour", hours.officeStartHour);
    readInto(j, "office_end_hour", hours.officeEndHour);
    readInto(j, "max_hours_per_day", hours.maxHoursPerDay);
    readInto(j, "timezone", hours.timezone);
    readInto(j, "timezone_database", hours.timezoneDatabase);

    // Listed as weekday numbers, Sunday = 0.
    if (auto it = j.find("working_weekdays"); it != j.end()) {
        hours.workingWeekdays.fill(false);
        for (const auto& day : *it) {
            const int d = day.get<int>();
            if (d < 0 || d > 6) {
                throw ConfigValueError("business_hours.working_weekdays: " + std::to_string(d) +
                                       " not in 0..6");
            }
            hours.workingWeekdays[static_cast<size_t>(d)] = true;
        }
    }
}

DeliveryTier tierFromJson(const json& j) {
    requireObject(j, "efficiency.delivery_tiers[]");
    DeliveryTier tier;
    tier.name = j.at("name").get<std::string>();
    readOptional(j, "upper_bound_days", tier.upperBoundDays);
    readInto(j, "score", tier.score);
    readInto(j, "mitigation_hours", tier.mitigationHours);
    readInto(j, "bonus_hours_per_day_early", tier.bonusHoursPerDayEarly);
    return tier;
}

void applyEfficiency(const json& j, EfficiencyConfig& efficiency) {
    requireObject(j, "efficiency");
    warnUnknownKeys(j,
                    {"completion_bonus_pct", "max_efficiency_cap", "active_hours_cap_multiplier",
                     "delivery_tiers"},
                    "efficiency");
    readInto(j, "completion_bonus_pct", efficiency.completionBonusPct);
    readInto(j, "max_efficiency_cap", efficiency.maxEfficiencyCap);
    readOptional(j, "active_hours_cap_multiplier", efficiency.activeHoursCapMultiplier);

    // A tier list replaces the default table wholesale.
    if (auto it = j.find("delivery_tiers"); it != j.end()) {
        efficiency.deliveryTiers.clear();
        for (const auto& tier : *it) {
            efficiency.deliveryTiers.push_back(tierFromJson(tier));
        }
    }
}

void applyWeights(const json& j, DeveloperScoreWeights& weights) {
    requireObject(j, "weights");
    warnUnknownKeys(j, {"fair_efficiency", "delivery", "completion_rate", "on_time"}, "weights");
    readInto(j, "fair_efficiency", weights.fairEfficiency);
    readInto(j, "delivery", weights.delivery);
    readInto(j, "completion_rate", weights.completionRate);
    readInto(j, "on_time", weights.onTime);
}

void applySummary(const json& j, SummaryConfig& summary) {
    requireObject(j, "summary");
    warnUnknownKeys(j,
                    {"min_items_for_scoring", "bottleneck_limit", "apply_confidence_adjustment"},
                    "summary");
    readInto(j, "min_items_for_scoring", summary.minItemsForScoring);
    readInto(j, "bottleneck_limit", summary.bottleneckLimit);
    readInto(j, "apply_confidence_adjustment", summary.applyConfidenceAdjustment);
}

} // namespace

Result<EngineConfig> engineConfigFromJson(const json& j) {
    EngineConfig config;
    try {
        requireObject(j, "config");
        warnUnknownKeys(j, {"states", "business_hours", "efficiency", "weights", "summary"}, "");
        if (auto it = j.find("states"); it != j.end())
            applyStates(*it, config.states);
        if (auto it = j.find("business_hours"); it != j.end())
            applyBusinessHours(*it, config.businessHours);
        if (auto it = j.find("efficiency"); it != j.end())
            applyEfficiency(*it, config.efficiency);
        if (auto it = j.find("weights"); it != j.end())
            applyWeights(*it, config.weights);
        if (auto it = j.find("summary"); it != j.end())
            applySummary(*it, config.summary);
    } catch (const json::exception& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return Error{ErrorCode::InvalidConfiguration, e.what()};
    } catch (const ConfigValueError& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return Error{ErrorCode::InvalidConfiguration, e.what()};
    }

    if (auto valid = config.validate(); !valid) {
        return valid.error();
    }
    return config;
}

Result<EngineConfig> loadEngineConfig(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::NotFound, "Cannot open config file: " + path.string()};
    }
    try {
        return engineConfigFromJson(json::parse(in));
    } catch (const json::parse_error& e) {
        spdlog::error("Failed to parse {}: {}", path.string(), e.what());
        return Error{ErrorCode::InvalidConfiguration,
                     "Failed to parse " + path.string() + ": " + e.what()};
    }
}

json toJson(const StateCategoryConfig& states) {
    json j;
    j["assigned"] = states.assignedStates;
    j["productive"] = states.productiveStates;
    j["paused"] = states.pausedStates;
    j["completion"] = states.completionStates;
    j["ignored"] = states.ignoredStates;
    if (states.unmappedCategory)
        j["unmapped"] = stateCategoryToString(*states.unmappedCategory);
    else
        j["unmapped"] = nullptr;
    return j;
}

json toJson(const BusinessHoursConfig& hours) {
    json j;
    j["office_start_hour"] = hours.officeStartHour;
    j["office_end_hour"] = hours.officeEndHour;
    j["max_hours_per_day"] = hours.maxHoursPerDay;
    j["timezone"] = hours.timezone;
    if (!hours.timezoneDatabase.empty())
        j["timezone_database"] = hours.timezoneDatabase;
    j["working_weekdays"] = json::array();
    for (size_t d = 0; d < hours.workingWeekdays.size(); ++d) {
        if (hours.workingWeekdays[d])
            j["working_weekdays"].push_back(d);
    }
    return j;
}

json toJson(const EfficiencyConfig& efficiency) {
    json j;
    j["completion_bonus_pct"] = efficiency.completionBonusPct;
    j["max_efficiency_cap"] = efficiency.maxEfficiencyCap;
    if (efficiency.activeHoursCapMultiplier)
        j["active_hours_cap_multiplier"] = *efficiency.activeHoursCapMultiplier;
    else
        j["active_hours_cap_multiplier"] = nullptr;

    j["delivery_tiers"] = json::array();
    for (const auto& tier : efficiency.deliveryTiers) {
        json t;
        t["name"] = tier.name;
        if (tier.upperBoundDays)
            t["upper_bound_days"] = *tier.upperBoundDays;
        else
            t["upper_bound_days"] = nullptr;
        t["score"] = tier.score;
        t["mitigation_hours"] = tier.mitigationHours;
        t["bonus_hours_per_day_early"] = tier.bonusHoursPerDayEarly;
        j["delivery_tiers"].push_back(std::move(t));
    }
    return j;
}

json toJson(const DeveloperScoreWeights& weights) {
    return json{{"fair_efficiency", weights.fairEfficiency},
                {"delivery", weights.delivery},
                {"completion_rate", weights.completionRate},
                {"on_time", weights.onTime}};
}

json toJson(const EngineConfig& config) {
    json j;
    j["states"] = toJson(config.states);
    j["business_hours"] = toJson(config.businessHours);
    j["efficiency"] = toJson(config.efficiency);
    j["weights"] = toJson(config.weights);
    j["summary"] = json{{"min_items_for_scoring", config.summary.minItemsForScoring},
                        {"bottleneck_limit", config.summary.bottleneckLimit},
                        {"apply_confidence_adjustment", config.summary.applyConfidenceAdjustment}};
    return j;
}

} // namespace devscore::config
