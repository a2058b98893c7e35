#pragma once

#include <devscore/config/engine_config.h>
#include <devscore/core/types.h>

#include <nlohmann/json.hpp>

#include <filesystem>

namespace devscore::config {

/**
 * @brief Build an EngineConfig from a JSON document.
 *
 * Keys are snake_case and every key is optional; absent keys keep their
 * defaults, so a document only has to name what it overrides:
 *
 * @code{.json}
 * {
 *   "states":        { "productive": ["Doing"], "unmapped": "ignored" },
 *   "business_hours":{ "office_start_hour": 9, "office_end_hour": 18,
 *                      "timezone": "CST-06", "working_weekdays": [1,2,3,4,5] },
 *   "efficiency":    { "completion_bonus_pct": 0.2, "delivery_tiers": [...] },
 *   "weights":       { "fair_efficiency": 0.25, "delivery": 0.5,
 *                      "completion_rate": 0.15, "on_time": 0.1 },
 *   "summary":       { "min_items_for_scoring": 3 }
 * }
 * @endcode
 *
 * Type mismatches and failed validation are InvalidConfiguration (or
 * InvalidWeights / UnknownTimeZone from validate()).
 */
Result<EngineConfig> engineConfigFromJson(const nlohmann::json& j);

/**
 * @brief Read and parse a JSON config file.
 */
Result<EngineConfig> loadEngineConfig(const std::filesystem::path& path);

nlohmann::json toJson(const StateCategoryConfig& states);
nlohmann::json toJson(const BusinessHoursConfig& hours);
nlohmann::json toJson(const EfficiencyConfig& efficiency);
nlohmann::json toJson(const DeveloperScoreWeights& weights);
nlohmann::json toJson(const EngineConfig& config);

} // namespace devscore::config
