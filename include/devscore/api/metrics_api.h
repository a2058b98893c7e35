#pragma once

#include <devscore/config/engine_config.h>
#include <devscore/core/types.h>
#include <devscore/scoring/developer_score.h>
#include <devscore/scoring/efficiency_calculator.h>
#include <devscore/timing/state_transition_stack.h>

#include <optional>
#include <vector>

namespace devscore::api {

/**
 * @brief Events + category mapping + business hours -> TimeBreakdown.
 *
 * Config errors (unknown zone, conflicting labels, unmapped label without a
 * fallback) and input errors (missing timestamp) are returned, never thrown.
 */
Result<timing::TimeBreakdown>
computeTimeBreakdown(const std::vector<timing::StateChange>& events,
                     const config::StateCategoryConfig& stateCategoryConfig,
                     const config::BusinessHoursConfig& businessHoursConfig,
                     const timing::AccumulateOptions& options = {});

/**
 * @brief TimeBreakdown + estimate + delivery dates -> WorkItemMetrics.
 */
Result<scoring::WorkItemMetrics>
computeWorkItemMetrics(const timing::TimeBreakdown& breakdown,
                       std::optional<double> estimatedHours, bool isCompleted,
                       std::optional<TimePoint> targetDate, std::optional<TimePoint> closedDate,
                       const config::EfficiencyConfig& scoringConfig);

/**
 * @brief Per-item metrics for one developer -> DeveloperSummary.
 *
 * Fails with InvalidWeights when the weights do not sum to 1.0.
 */
Result<scoring::DeveloperSummary>
computeDeveloperSummary(const std::vector<scoring::WorkItemMetrics>& items,
                        const config::DeveloperScoreWeights& weights,
                        const config::SummaryConfig& summary = {});

} // namespace devscore::api
