#pragma once

#include <devscore/config/engine_config.h>
#include <devscore/core/types.h>
#include <devscore/scoring/efficiency_calculator.h>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace devscore::scoring {

/**
 * @brief Aggregated metrics for one developer over one query window.
 *
 * Rates and averages are percentages. Averages with no contributing item are
 * absent and count as 0 in overallScore.
 */
struct DeveloperSummary {
    std::string developer;

    size_t totalItems = 0; // completion-rate denominator
    size_t completedItems = 0;
    size_t eligibleItems = 0;
    size_t itemsWithEstimate = 0;
    size_t itemsWithTiming = 0;
    size_t onTimeItems = 0;

    double completionRate = 0.0;
    std::optional<double> onTimeRate;
    std::optional<double> avgFairEfficiency;
    std::optional<double> avgDeliveryScore;
    double overallScore = 0.0;
    bool lowConfidence = false;

    double totalActiveHours = 0.0;
    double totalEstimatedHours = 0.0;
    std::optional<double> avgDaysAheadBehind;
    size_t reopenedItems = 0;
    double reopenedRate = 0.0;
    double sampleConfidencePct = 0.0;
    std::map<std::string, size_t> deliveryTimingBreakdown; // keyed by tier name
};

/**
 * @brief Weighted developer score: efficiency x W1 + delivery x W2 +
 * completion x W3 + min(100, onTime) x W4.
 */
double overallScore(double avgFairEfficiency, double avgDeliveryScore, double completionRate,
                    double onTimeRate, const config::DeveloperScoreWeights& weights);

/**
 * @brief Folds the WorkItemMetrics of one developer into a DeveloperSummary.
 *
 * The only component allowed to combine results across items. Items are
 * folded in itemId order so the sums do not depend on completion order.
 */
class DeveloperScoreAggregator {
public:
    /**
     * @brief Fails with InvalidWeights when the weights do not sum to 1.0.
     */
    static Result<DeveloperScoreAggregator> create(const config::DeveloperScoreWeights& weights,
                                                   const config::SummaryConfig& summary = {});

    /**
     * @param totalAssigned Assigned item count across all states, when the
     *        caller knows more items than it scored; defaults to items.size().
     */
    DeveloperSummary summarize(std::vector<WorkItemMetrics> items,
                               const std::string& developer = {},
                               std::optional<size_t> totalAssigned = std::nullopt) const;

    const config::DeveloperScoreWeights& weights() const { return weights_; }
    const config::SummaryConfig& summaryConfig() const { return summary_; }

private:
    DeveloperScoreAggregator(config::DeveloperScoreWeights weights,
                             config::SummaryConfig summary);

    config::DeveloperScoreWeights weights_;
    config::SummaryConfig summary_;
};

} // namespace devscore::scoring
