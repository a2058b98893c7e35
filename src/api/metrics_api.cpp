#include <devscore/api/metrics_api.h>

namespace devscore::api {

Result<timing::TimeBreakdown>
computeTimeBreakdown(const std::vector<timing::StateChange>& events,
                     const config::StateCategoryConfig& stateCategoryConfig,
                     const config::BusinessHoursConfig& businessHoursConfig,
                     const timing::AccumulateOptions& options) {
    auto categories = config::StateCategoryMap::build(stateCategoryConfig);
    if (!categories) {
        return categories.error();
    }
    auto hours = timing::BusinessHoursCalculator::create(businessHoursConfig);
    if (!hours) {
        return hours.error();
    }
    timing::StateTransitionStack stack(hours.value(), categories.value(), options);
    return stack.accumulate(events);
}

Result<scoring::WorkItemMetrics>
computeWorkItemMetrics(const timing::TimeBreakdown& breakdown,
                       std::optional<double> estimatedHours, bool isCompleted,
                       std::optional<TimePoint> targetDate, std::optional<TimePoint> closedDate,
                       const config::EfficiencyConfig& scoringConfig) {
    auto calculator = scoring::EfficiencyCalculator::create(scoringConfig);
    if (!calculator) {
        return calculator.error();
    }
    return calculator.value().score(breakdown, estimatedHours, isCompleted, targetDate,
                                    closedDate);
}

Result<scoring::DeveloperSummary>
computeDeveloperSummary(const std::vector<scoring::WorkItemMetrics>& items,
                        const config::DeveloperScoreWeights& weights,
                        const config::SummaryConfig& summary) {
    auto aggregator = scoring::DeveloperScoreAggregator::create(weights, summary);
    if (!aggregator) {
        return aggregator.error();
    }
    return aggregator.value().summarize(items);
}

} // namespace devscore::api
