#include <devscore/scoring/developer_score.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace devscore::scoring {

namespace {

double percent(size_t part, size_t whole) {
    return whole > 0 ? static_cast<double>(part) / static_cast<double>(whole) * 100.0 : 0.0;
}

} // namespace

double overallScore(double avgFairEfficiency, double avgDeliveryScore, double completionRate,
                    double onTimeRate, const config::DeveloperScoreWeights& weights) {
    return avgFairEfficiency * weights.fairEfficiency + avgDeliveryScore * weights.delivery +
           completionRate * weights.completionRate + std::min(100.0, onTimeRate) * weights.onTime;
}

DeveloperScoreAggregator::DeveloperScoreAggregator(config::DeveloperScoreWeights weights,
                                                   config::SummaryConfig summary)
    : weights_(weights), summary_(summary) {}

Result<DeveloperScoreAggregator>
DeveloperScoreAggregator::create(const config::DeveloperScoreWeights& weights,
                                 const config::SummaryConfig& summary) {
    if (auto valid = weights.validate(); !valid) {
        spdlog::error("DeveloperScoreAggregator: {}", valid.error().message);
        return valid.error();
    }
    return DeveloperScoreAggregator(weights, summary);
}

DeveloperSummary DeveloperScoreAggregator::summarize(std::vector<WorkItemMetrics> items,
                                                     const std::string& developer,
                                                     std::optional<size_t> totalAssigned) const {
    std::stable_sort(items.begin(), items.end(),
                     [](const WorkItemMetrics& a, const WorkItemMetrics& b) {
                         return a.itemId < b.itemId;
                     });

    DeveloperSummary s;
    s.developer = developer;
    s.totalItems = totalAssigned.value_or(items.size());

    double efficiencySum = 0.0;
    size_t efficiencyCount = 0;
    double deliverySum = 0.0;
    size_t deliveryCount = 0;
    double daysSum = 0.0;
    size_t itemsWithData = 0;

    for (const auto& item : items) {
        if (item.isCompleted)
            ++s.completedItems;
        s.totalActiveHours += item.activeHours;
        s.totalEstimatedHours += item.estimatedHours;

        if (item.ignored)
            continue;

        if (item.hasTransitionData) {
            ++itemsWithData;
            if (item.wasReopened)
                ++s.reopenedItems;
        }
        if (item.estimatedHours > 0.0)
            ++s.itemsWithEstimate;

        if (item.hasTiming()) {
            ++s.itemsWithTiming;
            daysSum += *item.daysAheadBehind;
            if (*item.daysAheadBehind <= 0)
                ++s.onTimeItems;
            if (item.deliveryTier)
                ++s.deliveryTimingBreakdown[*item.deliveryTier];
        }

        if (!item.eligible)
            continue;
        ++s.eligibleItems;
        if (item.fairEfficiencyPct) {
            efficiencySum += *item.fairEfficiencyPct;
            ++efficiencyCount;
        }
        if (item.deliveryScore) {
            deliverySum += *item.deliveryScore;
            ++deliveryCount;
        }
    }

    s.completionRate = percent(s.completedItems, s.totalItems);
    if (s.itemsWithTiming > 0) {
        s.onTimeRate = percent(s.onTimeItems, s.itemsWithTiming);
        s.avgDaysAheadBehind = daysSum / static_cast<double>(s.itemsWithTiming);
    }
    if (deliveryCount > 0)
        s.avgDeliveryScore = deliverySum / static_cast<double>(deliveryCount);

    const double confidence = s.itemsWithEstimate > 0 ? static_cast<double>(efficiencyCount) /
                                                            static_cast<double>(s.itemsWithEstimate)
                                                      : 0.0;
    s.sampleConfidencePct = confidence * 100.0;
    if (efficiencyCount > 0) {
        double avg = efficiencySum / static_cast<double>(efficiencyCount);
        if (summary_.applyConfidenceAdjustment)
            avg *= std::min(1.0, confidence * 3.0);
        s.avgFairEfficiency = avg;
    }

    s.reopenedRate = percent(s.reopenedItems, itemsWithData);
    s.lowConfidence = s.totalItems < summary_.minItemsForScoring;
    s.overallScore = overallScore(s.avgFairEfficiency.value_or(0.0),
                                  s.avgDeliveryScore.value_or(0.0), s.completionRate,
                                  s.onTimeRate.value_or(0.0), weights_);

    spdlog::debug("summary '{}': items={} completed={} eligible={} timing={} score={:.2f}{}",
                  developer, s.totalItems, s.completedItems, s.eligibleItems, s.itemsWithTiming,
                  s.overallScore, s.lowConfidence ? " (low confidence)" : "");
    return s;
}

} // namespace devscore::scoring
