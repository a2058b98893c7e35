#pragma once

#include <devscore/config/engine_config.h>
#include <devscore/core/types.h>
#include <devscore/scoring/developer_score.h>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace devscore::scoring {

// Average wall-clock time items spend in one raw state.
struct Bottleneck {
    std::string state;
    double averageHours = 0.0;
    size_t occurrences = 0; // items that visited the state
};

struct TeamOverview {
    size_t totalWorkItems = 0;
    size_t totalDevelopers = 0;
    std::optional<double> averageFairEfficiency; // mean over developers with a value
    std::optional<double> averageDeliveryScore;
    double totalActiveHours = 0.0;
};

struct TeamSummary {
    TeamOverview overall;
    std::map<std::string, DeveloperSummary> developers;
    std::vector<Bottleneck> bottlenecks; // slowest first
};

/**
 * @brief Rank states by average time spent in them across all scored items,
 * slowest first, ties broken by name. Ignored items are skipped.
 */
std::vector<Bottleneck> findBottlenecks(
    const std::map<std::string, std::vector<WorkItemMetrics>>& itemsByDeveloper, size_t limit);

/**
 * @brief Summaries for every developer plus team-wide averages and bottlenecks.
 *
 * @param assignedCounts Optional per-developer assigned counts across all
 *        states, forwarded as totalAssigned to the aggregator.
 */
Result<TeamSummary>
summarizeTeam(const std::map<std::string, std::vector<WorkItemMetrics>>& itemsByDeveloper,
              const config::DeveloperScoreWeights& weights, const config::SummaryConfig& summary,
              const std::map<std::string, size_t>& assignedCounts = {});

} // namespace devscore::scoring
