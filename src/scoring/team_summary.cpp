#include <devscore/scoring/team_summary.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace devscore::scoring {

std::vector<Bottleneck> findBottlenecks(
    const std::map<std::string, std::vector<WorkItemMetrics>>& itemsByDeveloper, size_t limit) {
    struct Accum {
        double totalHours = 0.0;
        size_t count = 0;
    };
    std::map<std::string, Accum> byState;

    for (const auto& [developer, items] : itemsByDeveloper) {
        for (const auto& item : items) {
            if (item.ignored)
                continue;
            for (const auto& [state, hours] : item.stateHours) {
                auto& a = byState[state];
                a.totalHours += hours;
                ++a.count;
            }
        }
    }

    std::vector<Bottleneck> out;
    out.reserve(byState.size());
    for (const auto& [state, a] : byState) {
        out.push_back(Bottleneck{state, a.totalHours / static_cast<double>(a.count), a.count});
    }

    std::ranges::stable_sort(out, [](const Bottleneck& a, const Bottleneck& b) {
        if (a.averageHours != b.averageHours)
            return a.averageHours > b.averageHours;
        return a.state < b.state;
    });
    if (out.size() > limit)
        out.resize(limit);
    return out;
}

Result<TeamSummary>
summarizeTeam(const std::map<std::string, std::vector<WorkItemMetrics>>& itemsByDeveloper,
              const config::DeveloperScoreWeights& weights, const config::SummaryConfig& summary,
              const std::map<std::string, size_t>& assignedCounts) {
    auto aggregator = DeveloperScoreAggregator::create(weights, summary);
    if (!aggregator) {
        return aggregator.error();
    }

    TeamSummary team;
    double efficiencySum = 0.0;
    size_t efficiencyCount = 0;
    double deliverySum = 0.0;
    size_t deliveryCount = 0;

    for (const auto& [developer, items] : itemsByDeveloper) {
        std::optional<size_t> assigned;
        if (auto it = assignedCounts.find(developer); it != assignedCounts.end())
            assigned = it->second;

        DeveloperSummary s = aggregator.value().summarize(items, developer, assigned);
        team.overall.totalWorkItems += items.size();
        team.overall.totalActiveHours += s.totalActiveHours;
        if (s.avgFairEfficiency) {
            efficiencySum += *s.avgFairEfficiency;
            ++efficiencyCount;
        }
        if (s.avgDeliveryScore) {
            deliverySum += *s.avgDeliveryScore;
            ++deliveryCount;
        }
        team.developers.emplace(developer, std::move(s));
    }

    team.overall.totalDevelopers = team.developers.size();
    if (efficiencyCount > 0)
        team.overall.averageFairEfficiency = efficiencySum / static_cast<double>(efficiencyCount);
    if (deliveryCount > 0)
        team.overall.averageDeliveryScore = deliverySum / static_cast<double>(deliveryCount);
    team.bottlenecks = findBottlenecks(itemsByDeveloper, summary.bottleneckLimit);

    spdlog::debug("team summary: {} developers, {} items, {} bottlenecks",
                  team.overall.totalDevelopers, team.overall.totalWorkItems,
                  team.bottlenecks.size());
    return team;
}

} // namespace devscore::scoring
