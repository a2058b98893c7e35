#pragma once

#include <devscore/config/engine_config.h>
#include <devscore/config/state_category.h>
#include <devscore/core/types.h>
#include <devscore/scoring/efficiency_calculator.h>
#include <devscore/scoring/team_summary.h>
#include <devscore/timing/business_hours.h>
#include <devscore/timing/state_transition_stack.h>

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace devscore::api {

/**
 * @brief One work item as materialized by the caller.
 */
struct WorkItemInput {
    WorkItemId id = 0;
    std::string developer;
    std::vector<timing::StateChange> events;
    std::optional<TimePoint> createdAt;
    std::optional<double> estimatedHours;
    std::optional<bool> isCompleted; // derived from the final state when absent
    std::optional<TimePoint> targetDate;
    std::optional<TimePoint> closedDate;
};

struct WorkItemResult {
    WorkItemId id = 0;
    std::string developer;
    timing::TimeBreakdown breakdown;
    scoring::WorkItemMetrics metrics;
};

// A per-item input error; the item is left out of every aggregate.
struct ItemIssue {
    WorkItemId itemId = 0;
    std::string developer;
    Error error;
};

// Items read from an external source, plus the entries rejected while
// reading them. Rejected entries carry whatever id and developer were readable.
struct WorkItemBatch {
    std::vector<WorkItemInput> items;
    std::vector<ItemIssue> rejected;
};

struct BatchResult {
    TimePoint asOf;
    std::vector<WorkItemResult> items; // ordered by id
    std::vector<ItemIssue> issues;     // ordered by id
    scoring::TeamSummary team;
};

struct RunOptions {
    std::optional<TimePoint> asOf; // query boundary, fixed once per run; now() if unset
    std::map<std::string, size_t> assignedCounts;
};

/**
 * @brief Scores many work items concurrently and folds them per developer.
 *
 * Items are independent, so each is accumulated and scored on a
 * boost::asio::thread_pool with no shared mutable state; results land in
 * per-item slots and are folded on the calling thread afterwards.
 */
class BatchProcessor {
public:
    /**
     * @param workers Pool size; 0 uses the hardware concurrency.
     */
    static Result<BatchProcessor> create(config::EngineConfig config, size_t workers = 0);

    /**
     * @brief Fails only on a config error; input errors become issues.
     */
    Result<BatchResult> run(const std::vector<WorkItemInput>& items,
                            const RunOptions& options = {}) const;

    /**
     * @brief As run(); entries rejected while reading are reported as issues.
     */
    Result<BatchResult> runBatch(const WorkItemBatch& batch, const RunOptions& options = {}) const;

    /**
     * @brief Accumulate and score a single item against a fixed boundary.
     */
    Result<WorkItemResult> processItem(const WorkItemInput& item, TimePoint asOf) const;

    size_t workers() const { return workers_; }
    const config::EngineConfig& config() const { return config_; }

private:
    BatchProcessor(config::EngineConfig config,
                   std::shared_ptr<const timing::BusinessHoursCalculator> hours,
                   std::shared_ptr<const config::StateCategoryMap> categories,
                   std::shared_ptr<const scoring::EfficiencyCalculator> efficiency,
                   size_t workers);

    Result<BatchResult> runItems(const std::vector<WorkItemInput>& items,
                                 const std::vector<ItemIssue>& rejected,
                                 const RunOptions& options) const;

    config::EngineConfig config_;
    std::shared_ptr<const timing::BusinessHoursCalculator> hours_;
    std::shared_ptr<const config::StateCategoryMap> categories_;
    std::shared_ptr<const scoring::EfficiencyCalculator> efficiency_;
    size_t workers_;
};

} // namespace devscore::api
