#pragma once

#include <devscore/api/batch_processor.h>
#include <devscore/core/types.h>
#include <devscore/scoring/developer_score.h>
#include <devscore/scoring/efficiency_calculator.h>
#include <devscore/scoring/team_summary.h>
#include <devscore/timing/state_transition_stack.h>

#include <nlohmann/json.hpp>

#include <vector>

namespace devscore::api {

// Report serialization. Absent optional values are written as null so that
// "unknown" never reads as zero.
nlohmann::json toJson(const timing::TimeBreakdown& breakdown);
nlohmann::json toJson(const scoring::WorkItemMetrics& metrics);
nlohmann::json toJson(const scoring::DeveloperSummary& summary);
nlohmann::json toJson(const scoring::TeamSummary& team);
nlohmann::json toJson(const BatchResult& batch);

/**
 * @brief Materialize one work item from its JSON form.
 *
 * @code{.json}
 * { "id": 42, "developer": "ana", "estimate_hours": 8, "completed": true,
 *   "created_at": "2024-03-04T09:00:00-06:00",
 *   "target_date": "2024-03-08", "closed_date": "2024-03-07T17:00:00Z",
 *   "events": [ { "state": "Active", "timestamp": "2024-03-04T15:00:00Z" } ] }
 * @endcode
 *
 * An event without a timestamp is kept as such and rejected later by
 * accumulation; a malformed timestamp is InvalidTimestamp here.
 */
Result<WorkItemInput> workItemInputFromJson(const nlohmann::json& j);

/**
 * @brief Materialize an array of work items.
 *
 * A bad entry is rejected on its own and the rest are kept; only a document
 * that is not an array fails as a whole. Pass the batch to
 * BatchProcessor::runBatch so rejected entries show up as issues.
 */
Result<WorkItemBatch> workItemInputsFromJson(const nlohmann::json& j);

} // namespace devscore::api
