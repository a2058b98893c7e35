#include <devscore/api/report_json.h>
#include <devscore/core/time_parser.h>
#include <devscore/version.hpp>

#include <spdlog/spdlog.h>

#include <cstdint>
#include <limits>

namespace devscore::api {

using nlohmann::json;

namespace {

template <typename T> json optionalToJson(const std::optional<T>& value) {
    if (value)
        return json(*value);
    return json(nullptr);
}

Result<std::optional<TimePoint>> optionalTimestamp(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return std::optional<TimePoint>{};
    if (it->is_number_integer()) {
        std::optional<TimePoint> tp;
        if (!it->is_number_unsigned() ||
            it->get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            tp = TimeParser::fromUnixSeconds(it->get<int64_t>());
        }
        if (!tp) {
            return Error{ErrorCode::InvalidTimestamp, std::string(key) + " is out of range"};
        }
        return tp;
    }
    if (!it->is_string()) {
        return Error{ErrorCode::InvalidTimestamp, std::string(key) + " must be a string"};
    }
    auto parsed = TimeParser::parse(it->get<std::string>());
    if (!parsed) {
        return Error{parsed.error().code, std::string(key) + ": " + parsed.error().message};
    }
    return std::optional<TimePoint>{parsed.value()};
}

} // namespace

json toJson(const timing::TimeBreakdown& breakdown) {
    json j;
    j["active_hours"] = breakdown.activeHours;
    j["paused_hours"] = breakdown.pausedHours;
    j["pre_reopen_active_hours"] = breakdown.preReopenActiveHours;
    j["post_reopen_active_hours"] = breakdown.postReopenActiveHours;
    j["was_reopened"] = breakdown.wasReopened;
    j["reopen_count"] = breakdown.reopenCount;
    j["total_hours"] = breakdown.totalHours;
    j["state_hours"] = breakdown.stateHours;
    j["paused_state_hours"] = breakdown.pausedStateHours;
    j["transition_count"] = breakdown.transitionCount;
    j["pause_count"] = breakdown.pauseCount;
    j["has_transitions"] = breakdown.hasTransitions;
    j["is_completed"] = breakdown.isCompleted;
    j["should_ignore"] = breakdown.shouldIgnore;
    if (breakdown.finalCategory)
        j["final_category"] = config::stateCategoryToString(*breakdown.finalCategory);
    else
        j["final_category"] = nullptr;
    return j;
}

json toJson(const scoring::WorkItemMetrics& metrics) {
    json j;
    j["id"] = metrics.itemId;
    j["estimated_hours"] = metrics.estimatedHours;
    j["active_hours"] = metrics.activeHours;
    j["raw_active_hours"] = metrics.rawActiveHours;
    j["paused_hours"] = metrics.pausedHours;
    j["completion_bonus_hours"] = metrics.completionBonusHours;
    j["late_penalty_mitigation_hours"] = metrics.latePenaltyMitigationHours;
    j["timing_bonus_hours"] = metrics.timingBonusHours;
    j["fair_efficiency_pct"] = optionalToJson(metrics.fairEfficiencyPct);
    j["traditional_efficiency_pct"] = optionalToJson(metrics.traditionalEfficiencyPct);
    j["delivery_score"] = optionalToJson(metrics.deliveryScore);
    j["days_ahead_behind"] = optionalToJson(metrics.daysAheadBehind);
    j["delivery_tier"] = optionalToJson(metrics.deliveryTier);
    j["is_completed"] = metrics.isCompleted;
    j["eligible"] = metrics.eligible;
    if (!metrics.eligible)
        j["ineligible_reason"] = metrics.ineligibleReason;
    j["ignored"] = metrics.ignored;
    j["has_transition_data"] = metrics.hasTransitionData;
    j["was_reopened"] = metrics.wasReopened;
    j["reopen_count"] = metrics.reopenCount;
    j["post_reopen_active_hours"] = metrics.postReopenActiveHours;
    j["state_hours"] = metrics.stateHours;
    return j;
}

json toJson(const scoring::DeveloperSummary& summary) {
    json j;
    j["developer"] = summary.developer;
    j["total_items"] = summary.totalItems;
    j["completed_items"] = summary.completedItems;
    j["eligible_items"] = summary.eligibleItems;
    j["items_with_estimate"] = summary.itemsWithEstimate;
    j["items_with_timing"] = summary.itemsWithTiming;
    j["on_time_items"] = summary.onTimeItems;
    j["completion_rate"] = summary.completionRate;
    j["on_time_rate"] = optionalToJson(summary.onTimeRate);
    j["avg_fair_efficiency"] = optionalToJson(summary.avgFairEfficiency);
    j["avg_delivery_score"] = optionalToJson(summary.avgDeliveryScore);
    j["overall_score"] = summary.overallScore;
    j["low_confidence"] = summary.lowConfidence;
    j["total_active_hours"] = summary.totalActiveHours;
    j["total_estimated_hours"] = summary.totalEstimatedHours;
    j["avg_days_ahead_behind"] = optionalToJson(summary.avgDaysAheadBehind);
    j["reopened_items"] = summary.reopenedItems;
    j["reopened_rate"] = summary.reopenedRate;
    j["sample_confidence_pct"] = summary.sampleConfidencePct;
    j["delivery_timing_breakdown"] = summary.deliveryTimingBreakdown;
    return j;
}

json toJson(const scoring::TeamSummary& team) {
    json j;
    j["overall"] = json{{"total_work_items", team.overall.totalWorkItems},
                        {"total_developers", team.overall.totalDevelopers},
                        {"average_fair_efficiency", optionalToJson(team.overall.averageFairEfficiency)},
                        {"average_delivery_score", optionalToJson(team.overall.averageDeliveryScore)},
                        {"total_active_hours", team.overall.totalActiveHours}};

    j["developers"] = json::object();
    for (const auto& [name, summary] : team.developers) {
        j["developers"][name] = toJson(summary);
    }

    j["bottlenecks"] = json::array();
    for (const auto& b : team.bottlenecks) {
        j["bottlenecks"].push_back(json{
            {"state", b.state}, {"average_hours", b.averageHours}, {"occurrences", b.occurrences}});
    }
    return j;
}

json toJson(const BatchResult& batch) {
    json j;
    j["engine_version"] = version::string_v;
    j["as_of"] = TimeParser::formatISO8601(batch.asOf);

    j["work_items"] = json::array();
    for (const auto& item : batch.items) {
        json entry = toJson(item.metrics);
        entry["developer"] = item.developer;
        entry["breakdown"] = toJson(item.breakdown);
        j["work_items"].push_back(std::move(entry));
    }

    j["issues"] = json::array();
    for (const auto& issue : batch.issues) {
        j["issues"].push_back(json{{"id", issue.itemId},
                                   {"developer", issue.developer},
                                   {"kind", errorKindToString(issue.error.kind())},
                                   {"error", errorToString(issue.error.code)},
                                   {"message", issue.error.message}});
    }

    j["team"] = toJson(batch.team);
    return j;
}

Result<WorkItemInput> workItemInputFromJson(const json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::InvalidData, "Work item must be a JSON object"};
    }

    WorkItemInput input;
    try {
        input.id = j.at("id").get<WorkItemId>();
        input.developer = j.value("developer", std::string{});

        if (auto it = j.find("estimate_hours"); it != j.end() && !it->is_null())
            input.estimatedHours = it->get<double>();
        if (auto it = j.find("completed"); it != j.end() && !it->is_null())
            input.isCompleted = it->get<bool>();
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("Malformed work item: ") + e.what()};
    }

    auto createdAt = optionalTimestamp(j, "created_at");
    if (!createdAt)
        return createdAt.error();
    input.createdAt = createdAt.value();

    auto target = optionalTimestamp(j, "target_date");
    if (!target)
        return target.error();
    input.targetDate = target.value();

    auto closed = optionalTimestamp(j, "closed_date");
    if (!closed)
        return closed.error();
    input.closedDate = closed.value();

    if (auto it = j.find("events"); it != j.end()) {
        if (!it->is_array()) {
            return Error{ErrorCode::InvalidData,
                         "Work item " + std::to_string(input.id) + ": events must be an array"};
        }
        for (const auto& event : *it) {
            if (!event.is_object() || !event.contains("state") || !event["state"].is_string()) {
                return Error{ErrorCode::InvalidData, "Work item " + std::to_string(input.id) +
                                                         ": event without a state label"};
            }
            auto timestamp = optionalTimestamp(event, "timestamp");
            if (!timestamp) {
                return Error{timestamp.error().code, "Work item " + std::to_string(input.id) +
                                                         ": " + timestamp.error().message};
            }
            input.events.push_back(
                timing::StateChange{timestamp.value(), event["state"].get<std::string>()});
        }
    }
    return input;
}

Result<WorkItemBatch> workItemInputsFromJson(const json& j) {
    if (!j.is_array()) {
        return Error{ErrorCode::InvalidData, "Expected an array of work items"};
    }
    WorkItemBatch batch;
    batch.items.reserve(j.size());
    for (const auto& entry : j) {
        auto input = workItemInputFromJson(entry);
        if (input) {
            batch.items.push_back(std::move(input).value());
            continue;
        }

        ItemIssue issue{0, {}, input.error()};
        if (entry.is_object()) {
            if (auto it = entry.find("id"); it != entry.end() && it->is_number_integer())
                issue.itemId = it->get<WorkItemId>();
            if (auto it = entry.find("developer"); it != entry.end() && it->is_string())
                issue.developer = it->get<std::string>();
        }
        spdlog::warn("Rejected work item input {}: {}", issue.itemId, issue.error.message);
        batch.rejected.push_back(std::move(issue));
    }
    return batch;
}

} // namespace devscore::api
