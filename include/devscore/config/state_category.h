#pragma once

#include <devscore/core/types.h>

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace devscore::config {

/**
 * @brief Classification of a raw work-item state label.
 *
 * The label set is owned by the tracker; only the category drives accounting.
 */
enum class StateCategory {
    Assigned,   // Owned but not being worked on (New, To Do)
    Productive, // Time accrues as active business hours
    Paused,     // Blocked or waiting; time accrues as wall-clock pause time
    Completion, // Resolved/Closed/Done
    Ignored     // Removed/Cancelled, or any label without a mapping
};

[[nodiscard]] constexpr const char* stateCategoryToString(StateCategory category) noexcept {
    switch (category) {
        case StateCategory::Assigned:
            return "assigned";
        case StateCategory::Productive:
            return "productive";
        case StateCategory::Paused:
            return "paused";
        case StateCategory::Completion:
            return "completion";
        case StateCategory::Ignored:
            return "ignored";
    }
    return "ignored";
}

[[nodiscard]] std::optional<StateCategory> stateCategoryFromString(std::string_view name);

/**
 * @brief Raw label lists per category, as supplied by the caller.
 *
 * Defaults follow the Azure DevOps process templates.
 */
struct StateCategoryConfig {
    std::vector<std::string> assignedStates = {"New", "To Do", "Approved", "Committed"};
    std::vector<std::string> productiveStates = {"Active", "In Progress", "Development",
                                                 "Code Review", "Testing"};
    std::vector<std::string> pausedStates = {"Stopper", "Blocked", "On Hold", "Waiting"};
    std::vector<std::string> completionStates = {"Resolved", "Closed", "Done"};
    std::vector<std::string> ignoredStates = {"Removed", "Discarded", "Cancelled"};

    // Category for labels that appear in none of the lists. nullopt means
    // there is no fallback policy and an unmapped label is a config error.
    std::optional<StateCategory> unmappedCategory = StateCategory::Ignored;

    /**
     * @brief Reject empty labels and labels listed under two categories.
     */
    Result<void> validate() const;
};

/**
 * @brief Validated, case-insensitive label -> category lookup built once per run.
 */
class StateCategoryMap {
public:
    static Result<StateCategoryMap> build(const StateCategoryConfig& config);

    /**
     * @brief Category for a raw label; nullopt only when the label is unmapped
     * and no fallback category is configured.
     */
    std::optional<StateCategory> resolve(std::string_view label) const;

    /**
     * @brief True when the label is explicitly listed (fallback not consulted).
     */
    bool contains(std::string_view label) const;

    std::optional<StateCategory> fallback() const { return fallback_; }
    size_t size() const { return table_.size(); }

private:
    StateCategoryMap() = default;

    std::unordered_map<std::string, StateCategory> table_;
    std::optional<StateCategory> fallback_;
};

} // namespace devscore::config
