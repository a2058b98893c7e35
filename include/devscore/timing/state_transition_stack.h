#pragma once

#include <devscore/config/state_category.h>
#include <devscore/core/types.h>
#include <devscore/timing/business_hours.h>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace devscore::timing {

/**
 * @brief A raw state change as delivered by the tracker.
 *
 * The timestamp is optional so a record with a missing value can be rejected
 * per item instead of failing the whole batch.
 */
struct StateChange {
    std::optional<TimePoint> timestamp;
    std::string state;
};

/**
 * @brief A state change with its label classified.
 */
struct StateEvent {
    TimePoint timestamp;
    std::string rawState;
    config::StateCategory category = config::StateCategory::Ignored;
};

/**
 * @brief Accumulated durations for one work item.
 *
 * activeHours == preReopenActiveHours + postReopenActiveHours always holds;
 * postReopenActiveHours is 0 unless wasReopened.
 */
struct TimeBreakdown {
    double activeHours = 0.0; // business hours in productive states
    double pausedHours = 0.0; // wall-clock hours in paused states
    double preReopenActiveHours = 0.0;
    double postReopenActiveHours = 0.0;
    bool wasReopened = false;
    int reopenCount = 0;

    double totalHours = 0.0;                      // wall clock across all segments
    std::map<std::string, double> stateHours;       // wall clock per raw label
    std::map<std::string, double> pausedStateHours; // wall clock per paused label
    size_t transitionCount = 0;
    size_t pauseCount = 0;

    bool hasTransitions = false; // at least two events
    bool isCompleted = false;    // final state is a completion state
    bool shouldIgnore = false;   // final state is explicitly configured as ignored
    std::optional<config::StateCategory> finalCategory;
};

struct AccumulateOptions {
    // Item creation time; an earlier creation opens an assigned segment.
    std::optional<TimePoint> createdAt;
    // Query boundary for the open segment of an unfinished item; now() if unset.
    std::optional<TimePoint> asOf;
    // Nested pause depth kept on the stack; deeper pauses replace the top.
    size_t maxStackDepth = 4;
};

/**
 * @brief Classify raw changes. Fails with MissingTimestamp for a change
 * without a timestamp, or InvalidConfiguration for an unmapped label when no
 * fallback category is configured.
 */
Result<std::vector<StateEvent>> classifyEvents(const std::vector<StateChange>& changes,
                                               const config::StateCategoryMap& categories);

/**
 * @brief Converts an ordered state-change stream into a TimeBreakdown.
 *
 * Single forward pass. Entering a paused state pushes a frame over the
 * enclosing one, leaving it pops back, and any other transition replaces the
 * top frame. Only the open frames and running totals are kept.
 *
 * After the first completion, the first transition into a non-terminal state
 * marks the item reopened and all later productive time accrues post-reopen.
 * Every further completion -> non-terminal transition increments reopenCount.
 *
 * Holds references to the calculator and the category map; both must outlive
 * the stack. accumulate() is const and may run concurrently.
 */
class StateTransitionStack {
public:
    StateTransitionStack(const BusinessHoursCalculator& hours,
                         const config::StateCategoryMap& categories,
                         AccumulateOptions options = {});

    Result<TimeBreakdown> accumulate(const std::vector<StateChange>& changes) const;

    /**
     * @brief Accumulate already classified events; they are stable-sorted by
     * timestamp first, so out-of-order delivery is tolerated.
     */
    TimeBreakdown accumulate(std::vector<StateEvent> events) const;

    const AccumulateOptions& options() const { return options_; }

private:
    const BusinessHoursCalculator& hours_;
    const config::StateCategoryMap& categories_;
    AccumulateOptions options_;
};

} // namespace devscore::timing
