#include <devscore/timing/state_transition_stack.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <vector>

namespace devscore::timing {

using config::StateCategory;

namespace {

struct Frame {
    StateCategory category;
    std::string label;
    TimePoint since;
};

// Mutable state for one accumulate() call.
class StackPass {
public:
    StackPass(const BusinessHoursCalculator& hours, size_t maxDepth)
        : hours_(hours), maxDepth_(std::max<size_t>(maxDepth, 1)) {}

    void open(StateCategory category, std::string label, TimePoint since) {
        stack_.push_back(Frame{category, std::move(label), since});
    }

    bool empty() const { return stack_.empty(); }
    const Frame& top() const { return stack_.back(); }

    // Credit the top frame for [since, until) and restart it at until.
    void closeSegment(TimePoint until) {
        if (stack_.empty())
            return;
        Frame& frame = stack_.back();
        if (until > frame.since) {
            credit(frame, until);
            frame.since = until;
        }
    }

    void transition(const StateEvent& event) {
        trackReopen(event.category);

        if (!stack_.empty() && stack_.back().label != event.rawState)
            ++out_.transitionCount;

        if (event.category == StateCategory::Paused) {
            const bool alreadyPaused =
                !stack_.empty() && stack_.back().category == StateCategory::Paused;
            if (!alreadyPaused)
                ++out_.pauseCount;
            if (stack_.size() < maxDepth_ && !stack_.empty()) {
                stack_.push_back(Frame{event.category, event.rawState, event.timestamp});
            } else {
                replaceTop(event);
            }
            return;
        }

        // Resuming: unwind every pause frame back to the enclosing state.
        while (stack_.size() > 1 && stack_.back().category == StateCategory::Paused)
            stack_.pop_back();
        replaceTop(event);
    }

    TimeBreakdown finish() {
        out_.activeHours = out_.preReopenActiveHours + out_.postReopenActiveHours;
        return std::move(out_);
    }

    TimeBreakdown& result() { return out_; }

private:
    void replaceTop(const StateEvent& event) {
        if (stack_.empty()) {
            stack_.push_back(Frame{event.category, event.rawState, event.timestamp});
            return;
        }
        stack_.back() = Frame{event.category, event.rawState, event.timestamp};
    }

    void trackReopen(StateCategory category) {
        if (category == StateCategory::Completion) {
            inCompletion_ = true;
            return;
        }
        if (category == StateCategory::Ignored)
            return;
        if (inCompletion_) {
            out_.wasReopened = true;
            ++out_.reopenCount;
        }
        inCompletion_ = false;
    }

    void credit(const Frame& frame, TimePoint until) {
        const double wall = hoursBetween(frame.since, until);
        out_.totalHours += wall;
        if (!frame.label.empty())
            out_.stateHours[frame.label] += wall;

        switch (frame.category) {
            case StateCategory::Productive: {
                const double active = hours_.overlapHours(frame.since, until);
                if (out_.wasReopened) {
                    out_.postReopenActiveHours += active;
                } else {
                    out_.preReopenActiveHours += active;
                }
                break;
            }
            case StateCategory::Paused:
                out_.pausedHours += wall;
                out_.pausedStateHours[frame.label] += wall;
                break;
            case StateCategory::Assigned:
            case StateCategory::Completion:
            case StateCategory::Ignored:
                break;
        }
    }

    const BusinessHoursCalculator& hours_;
    size_t maxDepth_;
    std::vector<Frame> stack_;
    bool inCompletion_ = false;
    TimeBreakdown out_;
};

} // namespace

Result<std::vector<StateEvent>> classifyEvents(const std::vector<StateChange>& changes,
                                               const config::StateCategoryMap& categories) {
    std::vector<StateEvent> events;
    events.reserve(changes.size());
    for (size_t i = 0; i < changes.size(); ++i) {
        const auto& change = changes[i];
        if (!change.timestamp) {
            return Error{ErrorCode::MissingTimestamp, "State change #" + std::to_string(i) +
                                                          " ('" + change.state +
                                                          "') has no timestamp"};
        }
        auto category = categories.resolve(change.state);
        if (!category) {
            return Error{ErrorCode::InvalidConfiguration,
                         "State '" + change.state +
                             "' is not mapped and no fallback category is configured"};
        }
        events.push_back(StateEvent{*change.timestamp, change.state, *category});
    }
    return events;
}

StateTransitionStack::StateTransitionStack(const BusinessHoursCalculator& hours,
                                           const config::StateCategoryMap& categories,
                                           AccumulateOptions options)
    : hours_(hours), categories_(categories), options_(std::move(options)) {}

Result<TimeBreakdown> StateTransitionStack::accumulate(
    const std::vector<StateChange>& changes) const {
    auto events = classifyEvents(changes, categories_);
    if (!events) {
        return events.error();
    }
    return accumulate(std::move(events).value());
}

TimeBreakdown StateTransitionStack::accumulate(std::vector<StateEvent> events) const {
    if (events.empty())
        return TimeBreakdown{};

    std::stable_sort(events.begin(), events.end(),
                     [](const StateEvent& a, const StateEvent& b) {
                         return a.timestamp < b.timestamp;
                     });

    StackPass pass(hours_, options_.maxStackDepth);

    const auto& first = events.front();
    if (options_.createdAt && *options_.createdAt < first.timestamp) {
        pass.open(StateCategory::Assigned, std::string{}, *options_.createdAt);
    }

    for (const auto& event : events) {
        pass.closeSegment(event.timestamp);
        pass.transition(event);
    }

    const auto& last = events.back();
    if (last.category != StateCategory::Completion) {
        const TimePoint boundary = options_.asOf.value_or(std::chrono::system_clock::now());
        pass.closeSegment(boundary);
    }

    auto& out = pass.result();
    out.hasTransitions = events.size() >= 2;
    out.finalCategory = last.category;
    out.isCompleted = last.category == StateCategory::Completion;
    out.shouldIgnore =
        last.category == StateCategory::Ignored && categories_.contains(last.rawState);

    TimeBreakdown breakdown = pass.finish();
    spdlog::debug("accumulate: {} events, active={:.2f}h (pre={:.2f}, post={:.2f}), "
                  "paused={:.2f}h, reopened={} x{}",
                  events.size(), breakdown.activeHours, breakdown.preReopenActiveHours,
                  breakdown.postReopenActiveHours, breakdown.pausedHours,
                  breakdown.wasReopened, breakdown.reopenCount);
    return breakdown;
}

} // namespace devscore::timing
