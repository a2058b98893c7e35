#include <devscore/api/batch_processor.h>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <thread>

namespace devscore::api {

BatchProcessor::BatchProcessor(config::EngineConfig config,
                               std::shared_ptr<const timing::BusinessHoursCalculator> hours,
                               std::shared_ptr<const config::StateCategoryMap> categories,
                               std::shared_ptr<const scoring::EfficiencyCalculator> efficiency,
                               size_t workers)
    : config_(std::move(config)), hours_(std::move(hours)), categories_(std::move(categories)),
      efficiency_(std::move(efficiency)), workers_(workers) {}

Result<BatchProcessor> BatchProcessor::create(config::EngineConfig config, size_t workers) {
    if (auto valid = config.validate(); !valid) {
        return valid.error();
    }

    auto categories = config::StateCategoryMap::build(config.states);
    if (!categories) {
        return categories.error();
    }
    auto hours = timing::BusinessHoursCalculator::create(config.businessHours);
    if (!hours) {
        spdlog::error("BatchProcessor: {}", hours.error().message);
        return hours.error();
    }
    auto efficiency = scoring::EfficiencyCalculator::create(config.efficiency);
    if (!efficiency) {
        return efficiency.error();
    }

    if (workers == 0)
        workers = std::max(1u, std::thread::hardware_concurrency());

    return BatchProcessor(
        std::move(config),
        std::make_shared<const timing::BusinessHoursCalculator>(std::move(hours).value()),
        std::make_shared<const config::StateCategoryMap>(std::move(categories).value()),
        std::make_shared<const scoring::EfficiencyCalculator>(std::move(efficiency).value()),
        workers);
}

Result<WorkItemResult> BatchProcessor::processItem(const WorkItemInput& item,
                                                   TimePoint asOf) const {
    timing::AccumulateOptions options;
    options.createdAt = item.createdAt;
    options.asOf = asOf;
    timing::StateTransitionStack stack(*hours_, *categories_, options);

    auto breakdown = stack.accumulate(item.events);
    if (!breakdown) {
        return breakdown.error();
    }

    const bool completed = item.isCompleted.value_or(breakdown.value().isCompleted);
    auto metrics = efficiency_->score(breakdown.value(), item.estimatedHours, completed,
                                      item.targetDate, item.closedDate);
    if (!metrics) {
        return metrics.error();
    }

    WorkItemResult result;
    result.id = item.id;
    result.developer = item.developer;
    result.breakdown = std::move(breakdown).value();
    result.metrics = std::move(metrics).value();
    result.metrics.itemId = item.id;
    return result;
}

Result<BatchResult> BatchProcessor::run(const std::vector<WorkItemInput>& items,
                                        const RunOptions& options) const {
    return runItems(items, {}, options);
}

Result<BatchResult> BatchProcessor::runBatch(const WorkItemBatch& batch,
                                             const RunOptions& options) const {
    return runItems(batch.items, batch.rejected, options);
}

Result<BatchResult> BatchProcessor::runItems(const std::vector<WorkItemInput>& items,
                                             const std::vector<ItemIssue>& rejected,
                                             const RunOptions& options) const {
    const TimePoint asOf = options.asOf.value_or(std::chrono::system_clock::now());

    std::vector<std::optional<Result<WorkItemResult>>> slots(items.size());
    {
        boost::asio::thread_pool pool(std::min(workers_, std::max<size_t>(items.size(), 1)));
        for (size_t i = 0; i < items.size(); ++i) {
            boost::asio::post(pool, [this, &items, &slots, i, asOf]() {
                try {
                    slots[i] = processItem(items[i], asOf);
                } catch (const std::exception& e) {
                    slots[i] = Result<WorkItemResult>(
                        Error{ErrorCode::InternalError, std::string("Item failed: ") + e.what()});
                }
            });
        }
        pool.join();
    }

    BatchResult out;
    out.asOf = asOf;
    std::map<std::string, std::vector<scoring::WorkItemMetrics>> byDeveloper;

    for (size_t i = 0; i < items.size(); ++i) {
        const auto& item = items[i];
        auto& slot = slots[i];
        if (!slot) {
            return Error{ErrorCode::InternalError,
                         "Work item " + std::to_string(item.id) + " was never processed"};
        }
        if (!*slot) {
            const Error& error = slot->error();
            if (error.kind() == ErrorKind::Config) {
                spdlog::error("Run aborted by work item {}: {}", item.id, error.message);
                return error;
            }
            spdlog::warn("Excluding work item {} ({}): {}", item.id, error.code, error.message);
            out.issues.push_back(ItemIssue{item.id, item.developer, error});
            continue;
        }
        WorkItemResult result = std::move(*slot).value();
        byDeveloper[result.developer].push_back(result.metrics);
        out.items.push_back(std::move(result));
    }

    out.issues.insert(out.issues.end(), rejected.begin(), rejected.end());

    std::ranges::stable_sort(out.items, [](const WorkItemResult& a, const WorkItemResult& b) {
        return a.id < b.id;
    });
    std::ranges::stable_sort(out.issues, [](const ItemIssue& a, const ItemIssue& b) {
        return a.itemId < b.itemId;
    });

    auto team = scoring::summarizeTeam(byDeveloper, config_.weights, config_.summary,
                                       options.assignedCounts);
    if (!team) {
        return team.error();
    }
    out.team = std::move(team).value();

    spdlog::info("Scored {} work items for {} developers ({} excluded)", out.items.size(),
                 out.team.overall.totalDevelopers, out.issues.size());
    return out;
}

} // namespace devscore::api
