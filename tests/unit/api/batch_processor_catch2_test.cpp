// Catch2 tests for BatchProcessor

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <devscore/api/batch_processor.h>
#include <devscore/api/report_json.h>

#include <nlohmann/json.hpp>

#include "../../common/test_helpers_catch2.h"

using namespace devscore;
using namespace devscore::api;
using Catch::Approx;
using devscore::test::change;
using devscore::test::cst;
using devscore::test::utc;

namespace {

config::EngineConfig officeConfig() {
    config::EngineConfig cfg;
    cfg.businessHours = test::officeHours();
    return cfg;
}

WorkItemInput closedItem(WorkItemId id, const std::string& developer, double activeHours,
                         std::optional<double> estimate, int daysLate) {
    WorkItemInput in;
    in.id = id;
    in.developer = developer;
    in.events = {change("New", cst(2024, 3, 4, 8)), change("Active", cst(2024, 3, 4, 9)),
                 change("Closed", test::plusHours(cst(2024, 3, 4, 9), activeHours))};
    in.estimatedHours = estimate;
    in.targetDate = utc(2024, 3, 1);
    in.closedDate = test::plusDays(utc(2024, 3, 1), daysLate);
    return in;
}

RunOptions fixedBoundary() {
    RunOptions options;
    options.asOf = cst(2024, 3, 20, 12);
    return options;
}

} // namespace

TEST_CASE("BatchProcessor: scores items and folds them per developer",
          "[unit][api][batch]") {
    auto processor = BatchProcessor::create(officeConfig(), 4);
    REQUIRE(processor);

    std::vector<WorkItemInput> items = {
        closedItem(3, "ben", 4.0, 4.0, 0), closedItem(1, "ana", 6.0, 8.0, 3),
        closedItem(2, "ana", 8.0, 8.0, -1)};

    auto result = processor.value().run(items, fixedBoundary());
    REQUIRE(result);
    const auto& batch = result.value();

    REQUIRE(batch.items.size() == 3);
    CHECK(batch.items[0].id == 1);
    CHECK(batch.items[1].id == 2);
    CHECK(batch.items[2].id == 3);
    CHECK(batch.issues.empty());
    CHECK(batch.asOf == cst(2024, 3, 20, 12));

    const auto& first = batch.items[0].metrics;
    CHECK(first.itemId == 1);
    CHECK(first.isCompleted);
    CHECK(*first.fairEfficiencyPct == Approx(76.0));

    CHECK(batch.team.overall.totalDevelopers == 2);
    CHECK(batch.team.overall.totalWorkItems == 3);
    CHECK(batch.team.developers.at("ana").totalItems == 2);
    CHECK(batch.team.developers.at("ben").onTimeItems == 1);
    REQUIRE_FALSE(batch.team.bottlenecks.empty());
    CHECK(batch.team.bottlenecks.front().state == "Active");
}

TEST_CASE("BatchProcessor: input errors exclude only the offending item",
          "[unit][api][batch]") {
    auto processor = BatchProcessor::create(officeConfig(), 2);
    REQUIRE(processor);

    auto missingTimestamp = closedItem(2, "ana", 4.0, 8.0, 0);
    missingTimestamp.events.push_back(timing::StateChange{std::nullopt, "Active"});
    auto negativeEstimate = closedItem(3, "ben", 4.0, -2.0, 0);

    std::vector<WorkItemInput> items = {closedItem(1, "ana", 6.0, 8.0, 0), missingTimestamp,
                                        negativeEstimate, closedItem(4, "ben", 4.0, 4.0, 0)};

    auto result = processor.value().run(items, fixedBoundary());
    REQUIRE(result);
    const auto& batch = result.value();

    REQUIRE(batch.items.size() == 2);
    REQUIRE(batch.issues.size() == 2);
    CHECK(batch.issues[0].itemId == 2);
    CHECK(batch.issues[0].error.code == ErrorCode::MissingTimestamp);
    CHECK(batch.issues[1].itemId == 3);
    CHECK(batch.issues[1].error.code == ErrorCode::InvalidEstimate);
    CHECK(batch.team.overall.totalWorkItems == 2);
}

TEST_CASE("BatchProcessor: entries rejected while reading become issues",
          "[unit][api][batch]") {
    auto processor = BatchProcessor::create(officeConfig(), 2);
    REQUIRE(processor);

    auto parsed = workItemInputsFromJson(nlohmann::json::parse(R"([
        {"id": 1, "developer": "ana", "estimate_hours": 8, "completed": true,
         "events": [{"state": "Active", "timestamp": "2024-03-04T09:00:00-06:00"},
                    {"state": "Closed", "timestamp": "2024-03-04T15:00:00-06:00"}]},
        {"id": 2, "developer": "ana", "estimate_hours": 8,
         "events": [{"state": "Active", "timestamp": "soon"}]},
        {"id": 3, "developer": "ben", "estimate_hours": 4,
         "events": [{"state": "Active"}]},
        {"id": 4, "developer": "ben", "estimate_hours": 4, "completed": true,
         "events": [{"state": "Active", "timestamp": "2024-03-05T09:00:00-06:00"},
                    {"state": "Closed", "timestamp": "2024-03-05T13:00:00-06:00"}]}
    ])"));
    REQUIRE(parsed);
    REQUIRE(parsed.value().rejected.size() == 1);

    auto result = processor.value().runBatch(parsed.value(), fixedBoundary());
    REQUIRE(result);
    const auto& batch = result.value();

    REQUIRE(batch.items.size() == 2);
    CHECK(batch.items[0].id == 1);
    CHECK(batch.items[0].metrics.activeHours == Approx(6.0));
    CHECK(batch.items[1].id == 4);

    REQUIRE(batch.issues.size() == 2);
    CHECK(batch.issues[0].itemId == 2);
    CHECK(batch.issues[0].developer == "ana");
    CHECK(batch.issues[0].error.code == ErrorCode::InvalidTimestamp);
    CHECK(batch.issues[0].error.kind() == ErrorKind::Input);
    CHECK(batch.issues[1].itemId == 3);
    CHECK(batch.issues[1].error.code == ErrorCode::MissingTimestamp);

    CHECK(batch.team.overall.totalWorkItems == 2);
    REQUIRE(batch.team.developers.count("ana") == 1);
    CHECK(batch.team.developers.at("ana").totalItems == 1);
}

TEST_CASE("BatchProcessor: config errors abort the run", "[unit][api][batch]") {
    auto cfg = officeConfig();
    cfg.states.unmappedCategory.reset();
    auto processor = BatchProcessor::create(cfg, 2);
    REQUIRE(processor);

    auto unmapped = closedItem(2, "ana", 4.0, 8.0, 0);
    unmapped.events.push_back(change("Triage", cst(2024, 3, 4, 20)));

    auto result =
        processor.value().run({closedItem(1, "ana", 4.0, 8.0, 0), unmapped}, fixedBoundary());
    REQUIRE_FALSE(result);
    CHECK(result.error().kind() == ErrorKind::Config);
}

TEST_CASE("BatchProcessor: create validates the whole config", "[unit][api][batch]") {
    SECTION("weights") {
        auto cfg = officeConfig();
        cfg.weights.delivery = 0.9;
        auto processor = BatchProcessor::create(cfg);
        REQUIRE_FALSE(processor);
        CHECK(processor.error().code == ErrorCode::InvalidWeights);
    }
    SECTION("time zone") {
        auto cfg = officeConfig();
        cfg.businessHours.timezone = "Europe/Atlantis";
        auto processor = BatchProcessor::create(cfg);
        REQUIRE_FALSE(processor);
        CHECK(processor.error().code == ErrorCode::UnknownTimeZone);
    }
    SECTION("default worker count") {
        auto processor = BatchProcessor::create(officeConfig());
        REQUIRE(processor);
        CHECK(processor.value().workers() >= 1);
    }
}

TEST_CASE("BatchProcessor: results do not depend on worker count", "[unit][api][batch]") {
    std::vector<WorkItemInput> items;
    for (WorkItemId id = 1; id <= 40; ++id) {
        items.push_back(closedItem(id, id % 3 == 0 ? "ana" : (id % 3 == 1 ? "ben" : "cy"),
                                   1.0 + static_cast<double>(id % 7), 2.0 + (id % 5),
                                   static_cast<int>(id % 11) - 5));
    }

    auto serial = BatchProcessor::create(officeConfig(), 1);
    auto parallel = BatchProcessor::create(officeConfig(), 8);
    REQUIRE(serial);
    REQUIRE(parallel);

    auto a = serial.value().run(items, fixedBoundary());
    auto b = parallel.value().run(items, fixedBoundary());
    REQUIRE(a);
    REQUIRE(b);

    for (const auto& [name, summary] : a.value().team.developers) {
        const auto& other = b.value().team.developers.at(name);
        CHECK(summary.overallScore == other.overallScore);
        CHECK(summary.totalActiveHours == other.totalActiveHours);
    }
}

TEST_CASE("BatchProcessor: explicit completion flag overrides the final state",
          "[unit][api][batch]") {
    auto processor = BatchProcessor::create(officeConfig(), 1);
    REQUIRE(processor);

    auto item = closedItem(1, "ana", 4.0, 8.0, 0);
    item.isCompleted = false;
    auto r = processor.value().processItem(item, cst(2024, 3, 20, 12));
    REQUIRE(r);
    CHECK_FALSE(r.value().metrics.isCompleted);
    CHECK(r.value().breakdown.isCompleted);
    CHECK_FALSE(r.value().metrics.hasTiming());
}

TEST_CASE("BatchProcessor: empty batch", "[unit][api][batch]") {
    auto processor = BatchProcessor::create(officeConfig(), 2);
    REQUIRE(processor);
    auto r = processor.value().run({}, fixedBoundary());
    REQUIRE(r);
    CHECK(r.value().items.empty());
    CHECK(r.value().team.overall.totalDevelopers == 0);
}
