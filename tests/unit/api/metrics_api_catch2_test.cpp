// Catch2 tests for the per-call metrics entry points

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <devscore/api/metrics_api.h>

#include "../../common/test_helpers_catch2.h"

using namespace devscore;
using namespace devscore::api;
using Catch::Approx;
using devscore::test::change;
using devscore::test::cst;
using devscore::test::utc;

TEST_CASE("metrics api: events to breakdown to metrics to summary", "[unit][api]") {
    timing::AccumulateOptions options;
    options.asOf = cst(2024, 3, 20, 12);

    auto breakdown = computeTimeBreakdown(
        {change("New", cst(2024, 3, 4, 8)), change("Active", cst(2024, 3, 4, 9)),
         change("Closed", cst(2024, 3, 4, 15))},
        config::StateCategoryConfig{}, test::officeHours(), options);
    REQUIRE(breakdown);
    CHECK(breakdown.value().activeHours == Approx(6.0));

    auto metrics = computeWorkItemMetrics(breakdown.value(), 8.0, breakdown.value().isCompleted,
                                          utc(2024, 3, 1), utc(2024, 3, 4), config::EfficiencyConfig{});
    REQUIRE(metrics);
    CHECK(*metrics.value().fairEfficiencyPct == Approx(76.0));
    CHECK(*metrics.value().deliveryScore == 95.0);

    auto summary = computeDeveloperSummary({metrics.value()}, config::DeveloperScoreWeights{});
    REQUIRE(summary);
    CHECK(summary.value().totalItems == 1);
    CHECK(summary.value().lowConfidence);
    CHECK(*summary.value().avgFairEfficiency == Approx(76.0));
}

TEST_CASE("metrics api: configuration errors surface as results", "[unit][api]") {
    SECTION("unknown zone") {
        auto hours = test::officeHours();
        hours.timezone = "Nowhere/Special";
        auto r = computeTimeBreakdown({change("Active", cst(2024, 3, 4, 9))},
                                      config::StateCategoryConfig{}, hours);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::UnknownTimeZone);
    }
    SECTION("conflicting labels") {
        config::StateCategoryConfig states;
        states.completionStates.push_back("Active");
        auto r = computeTimeBreakdown({change("Active", cst(2024, 3, 4, 9))}, states,
                                      test::officeHours());
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::InvalidConfiguration);
    }
    SECTION("invalid weights") {
        config::DeveloperScoreWeights w{0.25, 0.25, 0.25, 0.0};
        auto r = computeDeveloperSummary({}, w);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::InvalidWeights);
    }
    SECTION("invalid tier table") {
        config::EfficiencyConfig eff;
        eff.deliveryTiers.pop_back();
        auto r = computeWorkItemMetrics(timing::TimeBreakdown{}, 8.0, false, std::nullopt,
                                        std::nullopt, eff);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::InvalidConfiguration);
    }
}
