// Catch2 tests for BusinessHoursCalculator

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <devscore/timing/business_hours.h>

#include "../../common/test_helpers_catch2.h"

#include <boost/date_time/local_time/local_time.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

using namespace devscore;
using namespace devscore::timing;
using Catch::Approx;
using devscore::test::cst;
using devscore::test::utc;

namespace {
BusinessHoursCalculator makeCalculator(const config::BusinessHoursConfig& cfg) {
    auto calc = BusinessHoursCalculator::create(cfg);
    REQUIRE(calc);
    return std::move(calc).value();
}
} // namespace

// 2024-03-04 is a Monday.

TEST_CASE("BusinessHours: full working day hits the daily cap", "[unit][timing][hours]") {
    auto calc = makeCalculator(test::officeHours());
    // 08:00-20:00 local covers the whole 9h window, capped at 8h
    CHECK(calc.overlapHours(cst(2024, 3, 4, 8), cst(2024, 3, 4, 20)) == Approx(8.0));
}

TEST_CASE("BusinessHours: partial window", "[unit][timing][hours]") {
    auto calc = makeCalculator(test::officeHours());
    CHECK(calc.overlapHours(cst(2024, 3, 4, 10, 30), cst(2024, 3, 4, 12)) == Approx(1.5));
    CHECK(calc.overlapHours(cst(2024, 3, 4, 6), cst(2024, 3, 4, 9)) == Approx(0.0));
    CHECK(calc.overlapHours(cst(2024, 3, 4, 18), cst(2024, 3, 4, 23)) == Approx(0.0));
}

TEST_CASE("BusinessHours: weekends contribute nothing", "[unit][timing][hours]") {
    auto calc = makeCalculator(test::officeHours());
    CHECK(calc.overlapHours(cst(2024, 3, 9, 0), cst(2024, 3, 11, 0)) == Approx(0.0));

    // Friday 17:00 to Monday 10:00
    CHECK(calc.overlapHours(cst(2024, 3, 8, 17), cst(2024, 3, 11, 10)) == Approx(2.0));
}

TEST_CASE("BusinessHours: days are split in the local zone", "[unit][timing][hours]") {
    auto calc = makeCalculator(test::officeHours());

    // 17:00-19:00 local is 23:00-01:00 UTC; the hour in the window belongs to Monday
    CHECK(calc.overlapHours(utc(2024, 3, 4, 23), utc(2024, 3, 5, 1)) == Approx(1.0));

    // Monday 17:00 to Tuesday 10:00 local
    CHECK(calc.overlapHours(cst(2024, 3, 4, 17), cst(2024, 3, 5, 10)) == Approx(2.0));
}

TEST_CASE("BusinessHours: multi-day spans sum capped days", "[unit][timing][hours]") {
    auto calc = makeCalculator(test::officeHours());
    // Mon 09:00 to Wed 13:00: 8 + 8 + 4
    CHECK(calc.overlapHours(cst(2024, 3, 4, 9), cst(2024, 3, 6, 13)) == Approx(20.0));
}

TEST_CASE("BusinessHours: custom cap and weekdays", "[unit][timing][hours]") {
    auto cfg = test::officeHours();
    cfg.maxHoursPerDay = 4.0;
    cfg.workingWeekdays[6] = true; // Saturday

    auto calc = makeCalculator(cfg);
    CHECK(calc.overlapHours(cst(2024, 3, 4, 0), cst(2024, 3, 5, 0)) == Approx(4.0));
    CHECK(calc.overlapHours(cst(2024, 3, 9, 0), cst(2024, 3, 10, 0)) == Approx(4.0));
    CHECK(calc.overlapHours(cst(2024, 3, 10, 0), cst(2024, 3, 11, 0)) == Approx(0.0));
}

TEST_CASE("BusinessHours: degenerate intervals are zero", "[unit][timing][hours]") {
    auto calc = makeCalculator(test::officeHours());
    const auto t = cst(2024, 3, 4, 12);
    CHECK(calc.overlapHours(t, t) == 0.0);
    CHECK(calc.overlapHours(t, cst(2024, 3, 4, 10)) == 0.0);
}

TEST_CASE("BusinessHours: zone with daylight saving rules", "[unit][timing][hours]") {
    config::BusinessHoursConfig cfg;
    cfg.timezone = "EST-05EDT,M3.2.0/2,M11.1.0/2";
    auto calc = makeCalculator(cfg);

    // 2024-07-01 (Monday) 09:00 EDT is 13:00 UTC
    CHECK(calc.overlapHours(utc(2024, 7, 1, 12), utc(2024, 7, 1, 14)) == Approx(1.0));
    // 2024-01-08 (Monday) 09:00 EST is 14:00 UTC
    CHECK(calc.overlapHours(utc(2024, 1, 8, 12), utc(2024, 1, 8, 14)) == Approx(0.0));
}

TEST_CASE("BusinessHours: UTC zone spec", "[unit][timing][hours]") {
    config::BusinessHoursConfig cfg;
    cfg.timezone = "UTC+00";
    auto calc = makeCalculator(cfg);
    CHECK(calc.overlapHours(utc(2024, 3, 4, 8), utc(2024, 3, 4, 12)) == Approx(3.0));
}

TEST_CASE("BusinessHours: resolveTimeZone builds POSIX zone rules", "[unit][timing][hours]") {
    config::BusinessHoursConfig cfg;

    SECTION("fixed offset") {
        cfg.timezone = "CST-06";
        auto zone = resolveTimeZone(cfg);
        REQUIRE(zone);
        REQUIRE(zone.value());
        CHECK(zone.value()->std_zone_abbrev() == "CST");
        CHECK(zone.value()->base_utc_offset() == boost::posix_time::hours(-6));
        CHECK_FALSE(zone.value()->has_dst());
    }
    SECTION("daylight saving rules") {
        cfg.timezone = "EST-05EDT,M3.2.0/2,M11.1.0/2";
        auto zone = resolveTimeZone(cfg);
        REQUIRE(zone);
        REQUIRE(zone.value());
        CHECK(zone.value()->base_utc_offset() == boost::posix_time::hours(-5));
        CHECK(zone.value()->has_dst());
        CHECK(zone.value()->dst_offset() == boost::posix_time::hours(1));
    }
}

TEST_CASE("BusinessHours: configuration errors", "[unit][timing][hours]") {
    SECTION("region name without a zone database") {
        auto cfg = test::officeHours();
        cfg.timezone = "America/Mexico_City";
        auto calc = BusinessHoursCalculator::create(cfg);
        REQUIRE_FALSE(calc);
        CHECK(calc.error().code == ErrorCode::UnknownTimeZone);
        CHECK(calc.error().kind() == ErrorKind::Config);
    }
    SECTION("missing zone database file") {
        auto cfg = test::officeHours();
        cfg.timezone = "America/Mexico_City";
        cfg.timezoneDatabase = "/nonexistent/date_time_zonespec.csv";
        auto calc = BusinessHoursCalculator::create(cfg);
        REQUIRE_FALSE(calc);
        CHECK(calc.error().code == ErrorCode::UnknownTimeZone);
    }
    SECTION("invalid window") {
        auto cfg = test::officeHours();
        cfg.officeStartHour = 18.0;
        auto r = overlapHours(cst(2024, 3, 4, 8), cst(2024, 3, 4, 20), cfg);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::InvalidConfiguration);
    }
}

TEST_CASE("BusinessHours: one-shot helper matches the calculator", "[unit][timing][hours]") {
    auto r = overlapHours(cst(2024, 3, 4, 8), cst(2024, 3, 5, 12), test::officeHours());
    REQUIRE(r);
    CHECK(r.value() == Approx(11.0));
}
