#include "engine/Errors.hpp"
#include "engine/UnitTable.hpp"

#include <cstdint>
#include <limits>

#include <doctest/doctest.h>

using gt::engine::ConfigError;
using gt::engine::Unit;
using gt::engine::UnitRatios;
using gt::engine::UnitTable;

TEST_CASE("default calendar uses four-week months")
{
    UnitTable units;
    CHECK(units.size_of(Unit::Second) == 1);
    CHECK(units.size_of(Unit::Minute) == 60);
    CHECK(units.size_of(Unit::Hour) == 3600);
    CHECK(units.size_of(Unit::Day) == 86400);
    CHECK(units.size_of(Unit::Week) == 604800);
    CHECK(units.size_of(Unit::Month) == 2419200);
    CHECK(units.size_of(Unit::Year) == 29030400);
    CHECK(units.speed_factor() == doctest::Approx(1.0));
}

TEST_CASE("unit names accept aliases and plurals")
{
    CHECK(gt::engine::find_unit("hr") == Unit::Hour);
    CHECK(gt::engine::find_unit("hours") == Unit::Hour);
    CHECK(gt::engine::find_unit("mins") == Unit::Minute);
    CHECK(gt::engine::find_unit("yrs") == Unit::Year);
    CHECK_FALSE(gt::engine::find_unit("s").has_value());
    CHECK_FALSE(gt::engine::find_unit("fortnight").has_value());

    UnitTable units;
    CHECK(units.size_of("mins") == units.size_of("min"));
    CHECK_THROWS_AS(units.size_of("fortnight"), gt::engine::UnknownUnitError);
    try
    {
        gt::engine::parse_unit("fortnights");
        FAIL("expected UnknownUnitError");
    }
    catch (gt::engine::UnknownUnitError const &ex)
    {
        CHECK(ex.unit() == "fortnights");
    }
}

TEST_CASE("all_units lists aliases largest first")
{
    UnitTable units;
    auto all = units.all_units();
    REQUIRE(all.size() == 9);
    CHECK(all.front().first == "year");
    CHECK(all[1].first == "yr");
    CHECK(all[1].second == all.front().second);
    CHECK(all.back().first == "sec");
    CHECK(all.back().second == 1);
    for (std::size_t i = 1; i < all.size(); ++i)
    {
        CHECK(all[i - 1].second >= all[i].second);
    }

    auto sizes = units.distinct_sizes_descending();
    REQUIRE(sizes.size() == 7);
    CHECK(sizes.front() == 29030400);
    CHECK(sizes.back() == 1);
}

TEST_CASE("ratios build a custom calendar")
{
    UnitRatios ratios;
    ratios.hours_per_day = 20;
    auto units = UnitTable::from_ratios(ratios, 4.0);
    CHECK(units.size_of(Unit::Day) == 72000);
    CHECK(units.size_of(Unit::Week) == 504000);
    CHECK(units.size_of(Unit::Year) == 24192000);
    CHECK(units.speed_factor() == doctest::Approx(4.0));

    auto overridden =
        UnitTable::from_ratios(UnitRatios{}, {{"yr", 2419200 * 10}}, 1.0);
    CHECK(overridden.size_of(Unit::Year) == 24192000);
}

TEST_CASE("invalid calendars are rejected")
{
    SUBCASE("unknown unit")
    {
        CHECK_THROWS_AS(UnitTable::configure({{"fortnight", 1209600}}, 1.0),
                        ConfigError);
    }
    SUBCASE("non-positive size")
    {
        CHECK_THROWS_AS(UnitTable::configure({{"min", 0}}, 1.0), ConfigError);
    }
    SUBCASE("second is fixed")
    {
        CHECK_THROWS_AS(UnitTable::configure({{"sec", 2}}, 1.0), ConfigError);
    }
    SUBCASE("not a whole multiple")
    {
        CHECK_THROWS_AS(UnitTable::configure({{"hour", 90}}, 1.0),
                        ConfigError);
    }
    SUBCASE("smaller than the unit below")
    {
        CHECK_THROWS_AS(UnitTable::configure({{"day", 1800}}, 1.0),
                        ConfigError);
    }
    SUBCASE("aliases disagree")
    {
        CHECK_THROWS_AS(
            UnitTable::configure({{"hour", 3600}, {"hr", 7200}}, 1.0),
            ConfigError);
    }
    SUBCASE("bad speed factor")
    {
        CHECK_THROWS_AS(UnitTable::configure({}, 0.0), ConfigError);
        CHECK_THROWS_AS(UnitTable::configure({}, -2.0), ConfigError);
        CHECK_THROWS_AS(
            UnitTable::configure({}, std::numeric_limits<double>::infinity()),
            ConfigError);
    }
    SUBCASE("overflowing ratios")
    {
        UnitRatios ratios;
        ratios.months_per_year = std::numeric_limits<std::int64_t>::max();
        CHECK_THROWS_AS(UnitTable::from_ratios(ratios, 1.0), ConfigError);
    }
}
