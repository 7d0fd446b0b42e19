/// @file test_ratio_calculator.cpp
/// @brief Tests for area ratios, demographic constants and the orbit scale

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "model/errors.hpp"
#include "model/ratio_calculator.hpp"

#include <cmath>
#include <limits>

using namespace contextviz;

namespace {

SpatialInput make_input(double house_yd2, double city_km2, const char* country) {
    return {{house_yd2, AreaUnit::SQ_YARDS}, {city_km2, AreaUnit::SQ_KILOMETERS}, country};
}

} // namespace

TEST_CASE("Ties round to even", "[ratio]") {
    CHECK(round_half_even(0.5) == 0.0);
    CHECK(round_half_even(1.5) == 2.0);
    CHECK(round_half_even(2.5) == 2.0);
    CHECK(round_half_even(3.5) == 4.0);
    CHECK(round_half_even(-2.5) == -2.0);
    CHECK(round_half_even(2.4) == 2.0);
    CHECK(round_half_even(2.6) == 3.0);
}

TEST_CASE("Area ratio is the rounded quotient", "[ratio]") {
    CHECK(compute_area_ratio(100.0, 10.0) == 10);
    CHECK(compute_area_ratio(10.0, 4.0) == 2);
    CHECK(compute_area_ratio(14.0, 4.0) == 4);
    CHECK(compute_area_ratio(1.0, 3.0) == 0);
    CHECK(compute_area_ratio(510072000.0e6, 50.0e6) == 10201440);
}

TEST_CASE("Area ratio rejects degenerate arithmetic", "[ratio]") {
    SECTION("Zero denominator") {
        CHECK_THROWS_AS(compute_area_ratio(100.0, 0.0), ArithmeticDegenerate);
    }

    SECTION("Non-positive numerator") {
        CHECK_THROWS_AS(compute_area_ratio(0.0, 10.0), InvalidInput);
        CHECK_THROWS_AS(compute_area_ratio(-5.0, 10.0), InvalidInput);
    }

    SECTION("Negative denominator") {
        CHECK_THROWS_AS(compute_area_ratio(5.0, -10.0), InvalidInput);
    }

    SECTION("Non-finite values") {
        double inf = std::numeric_limits<double>::infinity();
        double nan = std::numeric_limits<double>::quiet_NaN();
        CHECK_THROWS_AS(compute_area_ratio(inf, 10.0), InvalidInput);
        CHECK_THROWS_AS(compute_area_ratio(10.0, nan), InvalidInput);
    }

    SECTION("Quotient too large for a Ratio") {
        CHECK_THROWS_AS(compute_area_ratio(1.0e300, 1.0e-10), ArithmeticDegenerate);
    }
}

TEST_CASE("Area ratio does not grow with the denominator", "[ratio]") {
    const double a = 1.0e6;
    Ratio previous = compute_area_ratio(a, 1.0);
    for (double b = 2.0; b <= 5000.0; b += 7.0) {
        Ratio current = compute_area_ratio(a, b);
        INFO("b=" << b);
        CHECK(current <= previous);
        previous = current;
    }
    CHECK(compute_area_ratio(a, 10.0) > compute_area_ratio(a, 20.0));
}

TEST_CASE("Area ratio does not shrink with the numerator", "[ratio]") {
    const double b = 250.0;
    Ratio previous = compute_area_ratio(1.0, b);
    for (double a = 3.0; a <= 100000.0; a += 97.0) {
        Ratio current = compute_area_ratio(a, b);
        INFO("a=" << a);
        CHECK(current >= previous);
        previous = current;
    }
}

TEST_CASE("Spatial ratios for a 1500 sq. yard house in a 50 sq. km city", "[ratio]") {
    const CountryTable& table = CountryTable::instance();
    SpatialRatios ratios = compute_spatial_ratios(make_input(1500.0, 50.0, "Singapore"), table);

    CHECK(ratios.house_in_city == 39866);
    CHECK(ratios.city_in_world == 10201440);
    CHECK(ratios.city_in_country == 14);
}

TEST_CASE("A city can be larger than its country", "[ratio]") {
    SpatialRatios ratios =
        compute_spatial_ratios(make_input(1500.0, 5000.0, "Monaco"), CountryTable::instance());
    CHECK(ratios.city_in_country == 0);
    CHECK(ratios.city_in_world == 102014);
}

TEST_CASE("Country share never exceeds the world share", "[ratio]") {
    const CountryTable& table = CountryTable::instance();
    for (const std::string& name : table.sorted_names()) {
        SpatialInput input{{100.0, AreaUnit::SQ_METERS}, {1.0, AreaUnit::SQ_KILOMETERS}, name};
        SpatialRatios ratios = compute_spatial_ratios(input, table);
        INFO(name);
        CHECK(ratios.city_in_country <= ratios.city_in_world);
    }
}

TEST_CASE("Spatial ratios reject impossible inputs", "[ratio]") {
    const CountryTable& table = CountryTable::instance();

    SECTION("Unknown country") {
        CHECK_THROWS_AS(compute_spatial_ratios(make_input(1500.0, 50.0, "Atlantis"), table),
                        InvalidInput);
    }

    SECTION("House larger than the city") {
        SpatialInput input{{10.0, AreaUnit::SQ_MILES}, {1.0, AreaUnit::SQ_KILOMETERS}, "Singapore"};
        CHECK_THROWS_AS(compute_spatial_ratios(input, table), InvalidInput);
    }

    SECTION("City larger than the world") {
        CHECK_THROWS_AS(compute_spatial_ratios(make_input(1500.0, 2.0e9, "Singapore"), table),
                        InvalidInput);
    }
}

TEST_CASE("Demographic constants", "[ratio]") {
    constexpr DemographicRatio births = births_ratio();
    constexpr DemographicRatio deaths = deaths_ratio();

    CHECK(births.daily == 385000);
    CHECK(births.hourly == 16041);
    CHECK(deaths.daily == 165000);
    CHECK(deaths.hourly == 6875);
    CHECK(hourly_from_daily(23) == 0);
}

TEST_CASE("Earth orbit scale", "[ratio]") {
    CHECK(orbital_diameter() == 1693);
    CHECK(orbital_radius() == 846);

    double disc_share =
        static_cast<double>(EARTH_DISC_DIAMETER) / static_cast<double>(orbital_diameter());
    CHECK(disc_share < 0.01);
    CHECK(static_cast<double>(orbital_diameter()) ==
          Catch::Approx(ORBIT_BASE_DIAMETER * SUN_TO_ORBIT_DIAMETER_RATIO).margin(0.5));
}
