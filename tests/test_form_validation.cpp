/// @file test_form_validation.cpp
/// @brief Tests for form parsing and the validation messages

#include <catch2/catch_test_macros.hpp>

#include "model/errors.hpp"
#include "model/form_validation.hpp"

using namespace contextviz;

namespace {

SpatialForm filled_form() {
    SpatialForm form;
    form.house_text = "1500";
    form.city_text = "50";
    form.country = "Singapore";
    return form;
}

} // namespace

TEST_CASE("parse_area accepts plain decimals", "[validation]") {
    CHECK(parse_area("12.5") == 12.5);
    CHECK(parse_area("  1500 \t") == 1500.0);
    CHECK(parse_area("1e3") == 1000.0);
    CHECK(parse_area("-4") == -4.0);
}

TEST_CASE("parse_area rejects non-numeric text", "[validation]") {
    CHECK_FALSE(parse_area("").has_value());
    CHECK_FALSE(parse_area("   ").has_value());
    CHECK_FALSE(parse_area("abc").has_value());
    CHECK_FALSE(parse_area("12abc").has_value());
    CHECK_FALSE(parse_area("1 500").has_value());
    CHECK_FALSE(parse_area("inf").has_value());
    CHECK_FALSE(parse_area("nan").has_value());
    CHECK_FALSE(parse_area("1e999").has_value());
}

TEST_CASE("parse_area rejects hexadecimal input", "[validation]") {
    CHECK_FALSE(parse_area("0x10").has_value());
    CHECK_FALSE(parse_area(" 0X1A ").has_value());
    CHECK_FALSE(parse_area("-0x1p3").has_value());
    CHECK_FALSE(parse_area("+0x8").has_value());
    CHECK(parse_area("0.5") == 0.5);
    CHECK(parse_area("010") == 10.0);
}

TEST_CASE("Values too small to represent are numeric", "[validation]") {
    REQUIRE(parse_area("1e-320").has_value());
    CHECK(*parse_area("1e-320") > 0.0);
    CHECK(parse_area("1e-400") == 0.0);

    SpatialForm form;
    form.house_text = "1e-400";
    form.city_text = "50";
    form.country = "Singapore";
    CHECK_THROWS_WITH(validate_spatial_form(form, CountryTable::instance()),
                      "Please enter positive area values");
}

TEST_CASE("Valid spatial form", "[validation]") {
    SpatialForm form = filled_form();
    form.house_unit = AreaUnit::SQ_FEET;
    form.city_unit = AreaUnit::SQ_MILES;

    SpatialInput input = validate_spatial_form(form, CountryTable::instance());
    CHECK(input.house.magnitude == 1500.0);
    CHECK(input.house.unit == AreaUnit::SQ_FEET);
    CHECK(input.city.magnitude == 50.0);
    CHECK(input.city.unit == AreaUnit::SQ_MILES);
    CHECK(input.country == "Singapore");
}

TEST_CASE("Spatial form failures are reported in order", "[validation]") {
    const CountryTable& table = CountryTable::instance();
    SpatialForm form = filled_form();

    SECTION("Non-numeric wins over everything else") {
        form.house_text = "big";
        form.city_text = "-3";
        form.country = "Atlantis";
        CHECK_THROWS_WITH(validate_spatial_form(form, table), "Please enter numeric area values");
    }

    SECTION("Empty city field") {
        form.city_text = "";
        CHECK_THROWS_WITH(validate_spatial_form(form, table), "Please enter numeric area values");
    }

    SECTION("Non-positive wins over an unknown country") {
        form.city_text = "0";
        form.country = "Atlantis";
        CHECK_THROWS_WITH(validate_spatial_form(form, table), "Please enter positive area values");
    }

    SECTION("Negative house") {
        form.house_text = "-1500";
        CHECK_THROWS_AS(validate_spatial_form(form, table), InvalidInput);
    }

    SECTION("Unknown country") {
        form.country = "Atlantis";
        CHECK_THROWS_WITH(validate_spatial_form(form, table),
                          "Please select a country-name from the dropdown list");
    }

    SECTION("Country names must match exactly") {
        form.country = "singapore";
        CHECK_THROWS_AS(validate_spatial_form(form, table), InvalidInput);
    }
}

TEST_CASE("Population form needs at least one checkbox", "[validation]") {
    PopulationForm form;
    CHECK_THROWS_WITH(validate_population_form(form),
                      "Please select at least one visualization checkbox");

    form.show_births = true;
    CHECK_NOTHROW(validate_population_form(form));

    form.show_births = false;
    form.show_deaths = true;
    CHECK_NOTHROW(validate_population_form(form));
}
