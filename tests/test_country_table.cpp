/// @file test_country_table.cpp
/// @brief Tests for the static country table and its prefix filter

#include <catch2/catch_test_macros.hpp>

#include "model/country_table.hpp"

#include <algorithm>
#include <stdexcept>

using namespace contextviz;

TEST_CASE("Built-in table has every country", "[countries]") {
    const CountryTable& table = CountryTable::instance();

    CHECK(table.size() == 231);
    CHECK(table.sorted_names().size() == table.size());
    CHECK(table.area_km2("Russia") == 17098242.0);
    CHECK(table.area_km2("Singapore") == 710.0);
    CHECK(table.area_km2("Monaco") == 2.0);
    CHECK(table.contains("Cote d'Ivoire"));
}

TEST_CASE("Lookups are exact and case-sensitive", "[countries]") {
    const CountryTable& table = CountryTable::instance();

    CHECK_FALSE(table.contains("singapore"));
    CHECK_FALSE(table.contains("Singapore "));
    CHECK_FALSE(table.contains(""));
    CHECK_THROWS_AS(table.area_km2("Atlantis"), std::out_of_range);
}

TEST_CASE("Names are sorted ascending", "[countries]") {
    const auto& names = CountryTable::instance().sorted_names();
    CHECK(std::is_sorted(names.begin(), names.end()));
    CHECK(names.front() == "Afghanistan");
    CHECK(names.back() == "Zimbabwe");
}

TEST_CASE("Prefix filter ignores case", "[countries]") {
    const CountryTable& table = CountryTable::instance();

    SECTION("Empty prefix lists everything") {
        CHECK(table.filter_by_prefix("").size() == table.size());
    }

    SECTION("Mixed-case prefix") {
        auto matches = table.filter_by_prefix("uNiTeD");
        REQUIRE(matches.size() == 4);
        CHECK(matches[0] == "United Arab Emirates");
        CHECK(matches[1] == "United Kingdom");
        CHECK(matches[2] == "United States");
        CHECK(matches[3] == "United States Virgin Islands");
    }

    SECTION("No match") {
        CHECK(table.filter_by_prefix("Zz").empty());
    }

    SECTION("Prefix longer than every name") {
        CHECK(table.filter_by_prefix("Saint Vincent and the Grenadines and more").empty());
    }
}

TEST_CASE("Duplicate names are rejected", "[countries]") {
    std::vector<CountryArea> entries = {{"Here", 1.0}, {"There", 2.0}, {"Here", 3.0}};
    CHECK_THROWS_AS(CountryTable(entries), std::invalid_argument);
}
