/// @file test_visualization.cpp
/// @brief Tests for titles, display scale and the per-request visualization sets

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "rendering/visualization.hpp"

#include <stdexcept>
#include <string>

using namespace contextviz;

namespace {

const ScreenSize FULL_HD{1920, 1080};

} // namespace

TEST_CASE("Thousands separators", "[visualization]") {
    CHECK(format_thousands(0) == "0");
    CHECK(format_thousands(999) == "999");
    CHECK(format_thousands(1000) == "1,000");
    CHECK(format_thousands(40050) == "40,050");
    CHECK(format_thousands(10197910) == "10,197,910");
    CHECK(format_thousands(-1234) == "-1,234");
}

TEST_CASE("Spatial request builds three views", "[visualization]") {
    SpatialRatios ratios;
    ratios.house_in_city = 39866;
    ratios.city_in_world = 10201440;
    ratios.city_in_country = 14;

    auto views = make_spatial_visualizations(ratios, FULL_HD);
    REQUIRE(views.size() == 3);

    SECTION("House in city") {
        const Visualization& viz = views[0];
        CHECK(viz.title == "Your House in Your City - 1 in 40,050");
        CHECK(viz.image.width() == 267);
        CHECK(viz.image.height() == 150);
        CHECK(viz.display_scale == 2);
        CHECK_FALSE(viz.viewport.scrollable);
        CHECK(viz.image.at(1, 0) == palette::BLACK);
    }

    SECTION("City in country and world") {
        const Visualization& viz = views[1];
        CHECK(viz.title == "Your City in Your Country and the World - 1 in 10,197,910");
        CHECK(viz.image.width() == 4258);
        CHECK(viz.image.height() == 2395);
        CHECK(viz.viewport.scrollable);
        CHECK(viz.image.at(1, 0) == palette::INSET_GREEN);
        CHECK(viz.image.at(3, 2) == palette::INSET_GREEN);
        CHECK(viz.image.at(5, 0) == palette::BLACK);
    }

    SECTION("Earth and Sun") {
        const Visualization& viz = views[2];
        CHECK(viz.title == titles::EARTH_AND_SUN);
        CHECK(viz.display_scale == 1);
        CHECK(viz.image.width() == 1701);
        CHECK(viz.viewport.visible_height == 928);
    }
}

TEST_CASE("City larger than its country has no inset", "[visualization]") {
    SpatialRatios ratios;
    ratios.house_in_city = 100;
    ratios.city_in_world = 102014;
    ratios.city_in_country = 0;

    auto views = make_spatial_visualizations(ratios, FULL_HD);
    REQUIRE(views.size() == 3);
    CHECK(views[1].image.at(1, 0) == palette::BLACK);
}

TEST_CASE("Population request", "[visualization]") {
    PopulationForm form;

    SECTION("Nothing selected") {
        CHECK(make_population_visualizations(form, FULL_HD).empty());
    }

    SECTION("Births only") {
        form.show_births = true;
        auto views = make_population_visualizations(form, FULL_HD);
        REQUIRE(views.size() == 1);
        CHECK(views[0].title == "Births per day (and hr) ~ 385000");
        CHECK(views[0].image.width() == 827);
        CHECK(views[0].image.height() == 465);
        CHECK(views[0].display_scale == 2);
        CHECK(views[0].viewport.scrollable);
        CHECK(views[0].image.at(126, 125) == palette::INSET_GREEN);
        CHECK(views[0].image.at(128, 125) == palette::BLACK);
    }

    SECTION("Both, births first") {
        form.show_births = true;
        form.show_deaths = true;
        auto views = make_population_visualizations(form, FULL_HD);
        REQUIRE(views.size() == 2);
        CHECK(views[0].title == "Births per day (and hr) ~ 385000");
        CHECK(views[1].title == "Deaths per day (and hr) ~ 165000");
        CHECK_FALSE(views[1].viewport.scrollable);
    }
}

TEST_CASE("Ratio visualization title suffix", "[visualization]") {
    Visualization viz = make_ratio_visualization(100, "Hundred", {1000, 1000});
    CHECK(viz.title == "Hundred - 1 in 100");

    Visualization custom = make_ratio_visualization(100, "Hundred", {1000, 1000}, 0, " ~ 100");
    CHECK(custom.title == "Hundred ~ 100");
}

TEST_CASE("Grids too large to draw are refused", "[visualization]") {
    CHECK_THROWS_AS(make_ratio_visualization(Ratio{1000000000}, "Huge", FULL_HD), std::length_error);
    CHECK_THROWS_AS(make_ratio_visualization(Ratio{9223372036854774783}, "Huge", FULL_HD),
                    std::length_error);
}

TEST_CASE("Oversized spatial grids name the input to change", "[visualization]") {
    using Catch::Matchers::ContainsSubstring;

    SECTION("House in city: a 10 sq. foot house in a 1000 sq. km city") {
        SpatialRatios ratios;
        ratios.house_in_city = 1076391505;
        ratios.city_in_world = 510072;
        ratios.city_in_country = 3288;
        CHECK_THROWS_WITH(make_spatial_visualizations(ratios, FULL_HD),
                          ContainsSubstring("use a larger house or a smaller city area"));
    }

    SECTION("City in world") {
        SpatialRatios ratios;
        ratios.house_in_city = 100;
        ratios.city_in_world = 1000000000;
        ratios.city_in_country = 14;
        CHECK_THROWS_WITH(make_spatial_visualizations(ratios, FULL_HD),
                          ContainsSubstring("use a larger city area") &&
                              !ContainsSubstring("house"));
    }

    SECTION("Ratio near the int64 limit") {
        SpatialRatios ratios;
        ratios.house_in_city = Ratio{9223372036854774783};
        ratios.city_in_world = 1;
        CHECK_THROWS_AS(make_spatial_visualizations(ratios, FULL_HD), std::length_error);
    }
}
