/// @file test_save_path.cpp
/// @brief Tests for default export names and extension handling

#include <catch2/catch_test_macros.hpp>

#include "io/save_path.hpp"

#include <string>

using namespace contextviz;

TEST_CASE("Default file names come from the title", "[save]") {
    CHECK(default_file_name("Your House in Your City - 1 in 40,050") ==
          "your_house_in_your_city_1_in_40_050.png");
    CHECK(default_file_name("Births per day (and hr) ~ 385000") ==
          "births_per_day_and_hr_385000.png");
    CHECK(default_file_name("  --Leading and trailing--  ") == "leading_and_trailing.png");
    CHECK(default_file_name("") == "visualization.png");
    CHECK(default_file_name("~~~") == "visualization.png");
}

TEST_CASE("Default save path ends with the file name", "[save]") {
    std::string path = default_save_path("Deaths per day (and hr) ~ 165000");
    std::string name = "deaths_per_day_and_hr_165000.png";
    REQUIRE(path.size() >= name.size());
    CHECK(path.compare(path.size() - name.size(), name.size(), name) == 0);
}

TEST_CASE("PNG extension is added only when missing", "[save]") {
    CHECK(with_png_extension("out") == "out.png");
    CHECK(with_png_extension("dir/out") == "dir/out.png");
    CHECK(with_png_extension("out.png") == "out.png");
    CHECK(with_png_extension("picture.jpg") == "picture.jpg");
    CHECK(with_png_extension("") == "");
}
