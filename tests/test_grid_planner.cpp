/// @file test_grid_planner.cpp
/// @brief Tests for grid sizing, insets, the orbit plan and viewports

#include <catch2/catch_test_macros.hpp>

#include "layout/grid_planner.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

using namespace contextviz;

namespace {

const ScreenSize FULL_HD{1920, 1080};

} // namespace

TEST_CASE("Births grid on a 1920x1080 screen", "[grid]") {
    GridPlan plan = plan_grid(385000, 16041, FULL_HD.aspect_ratio(), FULL_HD.height);

    CHECK(plan.height == 465);
    CHECK(plan.width == 827);
    CHECK(plan.inset_side == 127);
    CHECK(plan.overflow);
}

TEST_CASE("Deaths grid fits without scrolling", "[grid]") {
    GridPlan plan = plan_grid(165000, 6875, FULL_HD.aspect_ratio(), FULL_HD.height);

    CHECK(plan.height == 305);
    CHECK(plan.width == 542);
    CHECK(plan.inset_side == 83);
    CHECK_FALSE(plan.overflow);
}

TEST_CASE("Grid dimensions are at least one cell", "[grid]") {
    for (Ratio ratio : {Ratio{0}, Ratio{1}, Ratio{2}, Ratio{-7}}) {
        for (double aspect : {0.5, 1.0, 16.0 / 9.0, 4.0}) {
            GridPlan plan = plan_grid(ratio, aspect, 1080);
            INFO("ratio=" << ratio << " aspect=" << aspect);
            CHECK(plan.width >= 1);
            CHECK(plan.height >= 1);
            CHECK(plan.inset_side == 0);
        }
    }
}

TEST_CASE("Large grids approximate the ratio closely", "[grid]") {
    for (Ratio ratio : {Ratio{10000}, Ratio{39866}, Ratio{1000000}, Ratio{10201440}}) {
        for (double aspect : {1.0, 16.0 / 10.0, 16.0 / 9.0}) {
            GridPlan plan = plan_grid(ratio, aspect, 1080);
            double cells = static_cast<double>(plan.cell_count());
            double error = std::fabs(cells - static_cast<double>(ratio)) / static_cast<double>(ratio);
            INFO("ratio=" << ratio << " aspect=" << aspect << " cells=" << cells);
            CHECK(error < 0.02);
        }
    }
}

TEST_CASE("Grid keeps the screen aspect ratio", "[grid]") {
    GridPlan plan = plan_grid(10201440, FULL_HD.aspect_ratio(), FULL_HD.height);
    CHECK(plan.height == 2395);
    CHECK(plan.width == 4258);
    CHECK(plan.overflow);
}

TEST_CASE("Cell count saturates instead of overflowing", "[grid]") {
    // Largest ratios the calculator accepts plan grids past INT64_MAX cells
    GridPlan plan = plan_grid(Ratio{9223372036854774783}, FULL_HD.aspect_ratio(), FULL_HD.height);
    CHECK(plan.width > 0);
    CHECK(plan.height > 0);
    CHECK(plan.cell_count() == std::numeric_limits<int64_t>::max());

    GridPlan empty;
    empty.width = 0;
    CHECK(empty.cell_count() == 0);

    CHECK(plan_grid(100, 1.0, 1080).cell_count() == 100);
}

TEST_CASE("Inset must fit inside the grid", "[grid]") {
    SECTION("Inset equal to the grid side") {
        GridPlan plan = plan_grid(100, 99, 1.0, 1080);
        CHECK(plan.width == 10);
        CHECK(plan.height == 10);
        CHECK(plan.inset_side == 10);
    }

    SECTION("Inset larger than the grid") {
        CHECK_THROWS_AS(plan_grid(100, 150, 1.0, 1080), std::invalid_argument);
    }

    SECTION("Zero sub-ratio means no inset") {
        CHECK(plan_grid(100, 0, 1.0, 1080).inset_side == 0);
        CHECK(inset_side_for(0) == 0);
        CHECK(inset_side_for(-3) == 0);
        CHECK(inset_side_for(14) == 4);
    }
}

TEST_CASE("Aspect ratio must be positive", "[grid]") {
    CHECK_THROWS_AS(plan_grid(100, 0.0, 1080), std::invalid_argument);
    CHECK_THROWS_AS(plan_grid(100, -1.0, 1080), std::invalid_argument);
}

TEST_CASE("Overflow depends on the screen height", "[grid]") {
    // 465 rows: over 0.43 of 1080, under 0.43 of 1200
    CHECK(plan_grid(385000, 16.0 / 9.0, 1080).overflow);
    CHECK_FALSE(plan_grid(385000, 16.0 / 9.0, 1200).overflow);
    CHECK(plan_grid(385000, 16.0 / 9.0, 1200, 0.3).overflow);
}

TEST_CASE("Orbit plan", "[grid][orbit]") {
    SECTION("1920x1080 overflows vertically only") {
        OrbitPlan plan = plan_orbit(FULL_HD);
        CHECK(plan.diameter == 1693);
        CHECK(plan.radius == 846);
        CHECK(plan.disc_diameter == 8);
        CHECK(plan.canvas_side == 1701);
        CHECK(plan.overflow_y);
        CHECK_FALSE(plan.overflow_x);
        CHECK(plan.overflow());
    }

    SECTION("Narrow screen overflows both ways") {
        OrbitPlan plan = plan_orbit({1280, 1024});
        CHECK(plan.overflow_x);
        CHECK(plan.overflow_y);
    }

    SECTION("4K screen fits the orbit") {
        OrbitPlan plan = plan_orbit({3840, 2160});
        CHECK_FALSE(plan.overflow());
    }
}

TEST_CASE("Grid viewports", "[grid][viewport]") {
    SECTION("Overflowing grid is capped to the screen fractions") {
        GridPlan plan = plan_grid(385000, FULL_HD.aspect_ratio(), FULL_HD.height);
        Viewport view = plan_grid_viewport(plan, FULL_HD);
        CHECK(view.scroll_width == 1654);
        CHECK(view.scroll_height == 930);
        CHECK(view.visible_width == 1651);
        CHECK(view.visible_height == 928);
        CHECK(view.scrollable);
    }

    SECTION("Fitting grid shows everything") {
        GridPlan plan = plan_grid(165000, FULL_HD.aspect_ratio(), FULL_HD.height);
        Viewport view = plan_grid_viewport(plan, FULL_HD);
        CHECK(view.visible_width == 1084);
        CHECK(view.visible_height == 610);
        CHECK(view.scroll_width == 1084);
        CHECK(view.scroll_height == 610);
        CHECK_FALSE(view.scrollable);
    }
}

TEST_CASE("Orbit viewports", "[grid][viewport]") {
    SECTION("Only the height is capped when only the height overflows") {
        Viewport view = plan_orbit_viewport(plan_orbit(FULL_HD), FULL_HD);
        CHECK(view.scroll_width == 1701);
        CHECK(view.scroll_height == 1701);
        CHECK(view.visible_width == 1701);
        CHECK(view.visible_height == 928);
        CHECK(view.scrollable);
    }

    SECTION("Both axes capped") {
        ScreenSize screen{1280, 1024};
        Viewport view = plan_orbit_viewport(plan_orbit(screen), screen);
        CHECK(view.visible_width == 1228);
        CHECK(view.visible_height == 880);
    }

    SECTION("No overflow") {
        ScreenSize screen{3840, 2160};
        Viewport view = plan_orbit_viewport(plan_orbit(screen), screen);
        CHECK(view.visible_width == 1701);
        CHECK(view.visible_height == 1701);
        CHECK_FALSE(view.scrollable);
    }
}
