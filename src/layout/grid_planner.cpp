/// @file grid_planner.cpp
/// @brief Grid, orbit and viewport sizing

#include "layout/grid_planner.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace contextviz {

namespace {

int capped(int extent, double fraction, int screen_extent) {
    int cap = static_cast<int>(fraction * static_cast<double>(screen_extent));
    return std::min(extent, cap);
}

} // namespace

int64_t GridPlan::cell_count() const {
    if (width <= 0 || height <= 0) {
        return 0;
    }
    // Ratios just below 2^63 plan grids whose product does not fit
    if (height > std::numeric_limits<int64_t>::max() / width) {
        return std::numeric_limits<int64_t>::max();
    }
    return width * height;
}

GridPlan plan_grid(Ratio ratio, double aspect_ratio, int screen_height, double overflow_fraction) {
    if (!(aspect_ratio > 0.0)) {
        throw std::invalid_argument("plan_grid() requires a positive aspect ratio");
    }

    double cells = static_cast<double>(std::max<Ratio>(ratio, 0));
    double height = round_half_even(std::sqrt(cells / aspect_ratio));
    double width = round_half_even(aspect_ratio * height);

    GridPlan plan;
    plan.height = std::max<int64_t>(1, static_cast<int64_t>(height));
    plan.width = std::max<int64_t>(1, static_cast<int64_t>(width));
    plan.overflow = static_cast<double>(plan.height) >
                    overflow_fraction * static_cast<double>(screen_height);
    return plan;
}

GridPlan plan_grid(Ratio ratio, Ratio sub_ratio, double aspect_ratio, int screen_height,
                   double overflow_fraction) {
    GridPlan plan = plan_grid(ratio, aspect_ratio, screen_height, overflow_fraction);
    plan.inset_side = inset_side_for(sub_ratio);
    if (plan.inset_side > std::min(plan.width, plan.height)) {
        throw std::invalid_argument("Inset side " + std::to_string(plan.inset_side) +
                                    " does not fit a " + std::to_string(plan.width) + "x" +
                                    std::to_string(plan.height) + " grid");
    }
    return plan;
}

int64_t inset_side_for(Ratio sub_ratio) {
    if (sub_ratio <= 0) {
        return 0;
    }
    return static_cast<int64_t>(round_half_even(std::sqrt(static_cast<double>(sub_ratio))));
}

OrbitPlan plan_orbit(const ScreenSize& screen) {
    OrbitPlan plan;
    plan.diameter = orbital_diameter();
    plan.radius = orbital_radius();
    plan.disc_diameter = EARTH_DISC_DIAMETER;
    plan.canvas_side = plan.diameter + 2 * ORBIT_MARGIN;

    double d = static_cast<double>(plan.diameter);
    plan.overflow_y = d > VIEWPORT_HEIGHT_FRACTION * static_cast<double>(screen.height);
    plan.overflow_x = d > ORBIT_VIEWPORT_WIDTH_FRACTION * static_cast<double>(screen.width);
    return plan;
}

Viewport plan_grid_viewport(const GridPlan& plan, const ScreenSize& screen) {
    Viewport view;
    view.scroll_width = static_cast<int>(plan.width * GRID_CELL_PIXELS);
    view.scroll_height = static_cast<int>(plan.height * GRID_CELL_PIXELS);
    view.scrollable = plan.overflow;

    if (plan.overflow) {
        view.visible_width = capped(view.scroll_width, GRID_VIEWPORT_WIDTH_FRACTION, screen.width);
        view.visible_height = capped(view.scroll_height, VIEWPORT_HEIGHT_FRACTION, screen.height);
    } else {
        view.visible_width = view.scroll_width;
        view.visible_height = view.scroll_height;
    }
    return view;
}

Viewport plan_orbit_viewport(const OrbitPlan& plan, const ScreenSize& screen) {
    Viewport view;
    view.scroll_width = plan.canvas_side;
    view.scroll_height = plan.canvas_side;
    view.scrollable = plan.overflow();
    view.visible_width = plan.canvas_side;
    view.visible_height = plan.canvas_side;

    if (plan.overflow()) {
        if (plan.overflow_x) {
            view.visible_width =
                capped(plan.canvas_side, ORBIT_VIEWPORT_WIDTH_FRACTION, screen.width);
        }
        view.visible_height = capped(plan.canvas_side, VIEWPORT_HEIGHT_FRACTION, screen.height);
    }
    return view;
}

} // namespace contextviz
