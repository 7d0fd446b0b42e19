#pragma once

/// @file grid_planner.hpp
/// @brief Sizes a pixel grid so that width x height approximates a ratio
///
/// A grid keeps the screen's aspect ratio: height = round(sqrt(ratio / aspect)),
/// width = round(aspect * height). The product is only approximately the
/// ratio; the rounding error is accepted, not corrected. Grids are drawn at
/// GRID_CELL_PIXELS screen pixels per cell.

#include "model/ratio_calculator.hpp"

#include <cstdint>

namespace contextviz {

/// Screen pixels per grid cell, along each axis
constexpr int GRID_CELL_PIXELS = 2;

/// Fraction of the screen a scrolling viewport may occupy
constexpr double VIEWPORT_HEIGHT_FRACTION = 0.86;
constexpr double GRID_VIEWPORT_WIDTH_FRACTION = 0.86;
constexpr double ORBIT_VIEWPORT_WIDTH_FRACTION = 0.96;

/// A grid overflows when its rows exceed this fraction of the screen height.
/// At GRID_CELL_PIXELS per cell this is exactly the point where the drawn grid
/// no longer fits a VIEWPORT_HEIGHT_FRACTION viewport.
constexpr double GRID_OVERFLOW_FRACTION = VIEWPORT_HEIGHT_FRACTION / GRID_CELL_PIXELS;

/// Blank border around the orbit circle, in pixels
constexpr int ORBIT_MARGIN = 4;

/// Physical screen dimensions in pixels
struct ScreenSize {
    int width = 1920;
    int height = 1080;

    [[nodiscard]] double aspect_ratio() const {
        return static_cast<double>(width) / static_cast<double>(height);
    }
};

/// How a ratio is drawn as a grid
struct GridPlan {
    int64_t width = 1;
    int64_t height = 1;
    bool overflow = false; ///< Grid needs a scrolling viewport
    int64_t inset_side = 0; ///< Side of the inset square in cells, 0 = no inset

    /// width * height, saturating at INT64_MAX; 0 for an empty plan
    [[nodiscard]] int64_t cell_count() const;
};

/// Plans a grid for `ratio` cells on a screen of the given aspect ratio.
/// Ratios below 1 are not rejected; they yield a 1x1 grid.
/// @param overflow_fraction Rows above this fraction of screen_height overflow
[[nodiscard]] GridPlan plan_grid(Ratio ratio, double aspect_ratio, int screen_height,
                                 double overflow_fraction = GRID_OVERFLOW_FRACTION);

/// Plans a grid with an inset square of round(sqrt(sub_ratio)) cells per side.
/// @throws std::invalid_argument if the inset does not fit inside the grid
[[nodiscard]] GridPlan plan_grid(Ratio ratio, Ratio sub_ratio, double aspect_ratio,
                                 int screen_height,
                                 double overflow_fraction = GRID_OVERFLOW_FRACTION);

/// round(sqrt(sub_ratio)); 0 for sub_ratio <= 0
[[nodiscard]] int64_t inset_side_for(Ratio sub_ratio);

/// Geometry of the Earth-orbit diagram
struct OrbitPlan {
    int diameter = 0;      ///< Orbit circle diameter
    int radius = 0;        ///< Offset of the disc from the canvas origin
    int disc_diameter = 0; ///< Size of the central disc
    int canvas_side = 0;   ///< Square canvas: diameter plus margins
    bool overflow_x = false;
    bool overflow_y = false;

    [[nodiscard]] bool overflow() const { return overflow_x || overflow_y; }
};

[[nodiscard]] OrbitPlan plan_orbit(const ScreenSize& screen);

/// Visible area of a drawing and the region it scrolls over
struct Viewport {
    int visible_width = 0;
    int visible_height = 0;
    int scroll_width = 0;  ///< Full drawing extent
    int scroll_height = 0;
    bool scrollable = false;
};

/// Viewport for a grid drawn at GRID_CELL_PIXELS per cell.
/// Overflowing grids are capped at the viewport fractions of the screen.
[[nodiscard]] Viewport plan_grid_viewport(const GridPlan& plan, const ScreenSize& screen);

/// Viewport for the orbit diagram. Height is capped when either axis
/// overflows; width only when the horizontal axis does.
[[nodiscard]] Viewport plan_orbit_viewport(const OrbitPlan& plan, const ScreenSize& screen);

} // namespace contextviz
