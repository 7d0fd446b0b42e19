#pragma once

/// @file visualization.hpp
/// @brief Builds the finished visualizations for each request
///
/// A request produces one or more Visualization values. Each owns its raster
/// and the viewport it should be shown in; nothing here touches the GUI.

#include "layout/grid_planner.hpp"
#include "model/form_validation.hpp"
#include "model/ratio_calculator.hpp"
#include "rendering/pixel_buffer.hpp"

#include <optional>
#include <string>
#include <vector>

namespace contextviz {

/// Window titles, shared with the tests
namespace titles {
constexpr const char* HOUSE_IN_CITY = "Your House in Your City";
constexpr const char* CITY_IN_COUNTRY_AND_WORLD = "Your City in Your Country and the World";
constexpr const char* EARTH_AND_SUN =
    "The Earth is an invisible speck in space, with a diameter < 1% of the Sun's";
constexpr const char* BIRTHS = "Births per day (and hr)";
constexpr const char* DEATHS = "Deaths per day (and hr)";
} // namespace titles

/// A rendered, displayable, exportable image
struct Visualization {
    std::string title;
    PixelBuffer image;
    int display_scale = 1; ///< Screen pixels per image pixel
    Viewport viewport;
};

/// Formats with comma thousands separators: 1234567 -> "1,234,567"
[[nodiscard]] std::string format_thousands(int64_t value);

/// Grid visualization of `ratio` cells, with an inset of `sub_ratio` cells
/// when sub_ratio > 0. The title gets " - 1 in <cells>" appended unless
/// `title_count` overrides that suffix.
/// @throws std::length_error if the grid is too large to rasterize
[[nodiscard]] Visualization make_ratio_visualization(
    Ratio ratio, const std::string& title, const ScreenSize& screen, Ratio sub_ratio = 0,
    const std::optional<std::string>& title_count = std::nullopt);

/// The Earth-orbit diagram
[[nodiscard]] Visualization make_orbit_visualization(const ScreenSize& screen);

/// House-in-city, city-in-country-and-world and the orbit diagram, in that
/// order. Either every visualization is built or an exception escapes.
/// @throws std::length_error naming the input to change when a grid is too
///         large to rasterize
[[nodiscard]] std::vector<Visualization> make_spatial_visualizations(const SpatialRatios& ratios,
                                                                     const ScreenSize& screen);

/// Births and/or deaths grids, each with the hourly share as its inset.
/// Returns an empty list when neither is selected.
[[nodiscard]] std::vector<Visualization> make_population_visualizations(
    const PopulationForm& form, const ScreenSize& screen);

} // namespace contextviz
