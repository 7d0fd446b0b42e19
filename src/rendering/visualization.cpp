/// @file visualization.cpp
/// @brief Plans, rasterizes and titles each visualization

#include "rendering/visualization.hpp"

#include <stdexcept>
#include <string>

namespace contextviz {

namespace {

constexpr const char* HOUSE_GRID_ADVICE = "use a larger house or a smaller city area";
constexpr const char* CITY_GRID_ADVICE = "use a larger city area";

/// Runs `build`, adding to a raster-cap failure which input to change.
template <typename Build>
Visualization build_with_advice(Build build, const char* advice) {
    try {
        return build();
    } catch (const std::length_error& e) {
        throw std::length_error(std::string(e.what()) + "; " + advice);
    }
}

Visualization make_demographic_visualization(const DemographicRatio& ratio, const char* title,
                                             const ScreenSize& screen) {
    return make_ratio_visualization(ratio.daily, title, screen, ratio.hourly,
                                    " ~ " + std::to_string(ratio.daily));
}

} // namespace

std::string format_thousands(int64_t value) {
    std::string digits = std::to_string(value);
    bool negative = !digits.empty() && digits.front() == '-';
    if (negative) {
        digits.erase(digits.begin());
    }
    std::string out;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) {
            out.insert(out.begin(), ',');
        }
        out.insert(out.begin(), *it);
        count++;
    }
    if (negative) {
        out.insert(out.begin(), '-');
    }
    return out;
}

Visualization make_ratio_visualization(Ratio ratio, const std::string& title,
                                       const ScreenSize& screen, Ratio sub_ratio,
                                       const std::optional<std::string>& title_count) {
    GridPlan plan = sub_ratio > 0
                        ? plan_grid(ratio, sub_ratio, screen.aspect_ratio(), screen.height)
                        : plan_grid(ratio, screen.aspect_ratio(), screen.height);

    Visualization viz;
    viz.image = rasterize_grid(plan);
    viz.title = title + title_count.value_or(" - 1 in " + format_thousands(plan.cell_count()));
    viz.display_scale = GRID_CELL_PIXELS;
    viz.viewport = plan_grid_viewport(plan, screen);
    return viz;
}

Visualization make_orbit_visualization(const ScreenSize& screen) {
    OrbitPlan plan = plan_orbit(screen);

    Visualization viz;
    viz.image = rasterize_orbit(plan);
    viz.title = titles::EARTH_AND_SUN;
    viz.display_scale = 1;
    viz.viewport = plan_orbit_viewport(plan, screen);
    return viz;
}

std::vector<Visualization> make_spatial_visualizations(const SpatialRatios& ratios,
                                                       const ScreenSize& screen) {
    std::vector<Visualization> out;
    out.push_back(build_with_advice(
        [&] { return make_ratio_visualization(ratios.house_in_city, titles::HOUSE_IN_CITY, screen); },
        HOUSE_GRID_ADVICE));
    out.push_back(build_with_advice(
        [&] {
            return make_ratio_visualization(ratios.city_in_world,
                                            titles::CITY_IN_COUNTRY_AND_WORLD, screen,
                                            ratios.city_in_country);
        },
        CITY_GRID_ADVICE));
    out.push_back(make_orbit_visualization(screen));
    return out;
}

std::vector<Visualization> make_population_visualizations(const PopulationForm& form,
                                                          const ScreenSize& screen) {
    std::vector<Visualization> out;
    if (form.show_births) {
        out.push_back(make_demographic_visualization(births_ratio(), titles::BIRTHS, screen));
    }
    if (form.show_deaths) {
        out.push_back(make_demographic_visualization(deaths_ratio(), titles::DEATHS, screen));
    }
    return out;
}

} // namespace contextviz
