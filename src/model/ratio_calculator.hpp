#pragma once

/// @file ratio_calculator.hpp
/// @brief Converts areas and demographic constants into "1 in N" ratios
///
/// Everything here is a pure function of its arguments and the static
/// country table. Callers validate form input first (see form_validation.hpp);
/// the functions below only reject arithmetic that cannot produce a ratio.

#include "model/country_table.hpp"
#include "model/units.hpp"

#include <cstdint>
#include <string>

namespace contextviz {

/// Number of small units that fit into one large unit
using Ratio = int64_t;

constexpr Ratio DAILY_BIRTHS = 385000;
constexpr Ratio DAILY_DEATHS = 165000;
constexpr Ratio HOURS_PER_DAY = 24;

/// Sun diameter over Earth's orbital diameter
constexpr double SUN_TO_ORBIT_DIAMETER_RATIO = 211.60;

/// Diameter, in pixels, that the orbit diagram scales by the ratio above
constexpr int ORBIT_BASE_DIAMETER = 8;

/// Diameter, in pixels, of the disc drawn inside the orbit
constexpr int EARTH_DISC_DIAMETER = 8;

/// Rounds to the nearest integer, ties to even.
[[nodiscard]] double round_half_even(double value);

/// round(numerator_m2 / denominator_m2).
/// A result of 0 means the numerator is less than half the denominator.
/// @throws ArithmeticDegenerate if the denominator is zero or the quotient
///         does not fit in a Ratio
/// @throws InvalidInput if the numerator is not positive, the denominator is
///         negative, or either is not finite
[[nodiscard]] Ratio compute_area_ratio(double numerator_m2, double denominator_m2);

/// Validated input of the spatial form
struct SpatialInput {
    AreaInput house;
    AreaInput city;
    std::string country;
};

/// The three ratios behind the spatial visualizations
struct SpatialRatios {
    Ratio house_in_city = 0;   ///< Houses that fit in the city
    Ratio city_in_world = 0;   ///< Cities that fit on the Earth's surface
    Ratio city_in_country = 0; ///< Cities that fit in the country (inset)
};

/// Computes the house/city/country/world ratios for one request.
/// @throws InvalidInput if the country is unknown, or the house is not
///         smaller than the city, or the city is not smaller than the world
[[nodiscard]] SpatialRatios compute_spatial_ratios(const SpatialInput& input,
                                                   const CountryTable& countries);

/// A per-day count and its per-hour share
struct DemographicRatio {
    Ratio daily = 0;
    Ratio hourly = 0;
};

/// Hourly share of a daily count, truncating the remainder
[[nodiscard]] constexpr Ratio hourly_from_daily(Ratio daily) {
    return daily / HOURS_PER_DAY;
}

[[nodiscard]] constexpr DemographicRatio births_ratio() {
    return {DAILY_BIRTHS, hourly_from_daily(DAILY_BIRTHS)};
}

[[nodiscard]] constexpr DemographicRatio deaths_ratio() {
    return {DAILY_DEATHS, hourly_from_daily(DAILY_DEATHS)};
}

/// Earth's orbital diameter in pixels when the Sun is ORBIT_BASE_DIAMETER wide
[[nodiscard]] int orbital_diameter();

/// Half of orbital_diameter(), rounded half to even
[[nodiscard]] int orbital_radius();

} // namespace contextviz
