/// @file ratio_calculator.cpp
/// @brief Area ratio arithmetic and the fixed Earth/Sun scale

#include "model/ratio_calculator.hpp"

#include "model/errors.hpp"

#include <cmath>
#include <limits>

namespace contextviz {

double round_half_even(double value) {
    double rounded = std::round(value);
    if (std::fabs(value - std::trunc(value)) == 0.5) {
        rounded = 2.0 * std::round(value / 2.0);
    }
    return rounded;
}

Ratio compute_area_ratio(double numerator_m2, double denominator_m2) {
    if (denominator_m2 == 0.0) {
        throw ArithmeticDegenerate("Area ratio has a zero denominator");
    }
    if (!std::isfinite(numerator_m2) || !std::isfinite(denominator_m2)) {
        throw InvalidInput("Area values must be finite");
    }
    if (numerator_m2 <= 0.0 || denominator_m2 < 0.0) {
        throw InvalidInput("Please enter positive area values");
    }

    double quotient = round_half_even(numerator_m2 / denominator_m2);
    // 2^63 is exactly representable; anything at or above it overflows Ratio
    constexpr double RATIO_LIMIT = 9223372036854775808.0;
    if (!std::isfinite(quotient) || quotient >= RATIO_LIMIT) {
        throw ArithmeticDegenerate("Area ratio is too large to represent");
    }
    return static_cast<Ratio>(quotient);
}

SpatialRatios compute_spatial_ratios(const SpatialInput& input, const CountryTable& countries) {
    if (!countries.contains(input.country)) {
        throw InvalidInput("Please select a country-name from the dropdown list");
    }

    double house_m2 = to_square_meters(input.house);
    double city_m2 = to_square_meters(input.city);
    double country_m2 = km2_to_m2(countries.area_km2(input.country));
    double world_m2 = km2_to_m2(WORLD_AREA_KM2);

    SpatialRatios ratios;
    ratios.house_in_city = compute_area_ratio(city_m2, house_m2);
    if (ratios.house_in_city < 1) {
        throw InvalidInput("Please enter a city area larger than the house area");
    }
    ratios.city_in_world = compute_area_ratio(world_m2, city_m2);
    if (ratios.city_in_world < 1) {
        throw InvalidInput("Please enter a city area smaller than the world");
    }
    // May round to 0 for a city larger than its country; that just drops the inset
    ratios.city_in_country = compute_area_ratio(country_m2, city_m2);
    return ratios;
}

int orbital_diameter() {
    return static_cast<int>(
        round_half_even(static_cast<double>(ORBIT_BASE_DIAMETER) * SUN_TO_ORBIT_DIAMETER_RATIO));
}

int orbital_radius() {
    return static_cast<int>(round_half_even(static_cast<double>(orbital_diameter()) / 2.0));
}

} // namespace contextviz
