#pragma once

/// @file units.hpp
/// @brief Area units accepted by the input form and their exact conversion to m²

#include <array>
#include <string_view>

namespace contextviz {

/// Units an area can be entered in. House areas use the first three,
/// city areas the last two.
enum class AreaUnit {
    SQ_FEET,
    SQ_YARDS,
    SQ_METERS,
    SQ_KILOMETERS,
    SQ_MILES,
};

/// A user-entered area: a magnitude in some unit.
struct AreaInput {
    double magnitude = 0.0;
    AreaUnit unit = AreaUnit::SQ_METERS;
};

constexpr double SQ_FEET_TO_M2 = 0.092903;
constexpr double SQ_YARDS_TO_M2 = 0.836127;
constexpr double SQ_KM_TO_M2 = 1000000.0;
constexpr double SQ_MILES_TO_SQ_KM = 2.58999;

/// World surface area in km²
constexpr double WORLD_AREA_KM2 = 510072000.0;

/// Units offered for the house-area selector, default first
constexpr std::array<AreaUnit, 3> HOUSE_AREA_UNITS = {AreaUnit::SQ_YARDS, AreaUnit::SQ_FEET,
                                                      AreaUnit::SQ_METERS};

/// Units offered for the city-area selector, default first
constexpr std::array<AreaUnit, 2> CITY_AREA_UNITS = {AreaUnit::SQ_KILOMETERS,
                                                     AreaUnit::SQ_MILES};

/// Converts a magnitude in the given unit to square meters.
/// Applies exactly one documented multiplier, no extra rounding.
[[nodiscard]] double to_square_meters(double magnitude, AreaUnit unit);

/// Convenience overload for an AreaInput.
[[nodiscard]] double to_square_meters(const AreaInput& area);

/// Converts km² to m².
[[nodiscard]] double km2_to_m2(double km2);

/// Short label shown on the unit selector ("sq. yards", "sq. kms", ...)
[[nodiscard]] std::string_view unit_label(AreaUnit unit);

} // namespace contextviz
