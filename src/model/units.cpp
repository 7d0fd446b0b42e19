/// @file units.cpp
/// @brief Area unit conversion table

#include "model/units.hpp"

#include <stdexcept>

namespace contextviz {

double to_square_meters(double magnitude, AreaUnit unit) {
    switch (unit) {
    case AreaUnit::SQ_FEET:
        return magnitude * SQ_FEET_TO_M2;
    case AreaUnit::SQ_YARDS:
        return magnitude * SQ_YARDS_TO_M2;
    case AreaUnit::SQ_METERS:
        return magnitude;
    case AreaUnit::SQ_KILOMETERS:
        return magnitude * SQ_KM_TO_M2;
    case AreaUnit::SQ_MILES:
        // Miles go through km² first, matching the published 2.58999 factor
        return magnitude * SQ_MILES_TO_SQ_KM * SQ_KM_TO_M2;
    }
    throw std::invalid_argument("Unknown area unit");
}

double to_square_meters(const AreaInput& area) {
    return to_square_meters(area.magnitude, area.unit);
}

double km2_to_m2(double km2) {
    return km2 * SQ_KM_TO_M2;
}

std::string_view unit_label(AreaUnit unit) {
    switch (unit) {
    case AreaUnit::SQ_FEET:
        return "sq. feet";
    case AreaUnit::SQ_YARDS:
        return "sq. yards";
    case AreaUnit::SQ_METERS:
        return "sq. meters";
    case AreaUnit::SQ_KILOMETERS:
        return "sq. kms";
    case AreaUnit::SQ_MILES:
        return "sq. miles";
    }
    return "???";
}

} // namespace contextviz
