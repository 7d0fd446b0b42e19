#pragma once

/// @file form_validation.hpp
/// @brief Checks raw form fields before any ratio is computed

#include "model/country_table.hpp"
#include "model/ratio_calculator.hpp"
#include "model/units.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace contextviz {

/// Raw contents of the Space tab
struct SpatialForm {
    std::string house_text;
    AreaUnit house_unit = AreaUnit::SQ_YARDS;
    std::string city_text;
    AreaUnit city_unit = AreaUnit::SQ_KILOMETERS;
    std::string country;
};

/// Raw contents of the Population tab
struct PopulationForm {
    bool show_births = false;
    bool show_deaths = false;
};

/// Parses a finite decimal number, ignoring surrounding whitespace.
/// Returns nullopt for empty, partially numeric, hexadecimal or non-finite
/// text. Values too small to represent parse as zero.
[[nodiscard]] std::optional<double> parse_area(std::string_view text);

/// Validates the Space tab. Checks run in order and the first failure wins:
/// numeric fields, positive fields, known country.
/// @throws InvalidInput carrying the message to show the user
[[nodiscard]] SpatialInput validate_spatial_form(const SpatialForm& form,
                                                 const CountryTable& countries);

/// @throws InvalidInput if neither checkbox is selected
void validate_population_form(const PopulationForm& form);

} // namespace contextviz
