/// @file requests.hpp
/// @brief Turns form submissions and shortcuts into visualizations and files.
///
/// Each request either opens all of its visualizations or none of them; on
/// failure a single message is left in the status bar.

#pragma once

#include "app/app_state.hpp"
#include "model/country_table.hpp"

namespace contextviz {

/// Validates the Space tab and opens the house, city/world and orbit views.
void run_spatial_request(AppState& app, const CountryTable& countries);

/// Validates the Population tab and opens the births and/or deaths views.
void run_population_request(AppState& app);

/// Opens the save prompt for the active visualization, if any.
void begin_save(AppState& app);

/// Writes the prompt's target visualization to the confirmed path and
/// closes the prompt.
void finish_save(AppState& app);

} // namespace contextviz
