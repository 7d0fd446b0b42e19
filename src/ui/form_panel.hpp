/// @file form_panel.hpp
/// @brief Left-hand input form: Space and Population tabs.
///
/// All widgets are drawn with Raylib primitives (no raygui/ImGui). The panel
/// reports requests back to the caller, which validates the form and builds
/// the visualizations.

#pragma once

#include "model/country_table.hpp"
#include "model/form_validation.hpp"

#include <raylib.h>

#include <string>

namespace contextviz {

enum class FormTab {
    SPACE,
    POPULATION,
};

/// Text field that currently receives typed characters
enum class FocusField {
    NONE,
    HOUSE_AREA,
    CITY_AREA,
    COUNTRY,
};

/// Actions the form can request from the main loop
struct FormAction {
    bool spatial_requested = false;    ///< Visualize pressed on the Space tab
    bool population_requested = false; ///< Visualize pressed on the Population tab
};

/// Persistent form state, kept across frames
struct FormState {
    FormTab tab = FormTab::SPACE;
    SpatialForm spatial;
    PopulationForm population;
    FocusField focus = FocusField::HOUSE_AREA;

    // Country suggestion list
    bool dropdown_open = false;
    int dropdown_scroll = 0;     ///< First visible suggestion
    int dropdown_highlight = -1; ///< Keyboard selection, -1 = none
};

/// Draws the form and handles mouse/keyboard interaction.
/// @param state       Mutable form state (persists across frames)
/// @param countries   Source of the country suggestions
/// @param interactive False while a modal prompt owns the keyboard and mouse
/// @param panel       Screen rectangle the form occupies
/// @return Requests raised this frame
FormAction draw_form_panel(FormState& state, const CountryTable& countries, bool interactive,
                           Rectangle panel);

} // namespace contextviz
