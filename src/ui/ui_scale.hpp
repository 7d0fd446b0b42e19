/// @file ui_scale.hpp
/// @brief Global UI scaling state derived from the current window dimensions.
///
/// Single source of truth for responsive layout values so that the form,
/// the viewer tabs and the save prompt adapt to the window size without
/// every function needing extra parameters.

#pragma once

#include <algorithm>
#include <cmath>

namespace contextviz {

/// Recalculated once per frame from the current window size.
struct UIScale {
    float factor = 1.0f;     ///< Master scale: screen_h / 720
    float panel_w = 360.0f;  ///< Left-side form panel width
    float margin = 10.0f;    ///< Outer margin around panels

    int font_normal = 16;
    int font_small = 14;
    int font_big = 21;
    int font_tiny = 12;

    float row_height = 23.0f;
    float padding = 10.0f;
    float button_height = 34.65f;
    float field_height = 32.34f;
    float row_gap = 8.0f;

    float tab_height = 30.0f;     ///< Form tabs and viewer tabs
    float scrollbar_w = 12.0f;    ///< Viewer scrollbar thickness
    float status_h = 26.0f;       ///< Status bar along the bottom edge
    float label_w = 90.0f;        ///< Width of the form's field labels
    int dropdown_rows = 8;        ///< Country suggestions shown at once
};

/// Updates the global UI scale from the current window dimensions.
/// Call once per frame, before drawing any panel.
void update_ui_scale(int screen_w, int screen_h);

/// Returns a const reference to the current UI scale values.
const UIScale& ui_scale();

} // namespace contextviz
