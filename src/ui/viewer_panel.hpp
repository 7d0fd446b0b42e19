/// @file viewer_panel.hpp
/// @brief Tabbed viewer for the open visualizations, with scrollable viewports.
///
/// Every visualization gets an id when it is opened. The id is the only
/// handle other parts of the app (the save prompt, close shortcuts) keep.

#pragma once

#include "rendering/visualization.hpp"
#include "rendering/viz_texture.hpp"

#include <raylib.h>

#include <cstdint>
#include <vector>

namespace contextviz {

/// One open visualization and its view state
struct OpenVisualization {
    uint32_t id = 0;
    Visualization viz;
    VizTexture texture;
    Vector2 scroll = {0.0f, 0.0f}; ///< Top-left of the visible region, screen pixels
    bool dragging_h = false;
    bool dragging_v = false;
};

/// All open visualizations, in tab order
struct ViewerState {
    std::vector<OpenVisualization> views;
    uint32_t active_id = 0; ///< 0 = nothing open
    uint32_t next_id = 1;
};

/// Actions the viewer can request from the main loop
struct ViewerAction {
    uint32_t close_id = 0; ///< Tab whose close button was pressed, 0 = none
};

/// Uploads a visualization, appends it as the active tab and returns its id.
/// Must be called after InitWindow().
uint32_t open_visualization(ViewerState& state, Visualization viz);

/// Closes the tab with the given id; the neighbouring tab becomes active.
void close_visualization(ViewerState& state, uint32_t id);

/// Returns the open visualization with the given id, or nullptr.
[[nodiscard]] OpenVisualization* find_visualization(ViewerState& state, uint32_t id);

/// Returns the active visualization, or nullptr when nothing is open.
[[nodiscard]] OpenVisualization* active_visualization(ViewerState& state);

/// Draws the tab strip and the active visualization inside `area`.
/// @param interactive False while a modal prompt owns the mouse
ViewerAction draw_viewer_panel(ViewerState& state, bool interactive, Rectangle area);

} // namespace contextviz
