/// @file app_state.hpp
/// @brief Everything the frame loop mutates, bundled into one struct that is
/// passed explicitly to the panels and request handlers.

#pragma once

#include "layout/grid_planner.hpp"
#include "ui/form_panel.hpp"
#include "ui/save_prompt.hpp"
#include "ui/viewer_panel.hpp"

#include <string>

namespace contextviz {

/// One-line message shown in the status bar until replaced
struct StatusMessage {
    std::string text;
    bool warning = false;
};

struct AppState {
    ScreenSize screen; ///< Monitor size, read once after the window opens
    FormState form;
    ViewerState viewer;
    SavePrompt save;
    StatusMessage status;
};

} // namespace contextviz
