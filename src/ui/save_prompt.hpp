/// @file save_prompt.hpp
/// @brief Modal "save as PNG" prompt with a path field and a saving indicator.

#pragma once

#include <raylib.h>

#include <cstdint>
#include <string>

namespace contextviz {

/// Persistent prompt state, kept across frames
struct SavePrompt {
    enum class Phase {
        CLOSED,
        EDITING, ///< User is typing the path
        SAVING,  ///< Path confirmed; the indicator is on screen
    };

    Phase phase = Phase::CLOSED;
    uint32_t target_id = 0; ///< Visualization being saved
    std::string path;
    int saving_frames = 0;  ///< Frames drawn since entering SAVING

    [[nodiscard]] bool is_open() const { return phase != Phase::CLOSED; }

    /// True once the saving indicator has been presented at least once, so
    /// a blocking write will not leave the screen stale.
    [[nodiscard]] bool ready_to_write() const { return phase == Phase::SAVING && saving_frames > 0; }
};

/// Opens the prompt for a visualization, pre-filled with `suggested_path`.
void open_save_prompt(SavePrompt& prompt, uint32_t target_id, const std::string& suggested_path);

/// Closes the prompt and clears its state.
void close_save_prompt(SavePrompt& prompt);

/// Draws the modal over `screen` and handles its keyboard input:
/// Enter confirms, Escape cancels, Ctrl+V pastes.
void draw_save_prompt(SavePrompt& prompt, Rectangle screen);

} // namespace contextviz
