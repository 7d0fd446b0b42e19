/// @file app_font.hpp
/// @brief One typeface for the form, the viewer tabs and the save prompt.
///
/// The font is loaded once after the window opens and drawn through
/// DrawAppText() / MeasureAppText(), so no panel holds a Font handle.

#pragma once

#include <raylib.h>

namespace contextviz {

/// Loads DejaVuSans from the first path that works: resources/fonts/ under
/// the working directory, then the Debian and Arch/Fedora system locations.
/// Falls back to Raylib's built-in font. Call after InitWindow().
void init_app_font();

/// Releases the loaded font. Call before CloseWindow().
void cleanup_app_font();

/// DrawText() with the app font
void DrawAppText(const char* text, int posX, int posY, int fontSize, Color color);

/// MeasureText() with the app font
int MeasureAppText(const char* text, int fontSize);

} // namespace contextviz
