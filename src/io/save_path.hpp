#pragma once

/// @file save_path.hpp
/// @brief File-name helpers for the save-as prompt

#include <string>

namespace contextviz {

/// Lower-case file name derived from a title, e.g. "your_house_in_your_city.png"
[[nodiscard]] std::string default_file_name(const std::string& title);

/// Suggested path for a title: default_file_name() in the working directory
[[nodiscard]] std::string default_save_path(const std::string& title);

/// Appends ".png" when the file name has no extension; any other
/// extension is left alone.
[[nodiscard]] std::string with_png_extension(const std::string& path);

} // namespace contextviz
