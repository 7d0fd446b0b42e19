#pragma once

/// @file png_export.hpp
/// @brief Writes a PixelBuffer to disk as an RGB PNG through Raylib

#include "rendering/pixel_buffer.hpp"

#include <string>

namespace contextviz {

/// Encodes `image` as an 8-bit RGB PNG at `path`.
/// @throws std::invalid_argument if the image is empty
/// @throws std::runtime_error if Raylib fails to write the file
void export_png(const PixelBuffer& image, const std::string& path);

} // namespace contextviz
