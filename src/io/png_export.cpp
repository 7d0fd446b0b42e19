/// @file png_export.cpp
/// @brief PNG export via Raylib's ExportImage()

#include "io/png_export.hpp"

#include <raylib.h>

#include <stdexcept>

namespace contextviz {

void export_png(const PixelBuffer& image, const std::string& path) {
    if (image.empty()) {
        throw std::invalid_argument("Nothing to export: image is empty");
    }

    // Borrow the buffer; ExportImage() only reads it
    Image img{};
    img.data = const_cast<uint8_t*>(image.bytes().data());
    img.width = image.width();
    img.height = image.height();
    img.mipmaps = 1;
    img.format = PIXELFORMAT_UNCOMPRESSED_R8G8B8;

    if (!ExportImage(img, path.c_str())) {
        throw std::runtime_error("Could not write PNG to " + path);
    }
}

} // namespace contextviz
