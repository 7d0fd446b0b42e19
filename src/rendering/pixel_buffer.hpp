#pragma once

/// @file pixel_buffer.hpp
/// @brief CPU-side RGB image and the rasterizers for grids and the orbit diagram
///
/// The same buffer is uploaded for display and written out as PNG, so what
/// the user saves is exactly what the viewer shows (at one pixel per cell).

#include "layout/grid_planner.hpp"

#include <cstdint>
#include <vector>

namespace contextviz {

/// 8-bit RGB color
struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const Rgb& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const Rgb& other) const { return !(*this == other); }
};

namespace palette {
constexpr Rgb WHITE = {255, 255, 255};
constexpr Rgb BLACK = {0, 0, 0};
constexpr Rgb INSET_GREEN = {0, 128, 0};
constexpr Rgb MARKER_RED = {255, 0, 0};
constexpr Rgb DISC_ORANGE = {255, 165, 0};
} // namespace palette

/// Largest grid that will be rasterized (cells). About 300 MB of RGB data.
constexpr int64_t MAX_RASTER_CELLS = 100000000;

/// Row-major, tightly packed RGB8 image
class PixelBuffer {
  public:
    PixelBuffer() = default;

    /// @throws std::invalid_argument for non-positive dimensions
    PixelBuffer(int width, int height, Rgb fill = palette::WHITE);

    [[nodiscard]] int width() const { return width_; }
    [[nodiscard]] int height() const { return height_; }
    [[nodiscard]] bool empty() const { return pixels_.empty(); }

    [[nodiscard]] Rgb at(int x, int y) const;

    /// Writes one pixel; coordinates outside the image are ignored
    void set(int x, int y, Rgb color);

    /// Raw RGB bytes, width * height * 3
    [[nodiscard]] const std::vector<uint8_t>& bytes() const { return pixels_; }
    [[nodiscard]] std::vector<uint8_t>& bytes() { return pixels_; }

  private:
    [[nodiscard]] size_t offset(int x, int y) const {
        return (static_cast<size_t>(y) * static_cast<size_t>(width_) + static_cast<size_t>(x)) * 3;
    }

    int width_ = 0;
    int height_ = 0;
    std::vector<uint8_t> pixels_;
};

/// Draws a circle inscribed in the square [left, left + size) x [top, top + size).
/// The outline is one pixel wide; the interior is left untouched unless a
/// fill color is given.
void draw_circle(PixelBuffer& buffer, int left, int top, int size, Rgb outline);
void draw_circle(PixelBuffer& buffer, int left, int top, int size, Rgb outline, Rgb fill);

/// One pixel per cell, white and black alternating like a checkerboard with
/// white at the origin. Inset cells use green in place of black, and one red
/// cell near the origin marks "1".
/// @throws std::length_error if the grid exceeds MAX_RASTER_CELLS
/// @throws std::invalid_argument if a dimension is not positive
[[nodiscard]] PixelBuffer rasterize_grid(const GridPlan& plan);

/// White canvas with the orbit drawn in black and the central disc in red
/// with an orange rim.
[[nodiscard]] PixelBuffer rasterize_orbit(const OrbitPlan& plan);

} // namespace contextviz
