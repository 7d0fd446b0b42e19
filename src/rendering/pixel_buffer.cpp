/// @file pixel_buffer.cpp
/// @brief RGB buffer storage and rasterization of grids and circles

#include "rendering/pixel_buffer.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace contextviz {

namespace {

/// Shared by both circle overloads; fill may be null.
void raster_circle(PixelBuffer& buffer, int left, int top, int size, Rgb outline,
                   const Rgb* fill) {
    if (size <= 0) {
        return;
    }
    double radius = static_cast<double>(size) / 2.0;
    double cx = static_cast<double>(left) + radius;
    double cy = static_cast<double>(top) + radius;
    double inner = std::max(0.0, radius - 1.0);

    for (int y = top; y < top + size; y++) {
        double dy = static_cast<double>(y) + 0.5 - cy;
        for (int x = left; x < left + size; x++) {
            double dx = static_cast<double>(x) + 0.5 - cx;
            double dist2 = dx * dx + dy * dy;
            if (dist2 > radius * radius) {
                continue;
            }
            if (dist2 > inner * inner) {
                buffer.set(x, y, outline);
            } else if (fill != nullptr) {
                buffer.set(x, y, *fill);
            }
        }
    }
}

} // namespace

PixelBuffer::PixelBuffer(int width, int height, Rgb fill) : width_(width), height_(height) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("PixelBuffer dimensions must be positive");
    }
    pixels_.resize(static_cast<size_t>(width) * static_cast<size_t>(height) * 3);
    for (size_t i = 0; i < pixels_.size(); i += 3) {
        pixels_[i] = fill.r;
        pixels_[i + 1] = fill.g;
        pixels_[i + 2] = fill.b;
    }
}

Rgb PixelBuffer::at(int x, int y) const {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) {
        throw std::out_of_range("Pixel coordinate out of range");
    }
    size_t i = offset(x, y);
    return {pixels_[i], pixels_[i + 1], pixels_[i + 2]};
}

void PixelBuffer::set(int x, int y, Rgb color) {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) {
        return;
    }
    size_t i = offset(x, y);
    pixels_[i] = color.r;
    pixels_[i + 1] = color.g;
    pixels_[i + 2] = color.b;
}

void draw_circle(PixelBuffer& buffer, int left, int top, int size, Rgb outline) {
    raster_circle(buffer, left, top, size, outline, nullptr);
}

void draw_circle(PixelBuffer& buffer, int left, int top, int size, Rgb outline, Rgb fill) {
    raster_circle(buffer, left, top, size, outline, &fill);
}

PixelBuffer rasterize_grid(const GridPlan& plan) {
    if (plan.width <= 0 || plan.height <= 0) {
        throw std::invalid_argument("Grid plan has no cells");
    }
    // Divide rather than multiply: width * height may not fit in int64
    if (plan.height > MAX_RASTER_CELLS / plan.width) {
        throw std::length_error("Grid of " + std::to_string(plan.width) + " x " +
                                std::to_string(plan.height) + " cells is too large to draw");
    }

    int w = static_cast<int>(plan.width);
    int h = static_cast<int>(plan.height);
    int inset = static_cast<int>(std::min<int64_t>(plan.inset_side, std::min(plan.width, plan.height)));

    PixelBuffer buffer(w, h, palette::WHITE);
    for (int y = 0; y < h; y++) {
        for (int x = 0; x < w; x++) {
            if ((x + y) % 2 == 0) {
                continue;
            }
            bool in_inset = x < inset && y < inset;
            buffer.set(x, y, in_inset ? palette::INSET_GREEN : palette::BLACK);
        }
    }

    // The marker sits one cell in from the corner so it is not lost at the edge
    buffer.set(std::min(1, w - 1), std::min(1, h - 1), palette::MARKER_RED);
    return buffer;
}

PixelBuffer rasterize_orbit(const OrbitPlan& plan) {
    PixelBuffer buffer(plan.canvas_side, plan.canvas_side, palette::WHITE);
    draw_circle(buffer, ORBIT_MARGIN, ORBIT_MARGIN, plan.diameter, palette::BLACK);
    draw_circle(buffer, plan.radius, plan.radius, plan.disc_diameter, palette::DISC_ORANGE,
                palette::MARKER_RED);
    return buffer;
}

} // namespace contextviz
