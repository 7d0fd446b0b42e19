#pragma once

/// @file viz_texture.hpp
/// @brief GPU copy of a visualization, split into tiles below texture limits

#include "rendering/pixel_buffer.hpp"

#include <raylib.h>

#include <vector>

namespace contextviz {

/// Owns the textures uploaded for one PixelBuffer. Large grids exceed the
/// maximum texture size of common GPUs, so the image is cut into square
/// tiles of at most TILE_SIZE pixels.
class VizTexture {
  public:
    static constexpr int TILE_SIZE = 2048;

    /// Uploads the image. Must be called after InitWindow().
    explicit VizTexture(const PixelBuffer& image);
    ~VizTexture();

    VizTexture(const VizTexture&) = delete;
    VizTexture& operator=(const VizTexture&) = delete;
    VizTexture(VizTexture&& other) noexcept;
    VizTexture& operator=(VizTexture&& other) noexcept;

    /// Draws the image scaled by `scale`, shifted by `scroll` (in screen
    /// pixels) and positioned at the top-left of `view`. Tiles outside
    /// `view` are skipped; callers clip with a scissor rectangle.
    void draw(Rectangle view, Vector2 scroll, int scale) const;

  private:
    struct Tile {
        Texture2D texture{};
        int x = 0;
        int y = 0;
    };

    void release();

    std::vector<Tile> tiles_;
};

} // namespace contextviz
