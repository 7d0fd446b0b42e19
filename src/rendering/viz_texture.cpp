/// @file viz_texture.cpp
/// @brief Tiled texture upload and clipped drawing

#include "rendering/viz_texture.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

namespace contextviz {

VizTexture::VizTexture(const PixelBuffer& image) {
    const std::vector<uint8_t>& src = image.bytes();
    const size_t row_bytes = static_cast<size_t>(image.width()) * 3;
    std::vector<uint8_t> staging;

    for (int ty = 0; ty < image.height(); ty += TILE_SIZE) {
        for (int tx = 0; tx < image.width(); tx += TILE_SIZE) {
            int w = std::min(TILE_SIZE, image.width() - tx);
            int h = std::min(TILE_SIZE, image.height() - ty);

            staging.resize(static_cast<size_t>(w) * static_cast<size_t>(h) * 3);
            for (int row = 0; row < h; row++) {
                const uint8_t* from = src.data() + static_cast<size_t>(ty + row) * row_bytes +
                                      static_cast<size_t>(tx) * 3;
                std::memcpy(staging.data() + static_cast<size_t>(row) * static_cast<size_t>(w) * 3,
                            from, static_cast<size_t>(w) * 3);
            }

            Image img{};
            img.data = staging.data();
            img.width = w;
            img.height = h;
            img.mipmaps = 1;
            img.format = PIXELFORMAT_UNCOMPRESSED_R8G8B8;

            Tile tile;
            tile.texture = LoadTextureFromImage(img);
            tile.x = tx;
            tile.y = ty;
            // Cells must stay crisp squares when scaled up
            SetTextureFilter(tile.texture, TEXTURE_FILTER_POINT);
            tiles_.push_back(tile);
        }
    }
}

VizTexture::~VizTexture() {
    release();
}

VizTexture::VizTexture(VizTexture&& other) noexcept : tiles_(std::move(other.tiles_)) {
    other.tiles_.clear();
}

VizTexture& VizTexture::operator=(VizTexture&& other) noexcept {
    if (this != &other) {
        release();
        tiles_ = std::move(other.tiles_);
        other.tiles_.clear();
    }
    return *this;
}

void VizTexture::release() {
    for (Tile& tile : tiles_) {
        if (tile.texture.id != 0) {
            UnloadTexture(tile.texture);
        }
    }
    tiles_.clear();
}

void VizTexture::draw(Rectangle view, Vector2 scroll, int scale) const {
    float s = static_cast<float>(scale);
    for (const Tile& tile : tiles_) {
        Rectangle dest = {view.x - scroll.x + static_cast<float>(tile.x) * s,
                          view.y - scroll.y + static_cast<float>(tile.y) * s,
                          static_cast<float>(tile.texture.width) * s,
                          static_cast<float>(tile.texture.height) * s};
        if (!CheckCollisionRecs(dest, view)) {
            continue;
        }
        Rectangle source = {0.0f, 0.0f, static_cast<float>(tile.texture.width),
                            static_cast<float>(tile.texture.height)};
        DrawTexturePro(tile.texture, source, dest, {0.0f, 0.0f}, 0.0f, WHITE);
    }
}

} // namespace contextviz
