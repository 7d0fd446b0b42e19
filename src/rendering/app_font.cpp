/// @file app_font.cpp
/// @brief Font loading and the text wrappers every panel draws with.

#include "rendering/app_font.hpp"

#include <array>
#include <cstdio>

namespace contextviz {

namespace {

constexpr const char* FONT_CANDIDATES[] = {
    "resources/fonts/DejaVuSans.ttf",
    "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
    "/usr/share/fonts/TTF/DejaVuSans.ttf",
};

/// Rasterized once at this size and scaled down for every panel font
constexpr int FONT_BASE_SIZE = 48;

/// Printable ASCII; titles, labels and country names use nothing else
constexpr int FIRST_GLYPH = 32;
constexpr int GLYPH_COUNT = 95;

Font g_font = {};
bool g_owns_font = false;

float spacing_for(int font_size) {
    return static_cast<float>(font_size) / 10.0f;
}

/// LoadFontEx() hands back the default font when the file is unusable,
/// so success means a texture other than the default one.
bool load_candidate(const char* path, Font& out) {
    if (!FileExists(path)) {
        return false;
    }
    std::array<int, GLYPH_COUNT> codepoints{};
    for (int i = 0; i < GLYPH_COUNT; i++) {
        codepoints[static_cast<size_t>(i)] = FIRST_GLYPH + i;
    }
    Font font = LoadFontEx(path, FONT_BASE_SIZE, codepoints.data(), GLYPH_COUNT);
    if (font.texture.id == 0 || font.texture.id == GetFontDefault().texture.id) {
        return false;
    }
    SetTextureFilter(font.texture, TEXTURE_FILTER_BILINEAR);
    out = font;
    return true;
}

} // namespace

void init_app_font() {
    for (const char* path : FONT_CANDIDATES) {
        if (load_candidate(path, g_font)) {
            g_owns_font = true;
            return;
        }
    }
    g_font = GetFontDefault();
    g_owns_font = false;
    std::fprintf(stderr, "[contextviz] No TTF font found, using the Raylib default font.\n");
}

void cleanup_app_font() {
    if (g_owns_font) {
        UnloadFont(g_font);
    }
    g_font = {};
    g_owns_font = false;
}

void DrawAppText(const char* text, int posX, int posY, int fontSize, Color color) {
    DrawTextEx(g_font, text, {static_cast<float>(posX), static_cast<float>(posY)},
               static_cast<float>(fontSize), spacing_for(fontSize), color);
}

int MeasureAppText(const char* text, int fontSize) {
    Vector2 size = MeasureTextEx(g_font, text, static_cast<float>(fontSize), spacing_for(fontSize));
    return static_cast<int>(size.x);
}

} // namespace contextviz
