/// @file ui_scale.cpp
/// @brief Computes per-frame responsive UI metrics from the window size.

#include "ui/ui_scale.hpp"

namespace contextviz {

namespace {

UIScale g_scale;

int scaled_font(float base, float factor) {
    int v = static_cast<int>(std::round(base * factor));
    return std::clamp(v, static_cast<int>(base * 0.65f), static_cast<int>(base * 1.6f));
}

} // namespace

void update_ui_scale(int screen_w, int screen_h) {
    constexpr float BASELINE_H = 720.0f;
    constexpr float BASELINE_W = 1280.0f;

    float sw = static_cast<float>(screen_w);
    float sh = static_cast<float>(screen_h);

    // Height-dominant blend of both axes
    float hf = sh / BASELINE_H;
    float wf = sw / BASELINE_W;
    g_scale.factor = std::clamp(hf * 0.7f + wf * 0.3f, 0.6f, 1.8f);

    g_scale.panel_w = std::clamp(sw * 0.28f, 300.0f, 440.0f);
    g_scale.margin = std::clamp(10.0f * g_scale.factor, 6.0f, 16.0f);

    // The form never upscales beyond the 720p baseline so it stays compact
    // next to large visualizations.
    float pf = std::min(g_scale.factor, 1.0f);

    g_scale.font_normal = scaled_font(16.0f, pf);
    g_scale.font_small  = scaled_font(14.0f, pf);
    g_scale.font_big    = scaled_font(21.0f, pf);
    g_scale.font_tiny   = scaled_font(12.0f, pf);

    g_scale.row_height     = std::round(23.0f * pf);
    g_scale.padding        = std::round(10.0f * pf);
    g_scale.button_height  = std::round(34.65f * pf);
    g_scale.field_height   = std::round(32.34f * pf);
    g_scale.row_gap        = std::round(8.0f * pf);

    g_scale.tab_height  = std::round(30.0f * pf);
    g_scale.scrollbar_w = std::clamp(12.0f * g_scale.factor, 10.0f, 18.0f);
    g_scale.status_h    = std::round(26.0f * pf);
    g_scale.label_w     = std::round(90.0f * pf);
    g_scale.dropdown_rows = sh < 600.0f ? 5 : 8;
}

const UIScale& ui_scale() {
    return g_scale;
}

} // namespace contextviz
