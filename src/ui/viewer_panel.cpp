/// @file viewer_panel.cpp
/// @brief Implements the visualization tabs, viewport clipping and scrollbars

#include "ui/viewer_panel.hpp"

#include "rendering/app_font.hpp"
#include "ui/ui_scale.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace contextviz {

namespace {

constexpr float MAX_TAB_WIDTH = 240.0f;
constexpr float MIN_THUMB = 24.0f;
constexpr float WHEEL_STEP = 60.0f;

const Color AREA_BG = {221, 221, 221, 255};
const Color VIEW_BG = {0, 0, 0, 255};
const Color BORDER_COLOR = {70, 70, 85, 255};
const Color TAB_ACTIVE = {60, 60, 80, 255};
const Color TAB_INACTIVE = {40, 40, 50, 255};
const Color TAB_HOVER = {65, 65, 85, 255};
const Color TEXT_COLOR = {220, 220, 230, 255};
const Color TITLE_COLOR = {40, 40, 48, 255};
const Color LABEL_COLOR = {160, 160, 180, 255};
const Color CLOSE_HOVER = {200, 70, 70, 255};
const Color TRACK_COLOR = {190, 190, 195, 255};
const Color THUMB_COLOR = {120, 120, 130, 255};
const Color THUMB_ACTIVE = {90, 110, 170, 255};

/// Shortens `text` with a trailing "..." until it fits `max_w` pixels.
std::string ellipsize(const std::string& text, int font_size, float max_w) {
    if (static_cast<float>(MeasureAppText(text.c_str(), font_size)) <= max_w) {
        return text;
    }
    std::string cut = text;
    while (!cut.empty() &&
           static_cast<float>(MeasureAppText((cut + "...").c_str(), font_size)) > max_w) {
        cut.pop_back();
    }
    return cut + "...";
}

/// Draws one scrollbar along `track` and updates `offset` from dragging.
void draw_scrollbar(Rectangle track, bool horizontal, float visible, float content, float& offset,
                    bool& dragging, bool mouse_enabled) {
    float track_len = horizontal ? track.width : track.height;
    float thumb_len = std::max(MIN_THUMB, track_len * visible / content);
    float travel = std::max(1.0f, track_len - thumb_len);
    float max_offset = std::max(0.0f, content - visible);

    Vector2 mouse = GetMousePosition();
    if (mouse_enabled && IsMouseButtonPressed(MOUSE_BUTTON_LEFT) &&
        CheckCollisionPointRec(mouse, track)) {
        dragging = true;
    }
    if (!IsMouseButtonDown(MOUSE_BUTTON_LEFT)) {
        dragging = false;
    }
    if (dragging && max_offset > 0.0f) {
        float along = horizontal ? mouse.x - track.x : mouse.y - track.y;
        float norm = std::clamp((along - thumb_len / 2.0f) / travel, 0.0f, 1.0f);
        offset = norm * max_offset;
    }

    float thumb_pos = max_offset > 0.0f ? offset / max_offset * travel : 0.0f;
    Rectangle thumb = horizontal
                          ? Rectangle{track.x + thumb_pos, track.y, thumb_len, track.height}
                          : Rectangle{track.x, track.y + thumb_pos, track.width, thumb_len};

    DrawRectangleRec(track, TRACK_COLOR);
    DrawRectangleRec(thumb, dragging ? THUMB_ACTIVE : THUMB_COLOR);
}

/// Draws the tab strip. Selecting a tab takes effect immediately; closing
/// is reported back so the caller can release the textures.
uint32_t draw_tabs(ViewerState& state, Rectangle strip, bool mouse_enabled) {
    const auto& sc = ui_scale();
    uint32_t close_id = 0;
    if (state.views.empty()) {
        return close_id;
    }

    float tab_w = std::min(MAX_TAB_WIDTH, strip.width / static_cast<float>(state.views.size()));
    float close_w = sc.tab_height * 0.6f;
    Vector2 mouse = GetMousePosition();
    bool pressed = mouse_enabled && IsMouseButtonPressed(MOUSE_BUTTON_LEFT);

    for (size_t i = 0; i < state.views.size(); i++) {
        const OpenVisualization& view = state.views[i];
        Rectangle tab = {strip.x + static_cast<float>(i) * tab_w, strip.y, tab_w, sc.tab_height};
        Rectangle close = {tab.x + tab.width - close_w - 4.0f,
                           tab.y + (tab.height - close_w) / 2.0f, close_w, close_w};
        bool active = view.id == state.active_id;
        bool hovered = mouse_enabled && CheckCollisionPointRec(mouse, tab);
        bool close_hovered = mouse_enabled && CheckCollisionPointRec(mouse, close);

        DrawRectangleRec(tab, active ? TAB_ACTIVE : (hovered ? TAB_HOVER : TAB_INACTIVE));
        DrawRectangleLinesEx(tab, 1.0f, BORDER_COLOR);

        std::string label = ellipsize(view.viz.title, sc.font_small, tab.width - close_w - 16.0f);
        DrawAppText(label.c_str(), static_cast<int>(tab.x + 6.0f),
                    static_cast<int>(tab.y + (tab.height - static_cast<float>(sc.font_small)) / 2.0f),
                    sc.font_small, active ? TEXT_COLOR : LABEL_COLOR);

        if (close_hovered) {
            DrawRectangleRec(close, CLOSE_HOVER);
        }
        DrawLineEx({close.x + 4, close.y + 4}, {close.x + close.width - 4, close.y + close.height - 4},
                   1.5f, TEXT_COLOR);
        DrawLineEx({close.x + close.width - 4, close.y + 4}, {close.x + 4, close.y + close.height - 4},
                   1.5f, TEXT_COLOR);

        if (pressed && close_hovered) {
            close_id = view.id;
        } else if (pressed && hovered) {
            state.active_id = view.id;
        }
    }
    return close_id;
}

void draw_empty_hint(Rectangle area) {
    const auto& sc = ui_scale();
    const char* hint = "Enter your values on the left and press Visualize.";
    int tw = MeasureAppText(hint, sc.font_normal);
    DrawAppText(hint, static_cast<int>(area.x + (area.width - static_cast<float>(tw)) / 2.0f),
                static_cast<int>(area.y + area.height / 2.0f), sc.font_normal, TITLE_COLOR);
}

} // namespace

uint32_t open_visualization(ViewerState& state, Visualization viz) {
    VizTexture texture(viz.image);
    OpenVisualization view{state.next_id++, std::move(viz), std::move(texture)};
    state.active_id = view.id;
    state.views.push_back(std::move(view));
    return state.active_id;
}

void close_visualization(ViewerState& state, uint32_t id) {
    auto it = std::find_if(state.views.begin(), state.views.end(),
                           [id](const OpenVisualization& v) { return v.id == id; });
    if (it == state.views.end()) {
        return;
    }
    size_t index = static_cast<size_t>(it - state.views.begin());
    state.views.erase(it);

    if (state.active_id != id) {
        return;
    }
    if (state.views.empty()) {
        state.active_id = 0;
    } else {
        state.active_id = state.views[std::min(index, state.views.size() - 1)].id;
    }
}

OpenVisualization* find_visualization(ViewerState& state, uint32_t id) {
    for (OpenVisualization& view : state.views) {
        if (view.id == id) {
            return &view;
        }
    }
    return nullptr;
}

OpenVisualization* active_visualization(ViewerState& state) {
    return find_visualization(state, state.active_id);
}

ViewerAction draw_viewer_panel(ViewerState& state, bool interactive, Rectangle area) {
    const auto& sc = ui_scale();
    ViewerAction action;

    DrawRectangleRec(area, AREA_BG);

    Rectangle strip = {area.x, area.y, area.width, sc.tab_height};
    action.close_id = draw_tabs(state, strip, interactive);

    OpenVisualization* view = active_visualization(state);
    if (view == nullptr) {
        draw_empty_hint(area);
        return action;
    }

    // Full title under the tabs, standing in for the window caption
    float ty = area.y + sc.tab_height + sc.row_gap;
    std::string title = ellipsize(view->viz.title, sc.font_normal, area.width - 2.0f * sc.margin);
    DrawAppText(title.c_str(), static_cast<int>(area.x + sc.margin), static_cast<int>(ty),
                sc.font_normal, TITLE_COLOR);
    ty += static_cast<float>(sc.font_normal) + sc.row_gap;

    // The planned viewport, shrunk further if the window is smaller than it
    const Viewport& planned = view->viz.viewport;
    float avail_w = area.width - 2.0f * sc.margin - sc.scrollbar_w;
    float avail_h = area.y + area.height - ty - sc.margin - sc.scrollbar_w;
    float content_w = static_cast<float>(planned.scroll_width);
    float content_h = static_cast<float>(planned.scroll_height);
    float vis_w = std::max(1.0f, std::min(static_cast<float>(planned.visible_width), avail_w));
    float vis_h = std::max(1.0f, std::min(static_cast<float>(planned.visible_height), avail_h));
    bool scroll_x = content_w > vis_w;
    bool scroll_y = content_h > vis_h;

    Rectangle viewport = {area.x + sc.margin, ty, vis_w, vis_h};
    bool over_view = interactive && CheckCollisionPointRec(GetMousePosition(), viewport);

    if (over_view) {
        Vector2 wheel = GetMouseWheelMoveV();
        bool shift = IsKeyDown(KEY_LEFT_SHIFT) || IsKeyDown(KEY_RIGHT_SHIFT);
        if (shift) {
            view->scroll.x -= wheel.y * WHEEL_STEP;
        } else {
            view->scroll.y -= wheel.y * WHEEL_STEP;
            view->scroll.x -= wheel.x * WHEEL_STEP;
        }
    }

    if (scroll_x) {
        Rectangle track = {viewport.x, viewport.y + vis_h, vis_w, sc.scrollbar_w};
        draw_scrollbar(track, true, vis_w, content_w, view->scroll.x, view->dragging_h, interactive);
    }
    if (scroll_y) {
        Rectangle track = {viewport.x + vis_w, viewport.y, sc.scrollbar_w, vis_h};
        draw_scrollbar(track, false, vis_h, content_h, view->scroll.y, view->dragging_v, interactive);
    }
    view->scroll.x = std::clamp(view->scroll.x, 0.0f, std::max(0.0f, content_w - vis_w));
    view->scroll.y = std::clamp(view->scroll.y, 0.0f, std::max(0.0f, content_h - vis_h));

    DrawRectangleRec(viewport, VIEW_BG);
    BeginScissorMode(static_cast<int>(viewport.x), static_cast<int>(viewport.y),
                     static_cast<int>(vis_w), static_cast<int>(vis_h));
    view->texture.draw(viewport, view->scroll, view->viz.display_scale);
    EndScissorMode();

    return action;
}

} // namespace contextviz
