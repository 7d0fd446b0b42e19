/// @file main.cpp
/// @brief contextviz entry point: puts areas and populations in perspective
///
/// Enter a house area, a city area and a country, and the app shows how big
/// the city is when the house shrinks to one pixel, how big the world and
/// the country are when the city shrinks to one pixel, and how small the
/// Sun is against Earth's orbit. The Population tab shows the people born
/// and dying each day, with each hour's share inset.

#include "app/app_state.hpp"
#include "app/requests.hpp"
#include "model/country_table.hpp"
#include "rendering/app_font.hpp"
#include "ui/form_panel.hpp"
#include "ui/save_prompt.hpp"
#include "ui/ui_scale.hpp"
#include "ui/viewer_panel.hpp"

#include <raylib.h>

#include <cstdio>
#include <exception>

namespace {

constexpr int INITIAL_WIDTH = 1280;
constexpr int INITIAL_HEIGHT = 720;
constexpr int MIN_WIDTH = 800;
constexpr int MIN_HEIGHT = 480;
constexpr int TARGET_FPS = 60;

const Color WINDOW_BG = {25, 25, 30, 255};
const Color STATUS_BG = {30, 30, 36, 255};
const Color STATUS_TEXT = {170, 170, 185, 255};
const Color STATUS_WARNING = {255, 200, 80, 255};

/// Ctrl+S and Ctrl+W, ignored while the save prompt is open.
void handle_shortcuts(contextviz::AppState& app) {
    if (app.save.is_open()) {
        return;
    }
    bool ctrl = IsKeyDown(KEY_LEFT_CONTROL) || IsKeyDown(KEY_RIGHT_CONTROL);
    if (!ctrl) {
        return;
    }
    if (IsKeyPressed(KEY_S)) {
        contextviz::begin_save(app);
    }
    if (IsKeyPressed(KEY_W) && app.viewer.active_id != 0) {
        contextviz::close_visualization(app.viewer, app.viewer.active_id);
    }
}

void draw_status_bar(const contextviz::StatusMessage& status, int screen_w, int screen_h) {
    const auto& sc = contextviz::ui_scale();
    float y = static_cast<float>(screen_h) - sc.status_h;
    DrawRectangleRec({0.0f, y, static_cast<float>(screen_w), sc.status_h}, STATUS_BG);
    contextviz::DrawAppText(status.text.c_str(), static_cast<int>(sc.margin),
                            static_cast<int>(y + (sc.status_h - static_cast<float>(sc.font_small)) / 2.0f),
                            sc.font_small, status.warning ? STATUS_WARNING : STATUS_TEXT);
}

/// One frame of the application.
void frame_tick(contextviz::AppState& app) {
    int screen_w = GetScreenWidth();
    int screen_h = GetScreenHeight();
    contextviz::update_ui_scale(screen_w, screen_h);
    const auto& sc = contextviz::ui_scale();

    handle_shortcuts(app);
    bool interactive = !app.save.is_open();

    float body_h = static_cast<float>(screen_h) - sc.status_h;
    Rectangle form_rect = {sc.margin, sc.margin, sc.panel_w, body_h - 2.0f * sc.margin};
    Rectangle viewer_rect = {form_rect.x + form_rect.width + sc.margin, sc.margin,
                             static_cast<float>(screen_w) - form_rect.width - 3.0f * sc.margin,
                             body_h - 2.0f * sc.margin};

    // --- Draw ---
    BeginDrawing();
    ClearBackground(WINDOW_BG);

    contextviz::ViewerAction view_action =
        contextviz::draw_viewer_panel(app.viewer, interactive, viewer_rect);
    contextviz::FormAction form_action = contextviz::draw_form_panel(
        app.form, contextviz::CountryTable::instance(), interactive, form_rect);
    draw_status_bar(app.status, screen_w, screen_h);
    contextviz::draw_save_prompt(
        app.save, {0.0f, 0.0f, static_cast<float>(screen_w), static_cast<float>(screen_h)});

    EndDrawing();

    // --- Process actions (take effect next frame) ---
    if (view_action.close_id != 0) {
        contextviz::close_visualization(app.viewer, view_action.close_id);
    }
    if (form_action.spatial_requested) {
        contextviz::run_spatial_request(app, contextviz::CountryTable::instance());
    }
    if (form_action.population_requested) {
        contextviz::run_population_request(app);
    }
    if (app.save.ready_to_write()) {
        contextviz::finish_save(app);
    }
}

} // namespace

int main() {
    SetTraceLogLevel(LOG_WARNING);
    SetConfigFlags(FLAG_WINDOW_RESIZABLE | FLAG_MSAA_4X_HINT);
    InitWindow(INITIAL_WIDTH, INITIAL_HEIGHT, "Contextual Visualizer");
    SetWindowMinSize(MIN_WIDTH, MIN_HEIGHT);
    SetTargetFPS(TARGET_FPS);
    // Escape belongs to the dropdown and the save prompt
    SetExitKey(KEY_NULL);
    contextviz::init_app_font();

    int exit_code = 0;
    {
        contextviz::AppState app;
        int monitor = GetCurrentMonitor();
        app.screen = {GetMonitorWidth(monitor), GetMonitorHeight(monitor)};
        if (app.screen.width <= 0 || app.screen.height <= 0) {
            app.screen = {INITIAL_WIDTH, INITIAL_HEIGHT};
        }
        app.status = {"Ready", false};

        try {
            while (!WindowShouldClose()) {
                frame_tick(app);
            }
        } catch (const std::exception& e) {
            std::fprintf(stderr, "[contextviz] Fatal error: %s\n", e.what());
            exit_code = 1;
        }
        // Textures in `app` are released here, while the GL context is alive
    }

    contextviz::cleanup_app_font();
    CloseWindow();
    return exit_code;
}
