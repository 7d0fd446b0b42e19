/// @file requests.cpp
/// @brief Request handlers: validate, compute, open views, export

#include "app/requests.hpp"

#include "io/png_export.hpp"
#include "io/save_path.hpp"
#include "model/errors.hpp"
#include "model/form_validation.hpp"
#include "model/ratio_calculator.hpp"
#include "rendering/visualization.hpp"
#include "ui/ui_scale.hpp"

#include <raylib.h>

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace contextviz {

namespace {

/// Largest share of the monitor the window grows to when fitting a view
constexpr float MAX_WINDOW_FRACTION = 0.95f;

void warn(AppState& app, const std::string& heading, const std::string& message) {
    app.status = {heading + ": " + message, true};
}

/// Grows the window so the largest new viewport fits beside the form.
/// Never shrinks it, and leaves maximized windows alone.
void fit_window(const AppState& app, const std::vector<Visualization>& views) {
    if (IsWindowMaximized() || IsWindowFullscreen()) {
        return;
    }
    const auto& sc = ui_scale();
    int view_w = 0;
    int view_h = 0;
    for (const Visualization& viz : views) {
        view_w = std::max(view_w, viz.viewport.visible_width);
        view_h = std::max(view_h, viz.viewport.visible_height);
    }

    float chrome_h = sc.tab_height + static_cast<float>(sc.font_normal) + 2.0f * sc.row_gap +
                     sc.scrollbar_w + sc.margin * 2.0f + sc.status_h;
    float want_w = sc.panel_w + 3.0f * sc.margin + sc.scrollbar_w + static_cast<float>(view_w);
    float want_h = chrome_h + static_cast<float>(view_h);

    float max_w = MAX_WINDOW_FRACTION * static_cast<float>(app.screen.width);
    float max_h = MAX_WINDOW_FRACTION * static_cast<float>(app.screen.height);
    int w = static_cast<int>(std::min(std::max(want_w, static_cast<float>(GetScreenWidth())), max_w));
    int h = static_cast<int>(std::min(std::max(want_h, static_cast<float>(GetScreenHeight())), max_h));
    if (w != GetScreenWidth() || h != GetScreenHeight()) {
        SetWindowSize(w, h);
    }
}

void show_visualizations(AppState& app, std::vector<Visualization> views) {
    fit_window(app, views);
    for (Visualization& viz : views) {
        std::fprintf(stderr, "[contextviz] Opened \"%s\" (%dx%d px)\n", viz.title.c_str(),
                     viz.image.width(), viz.image.height());
        (void)open_visualization(app.viewer, std::move(viz));
    }
    app.status = {"Opened " + std::to_string(views.size()) + " visualization" +
                      (views.size() == 1 ? "" : "s"),
                  false};
}

} // namespace

void run_spatial_request(AppState& app, const CountryTable& countries) {
    try {
        SpatialInput input = validate_spatial_form(app.form.spatial, countries);
        SpatialRatios ratios = compute_spatial_ratios(input, countries);
        show_visualizations(app, make_spatial_visualizations(ratios, app.screen));
    } catch (const InvalidInput& e) {
        warn(app, "Invalid Input", e.what());
    } catch (const ArithmeticDegenerate& e) {
        std::fprintf(stderr, "[contextviz] Spatial request aborted: %s\n", e.what());
        warn(app, "Cannot visualize", e.what());
    } catch (const std::length_error& e) {
        std::fprintf(stderr, "[contextviz] Spatial request aborted: %s\n", e.what());
        warn(app, "Cannot visualize", e.what());
    } catch (const std::invalid_argument& e) {
        // Planner preconditions; validated input should never get here
        std::fprintf(stderr, "[contextviz] Spatial request aborted: %s\n", e.what());
        warn(app, "Cannot visualize", e.what());
    }
}

void run_population_request(AppState& app) {
    try {
        validate_population_form(app.form.population);
        show_visualizations(app, make_population_visualizations(app.form.population, app.screen));
    } catch (const InvalidInput& e) {
        warn(app, "Invalid Selection", e.what());
    }
}

void begin_save(AppState& app) {
    OpenVisualization* view = active_visualization(app.viewer);
    if (view == nullptr) {
        warn(app, "Nothing to save", "open a visualization first");
        return;
    }
    open_save_prompt(app.save, view->id, default_save_path(view->viz.title));
}

void finish_save(AppState& app) {
    OpenVisualization* view = find_visualization(app.viewer, app.save.target_id);
    std::string path = with_png_extension(app.save.path);
    close_save_prompt(app.save);

    if (view == nullptr) {
        warn(app, "Not saved", "the visualization was closed");
        return;
    }
    try {
        export_png(view->viz.image, path);
        std::fprintf(stderr, "[contextviz] Saved \"%s\" to %s\n", view->viz.title.c_str(),
                     path.c_str());
        app.status = {"Saved " + path, false};
    } catch (const std::runtime_error& e) {
        std::fprintf(stderr, "[contextviz] Save failed: %s\n", e.what());
        warn(app, "Save failed", e.what());
    }
}

} // namespace contextviz
