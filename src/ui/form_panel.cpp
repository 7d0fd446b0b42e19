/// @file form_panel.cpp
/// @brief Implements the input form with custom-drawn Raylib widgets

#include "ui/form_panel.hpp"

#include "model/units.hpp"
#include "rendering/app_font.hpp"
#include "ui/ui_scale.hpp"

#include <algorithm>
#include <array>
#include <string_view>
#include <vector>

namespace contextviz {

namespace {

constexpr size_t MAX_FIELD_CHARS = 32;
constexpr float WIDGET_GAP = 6.0f;
constexpr float CHECKBOX_SIZE = 18.0f;

// --- Colors ---
const Color BG_COLOR = {35, 35, 42, 230};
const Color BORDER_COLOR = {70, 70, 85, 255};
const Color FIELD_BG = {25, 25, 32, 255};
const Color FIELD_BG_ACTIVE = {30, 30, 50, 255};
const Color FIELD_BORDER = {90, 90, 110, 255};
const Color FIELD_BORDER_ACTIVE = {100, 140, 255, 255};
const Color TEXT_COLOR = {220, 220, 230, 255};
const Color LABEL_COLOR = {160, 160, 180, 255};
const Color HINT_COLOR = {120, 120, 140, 255};
const Color BUTTON_BG = {50, 50, 65, 255};
const Color BUTTON_BG_HOVER = {65, 65, 85, 255};
const Color BUTTON_BG_ACTIVE = {40, 120, 60, 255};
const Color BUTTON_BG_ACTIVE_HOVER = {50, 145, 75, 255};
const Color TAB_ACTIVE = {60, 60, 80, 255};
const Color TAB_INACTIVE = {40, 40, 50, 255};
const Color CHECK_ON = {40, 160, 70, 255};
const Color DROPDOWN_BG = {30, 30, 38, 250};
const Color DROPDOWN_HOVER = {55, 75, 120, 255};

bool accepts_numeric(int key) {
    return (key >= '0' && key <= '9') || key == '.' || key == '-' || key == '+' || key == 'e' ||
           key == 'E';
}

bool accepts_text(int key) {
    return key >= 32 && key < 127;
}

/// Consumes typed characters and backspace for the focused field.
/// Returns true if the text changed.
bool edit_text(std::string& text, bool (*accept)(int)) {
    bool changed = false;
    int key = GetCharPressed();
    while (key > 0) {
        if (accept(key) && text.size() < MAX_FIELD_CHARS) {
            text.push_back(static_cast<char>(key));
            changed = true;
        }
        key = GetCharPressed();
    }
    if ((IsKeyPressed(KEY_BACKSPACE) || IsKeyPressedRepeat(KEY_BACKSPACE)) && !text.empty()) {
        text.pop_back();
        changed = true;
    }
    return changed;
}

/// Draws a text field; the tail of long text stays visible.
void draw_text_field(const std::string& text, bool focused, Rectangle rect) {
    const auto& sc = ui_scale();
    DrawRectangleRec(rect, focused ? FIELD_BG_ACTIVE : FIELD_BG);
    DrawRectangleLinesEx(rect, 1.0f, focused ? FIELD_BORDER_ACTIVE : FIELD_BORDER);

    std::string visible = text;
    int max_w = static_cast<int>(rect.width) - 14;
    while (!visible.empty() && MeasureAppText(visible.c_str(), sc.font_normal) > max_w) {
        visible.erase(visible.begin());
    }

    int ty = static_cast<int>(rect.y + (rect.height - static_cast<float>(sc.font_normal)) / 2.0f);
    DrawAppText(visible.c_str(), static_cast<int>(rect.x + 6), ty, sc.font_normal, TEXT_COLOR);

    if (focused && static_cast<int>(GetTime() * 2.0) % 2 == 0) {
        float cx = rect.x + 7.0f + static_cast<float>(MeasureAppText(visible.c_str(), sc.font_normal));
        DrawLine(static_cast<int>(cx), static_cast<int>(rect.y + 5), static_cast<int>(cx),
                 static_cast<int>(rect.y + rect.height - 5), TEXT_COLOR);
    }
}

/// Draw a button. Returns true if clicked this frame.
bool draw_button(const char* text, Rectangle rect, Color bg_normal, Color bg_hover, bool mouse_enabled) {
    const auto& sc = ui_scale();
    bool hovered = mouse_enabled && CheckCollisionPointRec(GetMousePosition(), rect);
    bool clicked = hovered && IsMouseButtonPressed(MOUSE_BUTTON_LEFT);

    DrawRectangleRec(rect, hovered ? bg_hover : bg_normal);
    DrawRectangleLinesEx(rect, 1.0f, BORDER_COLOR);

    int tw = MeasureAppText(text, sc.font_small);
    DrawAppText(text, static_cast<int>(rect.x + (rect.width - static_cast<float>(tw)) / 2.0f),
                static_cast<int>(rect.y + (rect.height - static_cast<float>(sc.font_small)) / 2.0f),
                sc.font_small, TEXT_COLOR);
    return clicked;
}

/// Draw a checkbox with a label to its right. Returns true if toggled.
bool draw_checkbox(const char* label, bool value, float x, float y, float w, bool mouse_enabled) {
    const auto& sc = ui_scale();
    Rectangle hit = {x, y, w, std::max(CHECKBOX_SIZE, sc.row_height)};
    bool hovered = mouse_enabled && CheckCollisionPointRec(GetMousePosition(), hit);
    bool clicked = hovered && IsMouseButtonPressed(MOUSE_BUTTON_LEFT);

    Rectangle box = {x, y + (hit.height - CHECKBOX_SIZE) / 2.0f, CHECKBOX_SIZE, CHECKBOX_SIZE};
    DrawRectangleRec(box, value ? CHECK_ON : FIELD_BG);
    DrawRectangleLinesEx(box, 1.0f, hovered ? FIELD_BORDER_ACTIVE : FIELD_BORDER);
    if (value) {
        DrawLineEx({box.x + 4, box.y + 9}, {box.x + 8, box.y + 13}, 2.0f, TEXT_COLOR);
        DrawLineEx({box.x + 8, box.y + 13}, {box.x + 14, box.y + 5}, 2.0f, TEXT_COLOR);
    }

    DrawAppText(label, static_cast<int>(x + CHECKBOX_SIZE + 8.0f),
                static_cast<int>(y + (hit.height - static_cast<float>(sc.font_normal)) / 2.0f),
                sc.font_normal, TEXT_COLOR);
    return clicked;
}

/// Unit button that cycles through `options` on click.
template <size_t N>
bool draw_unit_selector(AreaUnit& unit, const std::array<AreaUnit, N>& options, Rectangle rect,
                        bool mouse_enabled) {
    std::string label(unit_label(unit));
    label += " v";
    if (!draw_button(label.c_str(), rect, BUTTON_BG, BUTTON_BG_HOVER, mouse_enabled)) {
        return false;
    }
    auto it = std::find(options.begin(), options.end(), unit);
    unit = (it == options.end() || it + 1 == options.end()) ? options.front() : *(it + 1);
    return true;
}

bool draw_tab(const char* label, bool active, Rectangle rect, bool mouse_enabled) {
    const auto& sc = ui_scale();
    bool hovered = mouse_enabled && CheckCollisionPointRec(GetMousePosition(), rect);
    bool clicked = hovered && IsMouseButtonPressed(MOUSE_BUTTON_LEFT);

    DrawRectangleRec(rect, active ? TAB_ACTIVE : (hovered ? BUTTON_BG_HOVER : TAB_INACTIVE));
    DrawRectangleLinesEx(rect, 1.0f, BORDER_COLOR);
    if (active) {
        DrawRectangle(static_cast<int>(rect.x), static_cast<int>(rect.y + rect.height - 2),
                      static_cast<int>(rect.width), 2, FIELD_BORDER_ACTIVE);
    }
    int tw = MeasureAppText(label, sc.font_normal);
    DrawAppText(label, static_cast<int>(rect.x + (rect.width - static_cast<float>(tw)) / 2.0f),
                static_cast<int>(rect.y + (rect.height - static_cast<float>(sc.font_normal)) / 2.0f),
                sc.font_normal, active ? TEXT_COLOR : LABEL_COLOR);
    return clicked;
}

void draw_label(const char* text, float x, float row_y, float row_h) {
    const auto& sc = ui_scale();
    DrawAppText(text, static_cast<int>(x),
                static_cast<int>(row_y + (row_h - static_cast<float>(sc.font_normal)) / 2.0f),
                sc.font_normal, LABEL_COLOR);
}

void select_country(FormState& state, const std::string& name) {
    state.spatial.country = name;
    state.dropdown_open = false;
    state.dropdown_highlight = -1;
    state.dropdown_scroll = 0;
}

/// Keeps the highlighted suggestion inside the visible window.
void scroll_to_highlight(FormState& state, int visible_rows) {
    if (state.dropdown_highlight < 0) {
        return;
    }
    if (state.dropdown_highlight < state.dropdown_scroll) {
        state.dropdown_scroll = state.dropdown_highlight;
    } else if (state.dropdown_highlight >= state.dropdown_scroll + visible_rows) {
        state.dropdown_scroll = state.dropdown_highlight - visible_rows + 1;
    }
}

/// Screen positions of every Space-tab widget, computed before drawing so
/// the dropdown can claim the mouse ahead of the widgets it covers.
struct SpaceLayout {
    Rectangle house_field;
    Rectangle house_unit;
    Rectangle city_field;
    Rectangle city_unit;
    Rectangle country_field;
    Rectangle visualize;
    Rectangle dropdown;
    float house_row_y = 0.0f;
    float city_row_y = 0.0f;
    float country_row_y = 0.0f;
};

SpaceLayout layout_space_tab(float cx, float cy, float content_w, int suggestion_rows) {
    const auto& sc = ui_scale();
    SpaceLayout l;

    float unit_w = static_cast<float>(MeasureAppText("sq. meters v", sc.font_small)) + 16.0f;
    float field_x = cx + sc.label_w;
    float field_w = content_w - sc.label_w - unit_w - WIDGET_GAP;

    l.house_row_y = cy;
    l.house_field = {field_x, cy, field_w, sc.field_height};
    l.house_unit = {field_x + field_w + WIDGET_GAP, cy, unit_w, sc.field_height};
    cy += sc.field_height + sc.row_gap;

    l.city_row_y = cy;
    l.city_field = {field_x, cy, field_w, sc.field_height};
    l.city_unit = {field_x + field_w + WIDGET_GAP, cy, unit_w, sc.field_height};
    cy += sc.field_height + sc.row_gap;

    l.country_row_y = cy;
    l.country_field = {field_x, cy, content_w - sc.label_w, sc.field_height};
    l.dropdown = {field_x, cy + sc.field_height, content_w - sc.label_w,
                  static_cast<float>(suggestion_rows) * sc.row_height};
    cy += sc.field_height + sc.row_gap * 2.0f;

    l.visualize = {field_x, cy, field_w, sc.button_height};
    return l;
}

void draw_dropdown(FormState& state, const std::vector<std::string>& matches, Rectangle rect,
                   int visible_rows, bool mouse_enabled) {
    const auto& sc = ui_scale();
    Vector2 mouse = GetMousePosition();
    bool hovered = mouse_enabled && CheckCollisionPointRec(mouse, rect);

    int max_scroll = std::max(0, static_cast<int>(matches.size()) - visible_rows);
    if (hovered) {
        float wheel = GetMouseWheelMove();
        state.dropdown_scroll -= static_cast<int>(wheel);
    }
    state.dropdown_scroll = std::clamp(state.dropdown_scroll, 0, max_scroll);

    DrawRectangleRec(rect, DROPDOWN_BG);
    DrawRectangleLinesEx(rect, 1.0f, FIELD_BORDER_ACTIVE);

    for (int row = 0; row < visible_rows; row++) {
        int index = state.dropdown_scroll + row;
        if (index >= static_cast<int>(matches.size())) {
            break;
        }
        Rectangle item = {rect.x + 1, rect.y + static_cast<float>(row) * sc.row_height,
                          rect.width - 2, sc.row_height};
        bool item_hovered = hovered && CheckCollisionPointRec(mouse, item);
        if (item_hovered || index == state.dropdown_highlight) {
            DrawRectangleRec(item, DROPDOWN_HOVER);
        }
        DrawAppText(matches[static_cast<size_t>(index)].c_str(), static_cast<int>(item.x + 6),
                    static_cast<int>(item.y + (sc.row_height - static_cast<float>(sc.font_small)) / 2.0f),
                    sc.font_small, TEXT_COLOR);
        if (item_hovered && IsMouseButtonPressed(MOUSE_BUTTON_LEFT)) {
            select_country(state, matches[static_cast<size_t>(index)]);
            return;
        }
    }
}

/// Keyboard handling for the Space tab. Returns true when Enter requests
/// a visualization.
bool handle_space_keys(FormState& state, const std::vector<std::string>& matches,
                       int visible_rows) {
    if (IsKeyPressed(KEY_TAB)) {
        switch (state.focus) {
        case FocusField::HOUSE_AREA:
            state.focus = FocusField::CITY_AREA;
            break;
        case FocusField::CITY_AREA:
            state.focus = FocusField::COUNTRY;
            break;
        default:
            state.focus = FocusField::HOUSE_AREA;
            break;
        }
        state.dropdown_open = false;
    }

    switch (state.focus) {
    case FocusField::HOUSE_AREA:
        (void)edit_text(state.spatial.house_text, accepts_numeric);
        break;
    case FocusField::CITY_AREA:
        (void)edit_text(state.spatial.city_text, accepts_numeric);
        break;
    case FocusField::COUNTRY:
        if (edit_text(state.spatial.country, accepts_text)) {
            state.dropdown_open = true;
            state.dropdown_highlight = -1;
            state.dropdown_scroll = 0;
        }
        break;
    case FocusField::NONE:
        break;
    }

    bool dropdown_visible =
        state.focus == FocusField::COUNTRY && state.dropdown_open && !matches.empty();
    if (dropdown_visible) {
        int last = static_cast<int>(matches.size()) - 1;
        if (IsKeyPressed(KEY_DOWN) || IsKeyPressedRepeat(KEY_DOWN)) {
            state.dropdown_highlight = std::min(last, state.dropdown_highlight + 1);
            scroll_to_highlight(state, visible_rows);
        }
        if (IsKeyPressed(KEY_UP) || IsKeyPressedRepeat(KEY_UP)) {
            state.dropdown_highlight = std::max(0, state.dropdown_highlight - 1);
            scroll_to_highlight(state, visible_rows);
        }
        if (IsKeyPressed(KEY_ESCAPE)) {
            state.dropdown_open = false;
        }
        bool enter = IsKeyPressed(KEY_ENTER) || IsKeyPressed(KEY_KP_ENTER);
        if (enter && state.dropdown_highlight >= 0 && state.dropdown_highlight <= last) {
            select_country(state, matches[static_cast<size_t>(state.dropdown_highlight)]);
            return false;
        }
    } else if (state.focus == FocusField::COUNTRY && IsKeyPressed(KEY_DOWN)) {
        state.dropdown_open = true;
    }

    return IsKeyPressed(KEY_ENTER) || IsKeyPressed(KEY_KP_ENTER);
}

bool draw_space_tab(FormState& state, const CountryTable& countries, bool interactive, float cx,
                    float cy, float content_w) {
    const auto& sc = ui_scale();
    bool requested = false;

    std::vector<std::string> matches = countries.filter_by_prefix(state.spatial.country);
    int visible_rows = std::min(sc.dropdown_rows, static_cast<int>(matches.size()));
    SpaceLayout l = layout_space_tab(cx, cy, content_w, visible_rows);

    bool dropdown_visible = state.focus == FocusField::COUNTRY && state.dropdown_open &&
                            visible_rows > 0;
    bool over_dropdown = dropdown_visible && CheckCollisionPointRec(GetMousePosition(), l.dropdown);
    bool mouse_enabled = interactive && !over_dropdown;

    // Focus follows the mouse press, as long as the press is not on the dropdown
    if (mouse_enabled && IsMouseButtonPressed(MOUSE_BUTTON_LEFT)) {
        Vector2 mouse = GetMousePosition();
        if (CheckCollisionPointRec(mouse, l.house_field)) {
            state.focus = FocusField::HOUSE_AREA;
            state.dropdown_open = false;
        } else if (CheckCollisionPointRec(mouse, l.city_field)) {
            state.focus = FocusField::CITY_AREA;
            state.dropdown_open = false;
        } else if (CheckCollisionPointRec(mouse, l.country_field)) {
            state.dropdown_open = state.focus != FocusField::COUNTRY || !state.dropdown_open;
            state.focus = FocusField::COUNTRY;
        } else {
            state.dropdown_open = false;
        }
    }

    if (interactive && handle_space_keys(state, matches, visible_rows)) {
        requested = true;
    }

    // The typed prefix may have changed; refresh the suggestions
    matches = countries.filter_by_prefix(state.spatial.country);
    visible_rows = std::min(sc.dropdown_rows, static_cast<int>(matches.size()));
    l.dropdown.height = static_cast<float>(visible_rows) * sc.row_height;

    draw_label("House Area", cx, l.house_row_y, sc.field_height);
    draw_text_field(state.spatial.house_text, state.focus == FocusField::HOUSE_AREA, l.house_field);
    (void)draw_unit_selector(state.spatial.house_unit, HOUSE_AREA_UNITS, l.house_unit, mouse_enabled);

    draw_label("City Area", cx, l.city_row_y, sc.field_height);
    draw_text_field(state.spatial.city_text, state.focus == FocusField::CITY_AREA, l.city_field);
    (void)draw_unit_selector(state.spatial.city_unit, CITY_AREA_UNITS, l.city_unit, mouse_enabled);

    draw_label("Country", cx, l.country_row_y, sc.field_height);
    draw_text_field(state.spatial.country, state.focus == FocusField::COUNTRY, l.country_field);

    if (draw_button("Visualize", l.visualize, BUTTON_BG_ACTIVE, BUTTON_BG_ACTIVE_HOVER,
                    mouse_enabled)) {
        requested = true;
    }

    // Drawn last so it covers the widgets below it
    if (state.focus == FocusField::COUNTRY && state.dropdown_open && visible_rows > 0) {
        draw_dropdown(state, matches, l.dropdown, visible_rows, interactive);
    }
    return requested;
}

bool draw_population_tab(FormState& state, bool interactive, float cx, float cy, float content_w) {
    const auto& sc = ui_scale();
    bool requested = false;

    if (draw_checkbox("No. of people born each day", state.population.show_births, cx, cy,
                      content_w, interactive)) {
        state.population.show_births = !state.population.show_births;
    }
    cy += sc.row_height + sc.row_gap;

    if (draw_checkbox("No. of people who die each day", state.population.show_deaths, cx, cy,
                      content_w, interactive)) {
        state.population.show_deaths = !state.population.show_deaths;
    }
    cy += sc.row_height + sc.row_gap * 2.0f;

    float btn_w = content_w * 0.45f;
    Rectangle btn = {cx + content_w - btn_w, cy, btn_w, sc.button_height};
    if (draw_button("Visualize", btn, BUTTON_BG_ACTIVE, BUTTON_BG_ACTIVE_HOVER, interactive)) {
        requested = true;
    }
    if (interactive && (IsKeyPressed(KEY_ENTER) || IsKeyPressed(KEY_KP_ENTER))) {
        requested = true;
    }
    return requested;
}

} // namespace

FormAction draw_form_panel(FormState& state, const CountryTable& countries, bool interactive,
                           Rectangle panel) {
    const auto& sc = ui_scale();
    FormAction action;

    DrawRectangleRec(panel, BG_COLOR);
    DrawRectangleLinesEx(panel, 1.0f, BORDER_COLOR);

    float cx = panel.x + sc.padding;
    float cy = panel.y + sc.padding;
    float content_w = panel.width - 2.0f * sc.padding;

    // Tab row
    float tab_w = content_w / 2.0f;
    if (draw_tab("Space", state.tab == FormTab::SPACE, {cx, cy, tab_w, sc.tab_height},
                 interactive)) {
        state.tab = FormTab::SPACE;
        state.focus = FocusField::HOUSE_AREA;
    }
    if (draw_tab("Population", state.tab == FormTab::POPULATION,
                 {cx + tab_w, cy, tab_w, sc.tab_height}, interactive)) {
        state.tab = FormTab::POPULATION;
        state.focus = FocusField::NONE;
        state.dropdown_open = false;
    }
    cy += sc.tab_height + sc.row_gap * 2.0f;

    if (state.tab == FormTab::SPACE) {
        action.spatial_requested =
            draw_space_tab(state, countries, interactive, cx, cy, content_w);
    } else {
        action.population_requested = draw_population_tab(state, interactive, cx, cy, content_w);
    }

    // Shortcut hints along the bottom of the panel
    const char* hints[] = {"Enter  visualize", "Ctrl+S  save the open view as PNG",
                           "Ctrl+W  close the open view"};
    float hy = panel.y + panel.height - sc.padding -
               3.0f * (static_cast<float>(sc.font_tiny) + 4.0f);
    for (const char* hint : hints) {
        DrawAppText(hint, static_cast<int>(cx), static_cast<int>(hy), sc.font_tiny, HINT_COLOR);
        hy += static_cast<float>(sc.font_tiny) + 4.0f;
    }

    return action;
}

} // namespace contextviz
