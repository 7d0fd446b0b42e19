/// @file save_prompt.cpp
/// @brief Implements the modal save-as prompt

#include "ui/save_prompt.hpp"

#include "rendering/app_font.hpp"
#include "ui/ui_scale.hpp"

#include <algorithm>

namespace contextviz {

namespace {

constexpr size_t MAX_PATH_CHARS = 1024;
constexpr float SAVING_PROGRESS = 0.2f;

const Color SHADE = {0, 0, 0, 140};
const Color BG_COLOR = {35, 35, 42, 245};
const Color BORDER_COLOR = {70, 70, 85, 255};
const Color FIELD_BG = {30, 30, 50, 255};
const Color FIELD_BORDER = {100, 140, 255, 255};
const Color TEXT_COLOR = {220, 220, 230, 255};
const Color LABEL_COLOR = {160, 160, 180, 255};
const Color PROGRESS_TRACK = {50, 50, 60, 255};
const Color PROGRESS_FILL = {60, 140, 200, 255};

void edit_path(SavePrompt& prompt) {
    int key = GetCharPressed();
    while (key > 0) {
        if (key >= 32 && key < 127 && prompt.path.size() < MAX_PATH_CHARS) {
            prompt.path.push_back(static_cast<char>(key));
        }
        key = GetCharPressed();
    }
    if ((IsKeyPressed(KEY_BACKSPACE) || IsKeyPressedRepeat(KEY_BACKSPACE)) && !prompt.path.empty()) {
        prompt.path.pop_back();
    }
    bool ctrl = IsKeyDown(KEY_LEFT_CONTROL) || IsKeyDown(KEY_RIGHT_CONTROL);
    if (ctrl && IsKeyPressed(KEY_V)) {
        const char* clip = GetClipboardText();
        if (clip != nullptr) {
            prompt.path += clip;
            if (prompt.path.size() > MAX_PATH_CHARS) {
                prompt.path.resize(MAX_PATH_CHARS);
            }
        }
    }
}

} // namespace

void open_save_prompt(SavePrompt& prompt, uint32_t target_id, const std::string& suggested_path) {
    prompt.phase = SavePrompt::Phase::EDITING;
    prompt.target_id = target_id;
    prompt.path = suggested_path;
    prompt.saving_frames = 0;
}

void close_save_prompt(SavePrompt& prompt) {
    prompt = SavePrompt{};
}

void draw_save_prompt(SavePrompt& prompt, Rectangle screen) {
    if (!prompt.is_open()) {
        return;
    }
    const auto& sc = ui_scale();

    if (prompt.phase == SavePrompt::Phase::EDITING) {
        edit_path(prompt);
        if (IsKeyPressed(KEY_ESCAPE)) {
            close_save_prompt(prompt);
            return;
        }
        if ((IsKeyPressed(KEY_ENTER) || IsKeyPressed(KEY_KP_ENTER)) && !prompt.path.empty()) {
            prompt.phase = SavePrompt::Phase::SAVING;
        }
    }

    DrawRectangleRec(screen, SHADE);

    float w = std::min(screen.width - 2.0f * sc.margin, 640.0f);
    float h = sc.padding * 3.0f + static_cast<float>(sc.font_normal) + sc.field_height +
              static_cast<float>(sc.font_tiny) + sc.row_gap;
    Rectangle box = {screen.x + (screen.width - w) / 2.0f, screen.y + (screen.height - h) / 3.0f,
                     w, h};
    DrawRectangleRec(box, BG_COLOR);
    DrawRectangleLinesEx(box, 1.0f, BORDER_COLOR);

    float cx = box.x + sc.padding;
    float cy = box.y + sc.padding;
    float content_w = box.width - 2.0f * sc.padding;

    if (prompt.phase == SavePrompt::Phase::SAVING) {
        DrawAppText("Saving file...", static_cast<int>(cx), static_cast<int>(cy), sc.font_normal,
                    TEXT_COLOR);
        cy += static_cast<float>(sc.font_normal) + sc.padding;
        Rectangle track = {cx, cy + sc.field_height / 3.0f, content_w, sc.field_height / 3.0f};
        DrawRectangleRec(track, PROGRESS_TRACK);
        DrawRectangleRec({track.x, track.y, track.width * SAVING_PROGRESS, track.height},
                         PROGRESS_FILL);
        prompt.saving_frames++;
        return;
    }

    DrawAppText("Save as PNG", static_cast<int>(cx), static_cast<int>(cy), sc.font_normal,
                TEXT_COLOR);
    cy += static_cast<float>(sc.font_normal) + sc.padding;

    Rectangle field = {cx, cy, content_w, sc.field_height};
    DrawRectangleRec(field, FIELD_BG);
    DrawRectangleLinesEx(field, 1.0f, FIELD_BORDER);

    // Keep the end of a long path visible
    std::string visible = prompt.path;
    int max_w = static_cast<int>(field.width) - 16;
    while (!visible.empty() && MeasureAppText(visible.c_str(), sc.font_small) > max_w) {
        visible.erase(visible.begin());
    }
    int ty = static_cast<int>(field.y + (field.height - static_cast<float>(sc.font_small)) / 2.0f);
    DrawAppText(visible.c_str(), static_cast<int>(field.x + 6), ty, sc.font_small, TEXT_COLOR);
    if (static_cast<int>(GetTime() * 2.0) % 2 == 0) {
        float caret = field.x + 7.0f + static_cast<float>(MeasureAppText(visible.c_str(), sc.font_small));
        DrawLine(static_cast<int>(caret), static_cast<int>(field.y + 5), static_cast<int>(caret),
                 static_cast<int>(field.y + field.height - 5), TEXT_COLOR);
    }
    cy += sc.field_height + sc.row_gap;

    DrawAppText("Enter to save, Esc to cancel. \".png\" is added when no extension is given.",
                static_cast<int>(cx), static_cast<int>(cy), sc.font_tiny, LABEL_COLOR);
}

} // namespace contextviz
