#include "debug.hpp"
#include "../debug_panel.hpp"
#include <raylib.h>
#include <string>

static constexpr int   PAD      = 8;
static constexpr int   PANEL_W  = 230;
static constexpr int   ROW_H    = 15;
static constexpr int   FONT_SM  = 10;
static constexpr int   FONT_MD  = 11;
static constexpr int   LABEL_W  = 112;  // pixels from content-left to value column
static constexpr int   SEP_H    = 4;
static constexpr Color BG       = {20,  20,  20,  210};
static constexpr Color DIVIDER  = {80,  80,  80,  200};
static constexpr Color C_TITLE  = {160, 160, 160, 255};
static constexpr Color C_HEADER = {210, 190, 80,  255};
static constexpr Color C_LABEL  = {180, 180, 180, 255};
static constexpr Color C_VALUE  = {255, 255, 255, 255};

static int SectionHeight(const DebugPanel::Section& s) {
    int rows = 1 + (s.collapsed ? 0 : static_cast<int>(s.rows.size()));
    return SEP_H + rows * ROW_H;
}

void DebugSystem::Update(ecs::World& world, float /*dt*/) {
    auto* panel = world.try_resource<DebugPanel>();
    if (!panel) return;

    if (IsKeyPressed(KEY_F3)) panel->visible = !panel->visible;
    if (!panel->visible) return;

    const auto& sections = panel->sections();

    int content_h = 0;
    for (const auto& s : sections) content_h += SectionHeight(s);
    const int panel_h = PAD + ROW_H + PAD + content_h + PAD;

    // --- Background, top-right so the help text stays readable ---
    const int ox = GetScreenWidth() - PANEL_W - 10, oy = 10;
    panel->bounds = {static_cast<float>(ox), static_cast<float>(oy),
                     static_cast<float>(PANEL_W), static_cast<float>(panel_h)};
    DrawRectangle(ox, oy, PANEL_W, panel_h, BG);
    DrawRectangleLines(ox, oy, PANEL_W, panel_h, DIVIDER);

    // --- Title ---
    int cy = oy + PAD;
    DrawText("DEBUG", ox + PAD, cy, FONT_MD, C_TITLE);
    DrawText("[F3]", ox + PANEL_W - PAD - MeasureText("[F3]", FONT_SM) - 2, cy + 1, FONT_SM, DIVIDER);
    cy += ROW_H + PAD;

    // --- Sections ---
    const Vector2 mouse   = GetMousePosition();
    const bool    clicked = IsMouseButtonPressed(MOUSE_BUTTON_LEFT);
    std::string   toggled;

    for (const auto& sec : sections) {
        DrawLine(ox + PAD, cy, ox + PANEL_W - PAD, cy, DIVIDER);
        cy += SEP_H;

        Rectangle header = {static_cast<float>(ox), static_cast<float>(cy),
                            static_cast<float>(PANEL_W), static_cast<float>(ROW_H)};
        if (clicked && CheckCollisionPointRec(mouse, header)) toggled = sec.title;

        std::string title = (sec.collapsed ? "+ " : "- ") + sec.title;
        DrawText(title.c_str(), ox + PAD, cy, FONT_MD, C_HEADER);
        cy += ROW_H;
        if (sec.collapsed) continue;

        for (const auto& row : sec.rows) {
            std::string val = row.fn();
            DrawText(row.label.c_str(), ox + PAD + 4, cy, FONT_SM, C_LABEL);
            DrawText(val.c_str(),       ox + PAD + 4 + LABEL_W, cy, FONT_SM, C_VALUE);
            cy += ROW_H;
        }
    }

    if (!toggled.empty()) panel->toggle(toggled);
}
