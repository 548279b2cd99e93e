#include "ui/theme.h"
#include "imgui.h"

#include <cstdlib>
#include <cstring>

namespace occm {

namespace {

Theme g_theme;
ThemeMode g_mode = ThemeMode::System;
bool g_applied = false;
bool g_system_dark = true;

struct ColorSlot {
    ImGuiCol slot;
    uint32_t Theme::*color;
};

// Slots that take a theme color as is. Everything else is derived in apply_theme.
const ColorSlot kSlots[] = {
    {ImGuiCol_Text, &Theme::foreground},
    {ImGuiCol_TextDisabled, &Theme::foreground_dim},
    {ImGuiCol_WindowBg, &Theme::background},
    {ImGuiCol_ChildBg, &Theme::background},
    {ImGuiCol_PopupBg, &Theme::panel},
    {ImGuiCol_MenuBarBg, &Theme::panel},
    {ImGuiCol_TitleBg, &Theme::panel},
    {ImGuiCol_TitleBgActive, &Theme::panel},
    {ImGuiCol_TitleBgCollapsed, &Theme::panel},
    {ImGuiCol_ScrollbarBg, &Theme::panel},
    {ImGuiCol_DockingEmptyBg, &Theme::panel},
    {ImGuiCol_TableHeaderBg, &Theme::panel},
    {ImGuiCol_Border, &Theme::border},
    {ImGuiCol_Separator, &Theme::border},
    {ImGuiCol_TableBorderStrong, &Theme::border},
    {ImGuiCol_TableBorderLight, &Theme::border},
    {ImGuiCol_ResizeGrip, &Theme::border},
    {ImGuiCol_ScrollbarGrab, &Theme::border},
    {ImGuiCol_FrameBg, &Theme::input_bg},
    {ImGuiCol_FrameBgHovered, &Theme::selection},
    {ImGuiCol_FrameBgActive, &Theme::selection},
    {ImGuiCol_TextSelectedBg, &Theme::selection},
    {ImGuiCol_Button, &Theme::raised},
    {ImGuiCol_ButtonHovered, &Theme::accent},
    {ImGuiCol_ButtonActive, &Theme::accent_pressed},
    {ImGuiCol_Header, &Theme::raised},
    {ImGuiCol_HeaderHovered, &Theme::selection},
    {ImGuiCol_HeaderActive, &Theme::accent},
    {ImGuiCol_Tab, &Theme::panel},
    {ImGuiCol_TabHovered, &Theme::selection},
    {ImGuiCol_TabActive, &Theme::background},
    {ImGuiCol_TabUnfocused, &Theme::panel},
    {ImGuiCol_TabUnfocusedActive, &Theme::background},
    {ImGuiCol_CheckMark, &Theme::accent},
    {ImGuiCol_SliderGrab, &Theme::accent},
    {ImGuiCol_SliderGrabActive, &Theme::accent_hover},
    {ImGuiCol_SeparatorHovered, &Theme::accent},
    {ImGuiCol_SeparatorActive, &Theme::accent},
    {ImGuiCol_ResizeGripHovered, &Theme::accent},
    {ImGuiCol_ResizeGripActive, &Theme::accent},
    {ImGuiCol_ScrollbarGrabHovered, &Theme::accent_hover},
    {ImGuiCol_ScrollbarGrabActive, &Theme::accent},
    {ImGuiCol_DockingPreview, &Theme::accent},
    {ImGuiCol_DragDropTarget, &Theme::accent},
    {ImGuiCol_NavHighlight, &Theme::accent},
    {ImGuiCol_NavWindowingHighlight, &Theme::accent},
    {ImGuiCol_PlotHistogram, &Theme::success},
    {ImGuiCol_PlotHistogramHovered, &Theme::accent_hover},
    {ImGuiCol_PlotLines, &Theme::info},
    {ImGuiCol_PlotLinesHovered, &Theme::accent_hover},
};

ImVec4 with_alpha(uint32_t color, float alpha) {
    ImVec4 v = ImGui::ColorConvertU32ToFloat4(color);
    v.w = alpha;
    return v;
}

void apply_metrics(ImGuiStyle& style) {
    style.WindowPadding = ImVec2(10, 10);
    style.FramePadding = ImVec2(7, 4);
    style.ItemSpacing = ImVec2(8, 5);
    style.ItemInnerSpacing = ImVec2(5, 4);
    style.CellPadding = ImVec2(6, 3);
    style.IndentSpacing = 16.0f;
    style.ScrollbarSize = 11.0f;
    style.GrabMinSize = 9.0f;

    style.WindowRounding = 3.0f;
    style.ChildRounding = 3.0f;
    style.FrameRounding = 3.0f;
    style.PopupRounding = 3.0f;
    style.GrabRounding = 3.0f;
    style.TabRounding = 3.0f;
    style.ScrollbarRounding = 6.0f;

    style.WindowBorderSize = 1.0f;
    style.ChildBorderSize = 1.0f;
    style.PopupBorderSize = 1.0f;
    style.FrameBorderSize = 0.0f;
    style.TabBorderSize = 0.0f;
}

}

Theme get_dark_theme() {
    Theme t;
    t.name = "Night";
    t.kind = ThemeKind::Dark;
    t.background = rgb(0x1e2127);
    t.panel = rgb(0x16181d);
    t.raised = rgb(0x2c313a);
    t.input_bg = rgb(0x14161a);
    t.border = rgb(0x343a44);
    t.foreground = rgb(0xd8dee9);
    t.foreground_dim = rgb(0x7d8590);
    t.accent = rgb(0x4c9aff);
    t.accent_hover = rgb(0x6cb0ff);
    t.accent_pressed = rgb(0x3a82e0);
    t.selection = rgb(0x2f3b4d);
    t.success = rgb(0x5fd38d);
    t.warning = rgb(0xe5b567);
    t.error = rgb(0xf0717a);
    t.info = rgb(0x61c0e8);
    return t;
}

Theme get_light_theme() {
    Theme t;
    t.name = "Paper";
    t.kind = ThemeKind::Light;
    t.background = rgb(0xf7f8fa);
    t.panel = rgb(0xe9ecf1);
    t.raised = rgb(0xe4e8ee);
    t.input_bg = rgb(0xffffff);
    t.border = rgb(0xc8ced8);
    t.foreground = rgb(0x22262e);
    t.foreground_dim = rgb(0x5a6270);
    t.accent = rgb(0x1f6feb);
    t.accent_hover = rgb(0x3b82f6);
    t.accent_pressed = rgb(0x1858c4);
    t.selection = rgb(0xcfdcf2);
    t.success = rgb(0x1a7f37);
    t.warning = rgb(0xb35900);
    t.error = rgb(0xcf222e);
    t.info = rgb(0x0969da);
    return t;
}

void apply_theme(const Theme& theme) {
    g_theme = theme;
    g_applied = true;

    ImGuiStyle& style = ImGui::GetStyle();
    for (const auto& slot : kSlots) {
        style.Colors[slot.slot] = ImGui::ColorConvertU32ToFloat4(theme.*slot.color);
    }

    const bool dark = theme.kind == ThemeKind::Dark;
    style.Colors[ImGuiCol_BorderShadow] = ImVec4(0, 0, 0, 0);
    style.Colors[ImGuiCol_TableRowBg] = ImVec4(0, 0, 0, 0);
    style.Colors[ImGuiCol_TableRowBgAlt] = with_alpha(theme.raised, dark ? 0.35f : 0.6f);
    style.Colors[ImGuiCol_ModalWindowDimBg] = dark ? ImVec4(0, 0, 0, 0.55f) : ImVec4(0.1f, 0.1f, 0.1f, 0.25f);
    style.Colors[ImGuiCol_NavWindowingDimBg] = style.Colors[ImGuiCol_ModalWindowDimBg];

    apply_metrics(style);
}

const Theme& get_current_theme() {
    if (!g_applied) {
        update_system_theme();
        if (!g_applied) apply_theme(get_dark_theme());
    }
    return g_theme;
}

ThemeMode get_theme_mode() {
    return g_mode;
}

void set_theme_mode(ThemeMode mode) {
    g_mode = mode;
    switch (mode) {
        case ThemeMode::Dark:
            apply_theme(get_dark_theme());
            break;
        case ThemeMode::Light:
            apply_theme(get_light_theme());
            break;
        case ThemeMode::System:
            g_system_dark = is_system_dark_mode();
            apply_theme(g_system_dark ? get_dark_theme() : get_light_theme());
            break;
    }
}

void update_system_theme() {
    if (g_mode != ThemeMode::System) return;

    const bool dark = is_system_dark_mode();
    if (g_applied && dark == g_system_dark) return;

    g_system_dark = dark;
    apply_theme(dark ? get_dark_theme() : get_light_theme());
}

bool is_system_dark_mode() {
    // Without a toolkit the only hint is a GTK_THEME override such as "Adwaita:light".
    const char* gtk_theme = std::getenv("GTK_THEME");
    return !(gtk_theme && std::strstr(gtk_theme, ":light") != nullptr);
}

ThemeMode theme_mode_from_string(const std::string& name) {
    if (name == "dark") return ThemeMode::Dark;
    if (name == "light") return ThemeMode::Light;
    return ThemeMode::System;
}

const char* theme_mode_to_string(ThemeMode mode) {
    switch (mode) {
        case ThemeMode::Dark: return "dark";
        case ThemeMode::Light: return "light";
        case ThemeMode::System: break;
    }
    return "system";
}

}
