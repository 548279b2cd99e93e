#pragma once

#include <cstdint>
#include <string>

namespace occm {

enum class ThemeKind {
    Dark,
    Light
};

enum class ThemeMode {
    System,
    Dark,
    Light
};

// Colors are ImGui ABGR values.
struct Theme {
    std::string name;
    ThemeKind kind = ThemeKind::Dark;

    uint32_t background = 0;      // windows
    uint32_t panel = 0;           // menu bar, title bars, popups, list panes
    uint32_t raised = 0;          // buttons and headers at rest
    uint32_t input_bg = 0;
    uint32_t border = 0;

    uint32_t foreground = 0;
    uint32_t foreground_dim = 0;

    uint32_t accent = 0;
    uint32_t accent_hover = 0;
    uint32_t accent_pressed = 0;
    uint32_t selection = 0;

    uint32_t success = 0;
    uint32_t warning = 0;
    uint32_t error = 0;
    uint32_t info = 0;
};

Theme get_dark_theme();
Theme get_light_theme();

void apply_theme(const Theme& theme);
const Theme& get_current_theme();

ThemeMode get_theme_mode();
void set_theme_mode(ThemeMode mode);

// Re-applies the theme when the mode is System and the desktop preference flipped.
void update_system_theme();
bool is_system_dark_mode();

// "system" | "dark" | "light"; unknown names map to System.
ThemeMode theme_mode_from_string(const std::string& name);
const char* theme_mode_to_string(ThemeMode mode);

// 0xRRGGBB -> opaque ABGR
constexpr uint32_t rgb(uint32_t hex) {
    return 0xFF000000u | ((hex & 0xFFu) << 16) | (hex & 0xFF00u) | ((hex >> 16) & 0xFFu);
}

}
