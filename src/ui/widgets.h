#pragma once

#include <map>
#include <string>
#include <vector>

namespace occm {

// Timed status text under a panel's toolbar. Messages containing "Error"
// are drawn in the theme's error color.
struct StatusLine {
    std::string message;
    float time = 0.0f;

    void set(const std::string& text, float seconds = 2.5f) {
        message = text;
        time = seconds;
    }
    void error(const std::string& text) { set("Error: " + text, 4.0f); }
    void render();
};

// InputText bound to a std::string through a fixed-size buffer.
bool input_text(const char* label, std::string& value, const char* hint = nullptr,
                float width = 0.0f, size_t capacity = 512, int flags = 0);
bool input_multiline(const char* label, std::string& value, float height, size_t capacity = 16384);

// Combo over a list of strings. Returns true when the selection changed.
bool combo_string(const char* label, std::string& value, const std::vector<std::string>& options,
                  float width = 0.0f, const char* empty_label = "(none)");

// Editable list with "X" delete buttons and an add row.
bool render_string_list(const char* label, std::vector<std::string>& list, const char* hint = "value");

// key=value editor for string maps (environment, headers).
bool render_string_map(const char* label, std::map<std::string, std::string>& map);

void label_row(const char* label, float column = 140.0f);

// Hands the URL to the desktop's browser (open / xdg-open / start).
void open_url(const std::string& url);

}
