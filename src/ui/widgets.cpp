#include "ui/widgets.h"
#include "ui/theme.h"
#include "core/logging.h"

#include <imgui.h>
#include <algorithm>
#include <cstdlib>
#include <cstring>

namespace occm {

void StatusLine::render() {
    if (time <= 0.0f) return;

    const auto& theme = get_current_theme();
    uint32_t color = message.find("Error") != std::string::npos ? theme.error : theme.success;
    ImGui::TextColored(ImGui::ColorConvertU32ToFloat4(color), "%s", message.c_str());
    time -= ImGui::GetIO().DeltaTime;
}

bool input_text(const char* label, std::string& value, const char* hint, float width, size_t capacity, int flags) {
    std::vector<char> buf(capacity, '\0');
    std::strncpy(buf.data(), value.c_str(), capacity - 1);

    if (width != 0.0f) ImGui::SetNextItemWidth(width);
    bool changed = hint
        ? ImGui::InputTextWithHint(label, hint, buf.data(), buf.size(), flags)
        : ImGui::InputText(label, buf.data(), buf.size(), flags);
    if (changed) value = buf.data();
    return changed;
}

bool input_multiline(const char* label, std::string& value, float height, size_t capacity) {
    std::vector<char> buf(std::max(capacity, value.size() + 1024), '\0');
    std::strncpy(buf.data(), value.c_str(), buf.size() - 1);

    bool changed = ImGui::InputTextMultiline(label, buf.data(), buf.size(), ImVec2(-1, height));
    if (changed) value = buf.data();
    return changed;
}

bool combo_string(const char* label, std::string& value, const std::vector<std::string>& options,
                  float width, const char* empty_label) {
    if (width != 0.0f) ImGui::SetNextItemWidth(width);

    bool changed = false;
    const char* preview = value.empty() ? empty_label : value.c_str();
    if (ImGui::BeginCombo(label, preview)) {
        if (empty_label && ImGui::Selectable(empty_label, value.empty())) {
            value.clear();
            changed = true;
        }
        for (const auto& option : options) {
            bool selected = option == value;
            if (ImGui::Selectable(option.c_str(), selected)) {
                value = option;
                changed = true;
            }
            if (selected) ImGui::SetItemDefaultFocus();
        }
        ImGui::EndCombo();
    }
    return changed;
}

bool render_string_list(const char* label, std::vector<std::string>& list, const char* hint) {
    bool changed = false;
    ImGui::PushID(label);
    ImGui::TextDisabled("%s", label);

    int to_delete = -1;
    for (size_t i = 0; i < list.size(); ++i) {
        ImGui::PushID(static_cast<int>(i));
        if (input_text("##item", list[i], nullptr, ImGui::GetContentRegionAvail().x - 30)) {
            changed = true;
        }
        ImGui::SameLine();
        if (ImGui::SmallButton("X")) {
            to_delete = static_cast<int>(i);
        }
        ImGui::PopID();
    }
    if (to_delete >= 0) {
        list.erase(list.begin() + to_delete);
        changed = true;
    }

    if (ImGui::SmallButton("+ Add")) {
        list.emplace_back();
        changed = true;
    }
    if (ImGui::IsItemHovered()) {
        ImGui::SetTooltip("Add %s", hint);
    }

    ImGui::PopID();
    return changed;
}

bool render_string_map(const char* label, std::map<std::string, std::string>& map) {
    static std::map<ImGuiID, std::string> new_keys;
    bool changed = false;
    ImGui::PushID(label);
    std::string& new_key = new_keys[ImGui::GetID("##newkey")];
    ImGui::TextDisabled("%s", label);

    std::vector<std::string> to_delete;
    for (auto& [key, value] : map) {
        ImGui::PushID(key.c_str());
        ImGui::Text("%s =", key.c_str());
        ImGui::SameLine();
        if (input_text("##value", value, nullptr, ImGui::GetContentRegionAvail().x - 30)) {
            changed = true;
        }
        ImGui::SameLine();
        if (ImGui::SmallButton("X")) {
            to_delete.push_back(key);
        }
        ImGui::PopID();
    }
    for (const auto& key : to_delete) {
        map.erase(key);
        changed = true;
    }

    input_text("##newkey", new_key, "KEY", 160);
    ImGui::SameLine();
    ImGui::BeginDisabled(new_key.empty());
    if (ImGui::SmallButton("+ Add")) {
        map.emplace(new_key, "");
        new_key.clear();
        changed = true;
    }
    ImGui::EndDisabled();

    ImGui::PopID();
    return changed;
}

void label_row(const char* label, float column) {
    ImGui::AlignTextToFramePadding();
    ImGui::TextUnformatted(label);
    ImGui::SameLine(column);
}

void open_url(const std::string& url) {
#if defined(__APPLE__)
    std::string cmd = "open \"" + url + "\"";
#elif defined(_WIN32)
    std::string cmd = "start \"\" \"" + url + "\"";
#else
    std::string cmd = "xdg-open \"" + url + "\" >/dev/null 2>&1 &";
#endif
    int rc = std::system(cmd.c_str());
    if (rc != 0) {
        ui_log(spdlog::level::warn, "Could not open {} (exit {})", url, rc);
    }
}

}
