#include "ui/permission_panel.h"
#include "adapters/presets.h"
#include "core/logging.h"
#include "core/string_utils.h"
#include "ui/theme.h"
#include <imgui.h>

namespace occm {

namespace {

ImVec4 level_color(const std::string& level) {
    const auto& theme = get_current_theme();
    if (level == "allow") return ImGui::ColorConvertU32ToFloat4(theme.success);
    if (level == "deny") return ImGui::ColorConvertU32ToFloat4(theme.error);
    if (level == "ask") return ImGui::ColorConvertU32ToFloat4(theme.warning);
    return ImGui::ColorConvertU32ToFloat4(theme.foreground_dim);
}

}

void PermissionPanel::render(bool* open) {
    ImGui::SetNextWindowSizeConstraints(ImVec2(300, 200), ImVec2(FLT_MAX, FLT_MAX));
    if (!ImGui::Begin("Permissions", open)) {
        ImGui::End();
        return;
    }
    render_content();
    ImGui::End();
}

void PermissionPanel::render_content() {
    if (!store_) {
        ImGui::TextColored(ImVec4(1, 0.4f, 0.4f, 1), "ConfigStore not initialized");
        return;
    }

    status_.render();

    render_tool_section();
    render_quick_allow();
    render_skill_section();
}

void PermissionPanel::render_tool_section() {
    if (!ImGui::CollapsingHeader("Tool Permissions", ImGuiTreeNodeFlags_DefaultOpen)) return;
    ImGui::Indent();

    auto& config = store_->opencode();
    const auto permissions = config.tool_permissions();
    if (permissions.empty()) {
        ImGui::TextDisabled("No tool permissions; OpenCode asks by default");
    }

    std::string to_delete;
    for (const auto& [tool, level] : permissions) {
        ImGui::PushID(tool.c_str());

        ImGui::AlignTextToFramePadding();
        ImGui::Text("%s", tool.c_str());
        ImGui::SameLine(160);

        if (is_valid_permission_level(level)) {
            std::string value = level;
            if (combo_string("##level", value, permission_levels(), 100, nullptr)) {
                std::string error;
                if (config.set_permission(tool, value, error)) {
                    persist(tool + " -> " + value);
                } else {
                    status_.error(error);
                }
            }
            ImGui::SameLine();
            ImGui::TextColored(level_color(level), "*");
        } else {
            // Pattern objects such as {"git *": "allow"} are shown read-only.
            ImGui::TextDisabled("%s", level.c_str());
        }

        ImGui::SameLine(ImGui::GetWindowContentRegionMax().x - 20);
        if (ImGui::SmallButton("X")) {
            to_delete = tool;
        }
        ImGui::PopID();
    }

    if (!to_delete.empty() && config.remove_permission(to_delete)) {
        persist("Removed permission for " + to_delete);
    }

    ImGui::Spacing();
    input_text("##newtool", new_tool_, "tool name", 140);
    ImGui::SameLine();
    combo_string("##newlevel", new_tool_level_, permission_levels(), 100, nullptr);
    ImGui::SameLine();
    ImGui::BeginDisabled(trim(new_tool_).empty());
    if (ImGui::Button("Set")) {
        std::string error;
        const std::string tool = trim(new_tool_);
        if (config.set_permission(tool, new_tool_level_, error)) {
            persist(tool + " -> " + new_tool_level_);
            new_tool_.clear();
        } else {
            status_.error(error);
        }
    }
    ImGui::EndDisabled();

    ImGui::Unindent();
}

void PermissionPanel::render_quick_allow() {
    if (!ImGui::CollapsingHeader("Quick Allow", ImGuiTreeNodeFlags_DefaultOpen)) return;
    ImGui::Indent();
    ImGui::TextDisabled("One click sets the tool to \"allow\"");

    auto& config = store_->opencode();
    float avail = ImGui::GetContentRegionAvail().x;
    float used = 0.0f;
    for (const auto& tool : common_permission_tools()) {
        float width = ImGui::CalcTextSize(tool.c_str()).x + ImGui::GetStyle().FramePadding.x * 2;
        if (used > 0.0f && used + width < avail) {
            ImGui::SameLine();
        } else {
            used = 0.0f;
        }
        used += width + ImGui::GetStyle().ItemSpacing.x;

        auto it = config.permission.find(tool);
        bool allowed = it != config.permission.end() && it->second == "allow";
        ImGui::BeginDisabled(allowed);
        if (ImGui::Button(tool.c_str())) {
            config.quick_allow(tool);
            persist(tool + " -> allow");
        }
        ImGui::EndDisabled();
    }

    ImGui::Unindent();
}

void PermissionPanel::render_skill_section() {
    if (!ImGui::CollapsingHeader("Skill Permissions")) return;
    ImGui::Indent();
    ImGui::TextDisabled("permission.skill: pattern -> level, e.g. internal-* = deny");

    auto& config = store_->opencode();
    std::string to_delete;
    for (const auto& [pattern, level] : config.skill_permissions()) {
        ImGui::PushID(pattern.c_str());

        ImGui::AlignTextToFramePadding();
        ImGui::Text("%s", pattern.c_str());
        ImGui::SameLine(160);

        std::string value = level;
        if (combo_string("##level", value, permission_levels(), 100, nullptr)) {
            std::string error;
            if (config.set_skill_permission(pattern, value, error)) {
                persist("skill " + pattern + " -> " + value);
            } else {
                status_.error(error);
            }
        }

        ImGui::SameLine(ImGui::GetWindowContentRegionMax().x - 20);
        if (ImGui::SmallButton("X")) {
            to_delete = pattern;
        }
        ImGui::PopID();
    }

    if (!to_delete.empty() && config.remove_skill_permission(to_delete)) {
        persist("Removed skill permission " + to_delete);
    }

    ImGui::Spacing();
    input_text("##newpattern", new_pattern_, "pattern", 140);
    ImGui::SameLine();
    combo_string("##newpatternlevel", new_pattern_level_, permission_levels(), 100, nullptr);
    ImGui::SameLine();
    ImGui::BeginDisabled(trim(new_pattern_).empty());
    if (ImGui::Button("Add")) {
        std::string error;
        if (config.set_skill_permission(new_pattern_, new_pattern_level_, error)) {
            persist("skill " + trim(new_pattern_) + " -> " + new_pattern_level_);
            new_pattern_.clear();
        } else {
            status_.error(error);
        }
    }
    ImGui::EndDisabled();

    ImGui::Unindent();
}

bool PermissionPanel::persist(const std::string& ok_message) {
    if (!store_->save_opencode()) {
        status_.error(store_->last_error());
        return false;
    }
    ui_log(spdlog::level::info, "Permission: {}", ok_message);
    status_.set(ok_message);
    return true;
}

}
