#include "ui/agent_panel.h"
#include "adapters/presets.h"
#include "core/logging.h"
#include "core/string_utils.h"
#include "ui/theme.h"
#include <imgui.h>

namespace occm {

void AgentPanel::render(bool* open) {
    ImGui::SetNextWindowSizeConstraints(ImVec2(320, 240), ImVec2(FLT_MAX, FLT_MAX));
    if (!ImGui::Begin("Agents", open)) {
        ImGui::End();
        return;
    }
    render_content();
    ImGui::End();
}

void AgentPanel::render_content() {
    if (!store_) {
        ImGui::TextColored(ImVec4(1, 0.4f, 0.4f, 1), "ConfigStore not initialized");
        return;
    }

    status_.render();

    ImGui::BeginChild("AgentList", ImVec2(200, 0), true);
    render_agent_list();
    ImGui::EndChild();

    ImGui::SameLine();

    ImGui::BeginChild("AgentEditor", ImVec2(0, 0), true);
    render_agent_editor();
    ImGui::EndChild();

    render_presets_popup();

    if (show_delete_confirm_) {
        ImGui::OpenPopup("Delete Agent?");
        show_delete_confirm_ = false;
    }

    if (ImGui::BeginPopupModal("Delete Agent?", nullptr, ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::Text("Delete agent \"%s\"?", pending_delete_.c_str());
        ImGui::Separator();

        if (ImGui::Button("Delete", ImVec2(100, 0))) {
            if (store_->opencode().remove_agent(pending_delete_)) {
                persist("Deleted agent " + pending_delete_);
            }
            if (selected_ == pending_delete_) selected_.clear();
            pending_delete_.clear();
            ImGui::CloseCurrentPopup();
        }
        ImGui::SameLine();
        if (ImGui::Button("Cancel", ImVec2(100, 0))) {
            pending_delete_.clear();
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    }
}

void AgentPanel::render_agent_list() {
    if (ImGui::Button("+ New Agent", ImVec2(-1, 0))) {
        begin_new_agent();
    }
    if (ImGui::Button("Add Presets...", ImVec2(-1, 0))) {
        preset_checked_.clear();
        show_presets_popup_ = true;
    }
    ImGui::Separator();

    const auto& agents = store_->opencode().agents;
    if (agents.empty()) {
        ImGui::TextDisabled("(no agents)");
        ImGui::TextDisabled("Built-in: build, plan");
    }

    for (const auto& [name, agent] : agents) {
        ImGui::PushID(name.c_str());
        bool selected = !is_new_ && selected_ == name;
        if (ImGui::Selectable(name.c_str(), selected)) {
            select_agent(name);
        }
        if (ImGui::IsItemHovered()) {
            ImGui::SetTooltip("%s\n%s", agent.mode.c_str(), agent.description.c_str());
        }
        if (agent.disable) {
            ImGui::SameLine();
            ImGui::TextDisabled("(off)");
        }
        ImGui::PopID();
    }
}

void AgentPanel::select_agent(const std::string& name) {
    auto& agents = store_->opencode().agents;
    auto it = agents.find(name);
    if (it == agents.end()) return;

    selected_ = name;
    edit_name_ = name;
    editing_ = it->second;
    is_new_ = false;
    override_temperature_ = editing_.temperature.has_value();
    temperature_ = static_cast<float>(editing_.temperature.value_or(kDefaultAgentTemperature));
    max_steps_ = editing_.max_steps.value_or(0);
    permission_text_ = editing_.permission.is_object() && !editing_.permission.empty()
        ? editing_.permission.dump(2) : "";
}

void AgentPanel::begin_new_agent() {
    selected_.clear();
    edit_name_.clear();
    editing_ = AgentConfig{};
    editing_.mode = "subagent";
    is_new_ = true;
    override_temperature_ = false;
    temperature_ = static_cast<float>(kDefaultAgentTemperature);
    max_steps_ = 0;
    permission_text_.clear();
}

void AgentPanel::render_agent_editor() {
    if (selected_.empty() && !is_new_) {
        ImGui::TextDisabled("Select an agent or create a new one");
        return;
    }

    ImGui::Text("%s", is_new_ ? "New agent" : selected_.c_str());
    ImGui::Separator();

    label_row("Name:");
    ImGui::BeginDisabled(!is_new_);
    input_text("##name", edit_name_, "code-reviewer", 220);
    ImGui::EndDisabled();

    label_row("Description:");
    input_text("##desc", editing_.description, "When to use this agent (required)", -1);

    label_row("Mode:");
    combo_string("##mode", editing_.mode, agent_modes(), 140, nullptr);

    label_row("Model:");
    combo_string("##model", editing_.model, store_->opencode().model_refs(), 300, "(default)");
    if (ImGui::IsItemHovered()) {
        ImGui::SetTooltip("provider/model from the configured providers");
    }

    ImGui::Checkbox("Custom temperature", &override_temperature_);
    if (override_temperature_) {
        ImGui::SameLine();
        ImGui::SetNextItemWidth(180);
        ImGui::SliderFloat("##temperature", &temperature_, 0.0f, 2.0f, "%.1f");
    }

    label_row("Max steps:");
    ImGui::SetNextItemWidth(120);
    ImGui::InputInt("##maxsteps", &max_steps_);
    ImGui::SameLine();
    ImGui::TextDisabled("0 = unlimited");

    ImGui::Checkbox("Hidden", &editing_.hidden);
    ImGui::SameLine();
    ImGui::Checkbox("Disabled", &editing_.disable);

    render_tools_section();

    if (ImGui::CollapsingHeader("Permission Overrides")) {
        ImGui::TextDisabled("JSON object, e.g. {\"edit\": \"deny\", \"bash\": \"ask\"}");
        input_multiline("##permission", permission_text_, 80);
    }

    if (ImGui::CollapsingHeader("Prompt")) {
        input_multiline("##prompt", editing_.prompt, 140);
    }

    ImGui::Spacing();
    if (ImGui::Button("Save")) {
        save_agent();
    }
    if (!is_new_) {
        ImGui::SameLine();
        if (ImGui::Button("Delete")) {
            pending_delete_ = selected_;
            show_delete_confirm_ = true;
        }
    }
}

void AgentPanel::render_tools_section() {
    if (!ImGui::CollapsingHeader("Tools")) return;
    ImGui::Indent();

    std::vector<std::string> to_delete;
    for (auto& [tool, enabled] : editing_.tools) {
        ImGui::PushID(tool.c_str());
        ImGui::Checkbox(tool.c_str(), &enabled);
        ImGui::SameLine(ImGui::GetContentRegionAvail().x - 20);
        if (ImGui::SmallButton("X")) {
            to_delete.push_back(tool);
        }
        ImGui::PopID();
    }
    for (const auto& tool : to_delete) {
        editing_.tools.erase(tool);
    }

    input_text("##newtool", new_tool_, "tool name", 140);
    ImGui::SameLine();
    ImGui::BeginDisabled(trim(new_tool_).empty());
    if (ImGui::Button("Add Tool")) {
        editing_.tools[trim(new_tool_)] = true;
        new_tool_.clear();
    }
    ImGui::EndDisabled();
    ImGui::TextDisabled("Common tools: write, edit, bash, read, glob, grep, webfetch");

    ImGui::Unindent();
}

void AgentPanel::save_agent() {
    AgentConfig agent = editing_;
    agent.temperature.reset();
    if (override_temperature_) {
        agent.temperature = round_temperature(temperature_);
    }
    agent.max_steps.reset();
    if (max_steps_ > 0) agent.max_steps = max_steps_;

    if (trim(permission_text_).empty()) {
        agent.permission = nullptr;
    } else {
        auto parsed = nlohmann::json::parse(permission_text_, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            status_.error("Permission overrides must be a JSON object");
            return;
        }
        agent.permission = parsed;
    }

    std::string error;
    const std::string name = trim(edit_name_);
    if (!store_->opencode().save_agent(name, agent, is_new_, error)) {
        status_.error(error);
        return;
    }
    if (persist("Saved agent " + name)) {
        select_agent(name);
    }
}

void AgentPanel::render_presets_popup() {
    if (show_presets_popup_) {
        ImGui::OpenPopup("Agent Presets");
        show_presets_popup_ = false;
    }

    if (!ImGui::BeginPopupModal("Agent Presets", nullptr, ImGuiWindowFlags_AlwaysAutoResize)) return;

    ImGui::Text("Add preset agents to opencode.json");
    ImGui::TextDisabled("Existing agents with the same name are replaced.");
    ImGui::Separator();

    const auto& agents = store_->opencode().agents;
    for (const auto& preset : opencode_agent_presets()) {
        ImGui::PushID(preset.name.c_str());
        bool& checked = preset_checked_[preset.name];
        ImGui::Checkbox(preset.name.c_str(), &checked);
        ImGui::SameLine(180);
        ImGui::TextDisabled("[%s] %s", preset.mode.c_str(), preset.description.c_str());
        if (agents.count(preset.name) > 0) {
            ImGui::SameLine();
            ImGui::TextColored(ImGui::ColorConvertU32ToFloat4(get_current_theme().warning), "(exists)");
        }
        ImGui::PopID();
    }

    ImGui::Spacing();
    if (ImGui::Button("Add", ImVec2(100, 0))) {
        std::vector<std::string> names;
        for (const auto& [name, checked] : preset_checked_) {
            if (checked) names.push_back(name);
        }
        int added = store_->opencode().add_preset_agents(names);
        if (added > 0) {
            persist("Added " + std::to_string(added) + " preset agents");
        }
        ImGui::CloseCurrentPopup();
    }
    ImGui::SameLine();
    if (ImGui::Button("Cancel", ImVec2(100, 0))) {
        ImGui::CloseCurrentPopup();
    }
    ImGui::EndPopup();
}

bool AgentPanel::persist(const std::string& ok_message) {
    if (!store_->save_opencode()) {
        status_.error(store_->last_error());
        return false;
    }
    ui_log(spdlog::level::info, "{}", ok_message);
    status_.set(ok_message);
    return true;
}

}
