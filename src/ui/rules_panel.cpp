#include "ui/rules_panel.h"
#include "core/logging.h"
#include "core/string_utils.h"
#include "ui/theme.h"
#include <imgui.h>

namespace occm {

void RulesPanel::set_config_store(ConfigStore* store) {
    store_ = store;
    agents_md_loaded_ = false;
}

void RulesPanel::render(bool* open) {
    ImGui::SetNextWindowSizeConstraints(ImVec2(320, 240), ImVec2(FLT_MAX, FLT_MAX));
    if (!ImGui::Begin("Rules", open)) {
        ImGui::End();
        return;
    }
    render_content();
    ImGui::End();
}

void RulesPanel::render_content() {
    if (!store_) {
        ImGui::TextColored(ImVec4(1, 0.4f, 0.4f, 1), "ConfigStore not initialized");
        return;
    }

    status_.render();

    render_instructions_section();
    render_agents_md_section();
    render_compaction_section();
}

void RulesPanel::render_instructions_section() {
    if (!ImGui::CollapsingHeader("Instructions", ImGuiTreeNodeFlags_DefaultOpen)) return;
    ImGui::Indent();
    ImGui::TextDisabled("Extra instruction files loaded into every session (paths or globs)");

    auto& config = store_->opencode();
    std::string to_delete;
    for (const auto& path : config.instructions) {
        ImGui::PushID(path.c_str());
        ImGui::BulletText("%s", path.c_str());
        ImGui::SameLine(ImGui::GetWindowContentRegionMax().x - 20);
        if (ImGui::SmallButton("X")) {
            to_delete = path;
        }
        ImGui::PopID();
    }
    if (config.instructions.empty()) {
        ImGui::TextDisabled("(none)");
    }

    if (!to_delete.empty() && config.remove_instruction(to_delete)) {
        persist("Removed " + to_delete);
    }

    input_text("##newinstruction", new_instruction_, "CONTRIBUTING.md, docs/*.md", 320);
    ImGui::SameLine();
    ImGui::BeginDisabled(trim(new_instruction_).empty());
    if (ImGui::Button("Add")) {
        const std::string value = trim(new_instruction_);
        if (config.add_instruction(value)) {
            persist("Added " + value);
            new_instruction_.clear();
        } else {
            status_.error("\"" + value + "\" is already listed");
        }
    }
    ImGui::EndDisabled();

    ImGui::Unindent();
}

void RulesPanel::load_agents_md() {
    std::string error;
    auto scope = scope_ == 0 ? RulesScope::Global : RulesScope::Project;
    auto content = AgentsMdStore(store_->paths()).read(scope, error);
    if (content) {
        agents_md_ = *content;
    } else {
        agents_md_.clear();
        status_.error(error);
    }
    agents_md_loaded_ = true;
    agents_md_modified_ = false;
}

void RulesPanel::render_agents_md_section() {
    if (!ImGui::CollapsingHeader("AGENTS.md", ImGuiTreeNodeFlags_DefaultOpen)) return;
    ImGui::Indent();

    if (!agents_md_loaded_) load_agents_md();

    AgentsMdStore agents_md(store_->paths());
    auto scope = scope_ == 0 ? RulesScope::Global : RulesScope::Project;

    bool scope_changed = ImGui::RadioButton("Global", &scope_, 0);
    ImGui::SameLine();
    scope_changed |= ImGui::RadioButton("Project", &scope_, 1);
    if (scope_changed) {
        load_agents_md();
        scope = scope_ == 0 ? RulesScope::Global : RulesScope::Project;
    }
    ImGui::SameLine();
    ImGui::TextDisabled("%s", agents_md.path(scope).string().c_str());

    if (input_multiline("##agentsmd", agents_md_, 220)) {
        agents_md_modified_ = true;
    }

    if (ImGui::Button("Save")) {
        std::string error;
        if (agents_md.write(scope, agents_md_, error)) {
            agents_md_modified_ = false;
            status_.set("Saved " + agents_md.path(scope).filename().string());
            ui_log(spdlog::level::info, "Saved {}", agents_md.path(scope).string());
        } else {
            status_.error(error);
        }
    }
    ImGui::SameLine();
    if (ImGui::Button("Reload")) {
        load_agents_md();
    }
    ImGui::SameLine();
    if (ImGui::Button("Insert Template")) {
        agents_md_ = AgentsMdStore::template_text();
        agents_md_modified_ = true;
    }
    if (agents_md_modified_) {
        ImGui::SameLine();
        ImGui::TextColored(ImGui::ColorConvertU32ToFloat4(get_current_theme().warning), "* unsaved");
    }

    ImGui::Unindent();
}

void RulesPanel::render_compaction_section() {
    if (!ImGui::CollapsingHeader("Compaction")) return;
    ImGui::Indent();

    auto& config = store_->opencode();
    CompactionConfig compaction = config.effective_compaction();

    bool changed = false;
    if (ImGui::Checkbox("Auto compact", &compaction.auto_compact)) {
        compaction.has_auto = true;
        changed = true;
    }
    if (ImGui::IsItemHovered()) {
        ImGui::SetTooltip("Summarize the session when the context window is nearly full");
    }
    if (ImGui::Checkbox("Prune old tool output", &compaction.prune)) {
        compaction.has_prune = true;
        changed = true;
    }

    if (changed) {
        config.compaction = compaction;
        persist("Saved compaction settings");
    }

    if (config.compaction) {
        if (ImGui::SmallButton("Reset to defaults")) {
            config.compaction.reset();
            persist("Compaction reset to defaults");
        }
    } else {
        ImGui::TextDisabled("Using defaults (not written to opencode.json)");
    }

    ImGui::Unindent();
}

bool RulesPanel::persist(const std::string& ok_message) {
    if (!store_->save_opencode()) {
        status_.error(store_->last_error());
        return false;
    }
    ui_log(spdlog::level::info, "{}", ok_message);
    status_.set(ok_message);
    return true;
}

}
