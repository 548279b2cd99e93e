#include "ui/ohmy_panel.h"
#include "adapters/presets.h"
#include "core/logging.h"
#include "core/string_utils.h"
#include "ui/theme.h"
#include <imgui.h>

namespace occm {

void OhMyPanel::render(bool* open) {
    ImGui::SetNextWindowSizeConstraints(ImVec2(320, 240), ImVec2(FLT_MAX, FLT_MAX));
    if (!ImGui::Begin("Oh My OpenCode", open)) {
        ImGui::End();
        return;
    }
    render_content();
    ImGui::End();
}

void OhMyPanel::render_content() {
    if (!store_) {
        ImGui::TextColored(ImVec4(1, 0.4f, 0.4f, 1), "ConfigStore not initialized");
        return;
    }

    ImGui::TextDisabled("%s", store_->ohmyopencode_path().string().c_str());
    status_.render();

    ImGui::BeginChild("OhMyLists", ImVec2(220, 0), true);
    render_lists();
    ImGui::EndChild();

    ImGui::SameLine();

    ImGui::BeginChild("OhMyEditor", ImVec2(0, 0), true);
    render_editor();
    ImGui::EndChild();

    render_presets_popup();
}

void OhMyPanel::render_lists() {
    if (ImGui::Button("Add Presets...", ImVec2(-1, 0))) {
        agent_preset_checked_.clear();
        category_preset_checked_.clear();
        show_presets_popup_ = true;
    }

    auto& config = store_->ohmyopencode();

    ImGui::Separator();
    ImGui::TextDisabled("Agents");
    if (ImGui::SmallButton("+ Agent")) {
        selection_ = Selection::Agent;
        selected_.clear();
        edit_name_.clear();
        agent_editing_ = OhMyAgent{};
        is_new_ = true;
    }
    for (const auto& [name, agent] : config.agents) {
        ImGui::PushID(name.c_str());
        bool selected = selection_ == Selection::Agent && !is_new_ && selected_ == name;
        if (ImGui::Selectable(name.c_str(), selected)) {
            select_agent(name);
        }
        if (ImGui::IsItemHovered()) {
            ImGui::SetTooltip("%s", agent.model.c_str());
        }
        ImGui::PopID();
    }
    if (config.agents.empty()) ImGui::TextDisabled("(none)");

    ImGui::Separator();
    ImGui::TextDisabled("Categories");
    if (ImGui::SmallButton("+ Category")) {
        selection_ = Selection::Category;
        selected_.clear();
        edit_name_.clear();
        category_editing_ = Category{};
        temperature_ = static_cast<float>(category_editing_.temperature);
        is_new_ = true;
    }
    for (const auto& [name, category] : config.categories) {
        ImGui::PushID(("cat_" + name).c_str());
        bool selected = selection_ == Selection::Category && !is_new_ && selected_ == name;
        if (ImGui::Selectable(name.c_str(), selected)) {
            select_category(name);
        }
        if (ImGui::IsItemHovered()) {
            ImGui::SetTooltip("%s  t=%.1f", category.model.c_str(), category.temperature);
        }
        ImGui::PopID();
    }
    if (config.categories.empty()) ImGui::TextDisabled("(none)");
}

void OhMyPanel::select_agent(const std::string& name) {
    auto it = store_->ohmyopencode().agents.find(name);
    if (it == store_->ohmyopencode().agents.end()) return;
    selection_ = Selection::Agent;
    selected_ = name;
    edit_name_ = name;
    agent_editing_ = it->second;
    is_new_ = false;
}

void OhMyPanel::select_category(const std::string& name) {
    auto it = store_->ohmyopencode().categories.find(name);
    if (it == store_->ohmyopencode().categories.end()) return;
    selection_ = Selection::Category;
    selected_ = name;
    edit_name_ = name;
    category_editing_ = it->second;
    temperature_ = static_cast<float>(category_editing_.temperature);
    is_new_ = false;
}

void OhMyPanel::render_editor() {
    switch (selection_) {
        case Selection::Agent:
            render_agent_editor();
            break;
        case Selection::Category:
            render_category_editor();
            break;
        case Selection::None:
            ImGui::TextDisabled("Select an agent or category");
            break;
    }
}

void OhMyPanel::render_agent_editor() {
    ImGui::Text("%s", is_new_ ? "New agent" : selected_.c_str());
    ImGui::Separator();

    label_row("Name:");
    ImGui::BeginDisabled(!is_new_);
    input_text("##name", edit_name_, "oracle", 220);
    ImGui::EndDisabled();

    label_row("Model:");
    combo_string("##model", agent_editing_.model, store_->opencode().model_refs(), 300, "(select)");

    label_row("Description:");
    input_text("##desc", agent_editing_.description, "optional", -1);

    ImGui::Spacing();
    if (ImGui::Button("Save")) {
        save_agent();
    }
    if (!is_new_) {
        ImGui::SameLine();
        if (ImGui::Button("Delete")) {
            const std::string name = selected_;
            if (store_->ohmyopencode().remove_agent(name)) {
                persist("Deleted agent " + name);
            }
            selection_ = Selection::None;
            selected_.clear();
        }
    }
}

void OhMyPanel::render_category_editor() {
    ImGui::Text("%s", is_new_ ? "New category" : selected_.c_str());
    ImGui::Separator();

    label_row("Name:");
    ImGui::BeginDisabled(!is_new_);
    input_text("##name", edit_name_, "visual", 220);
    ImGui::EndDisabled();

    label_row("Model:");
    combo_string("##model", category_editing_.model, store_->opencode().model_refs(), 300, "(select)");

    label_row("Temperature:");
    ImGui::SetNextItemWidth(200);
    ImGui::SliderFloat("##temperature", &temperature_, 0.0f, 2.0f, "%.1f");

    label_row("Description:");
    input_text("##desc", category_editing_.description, "optional", -1);

    ImGui::Spacing();
    if (ImGui::Button("Save")) {
        save_category();
    }
    if (!is_new_) {
        ImGui::SameLine();
        if (ImGui::Button("Delete")) {
            const std::string name = selected_;
            if (store_->ohmyopencode().remove_category(name)) {
                persist("Deleted category " + name);
            }
            selection_ = Selection::None;
            selected_.clear();
        }
    }
}

void OhMyPanel::save_agent() {
    std::string error;
    const std::string name = trim(edit_name_);
    if (!store_->ohmyopencode().save_agent(name, agent_editing_, is_new_, error)) {
        status_.error(error);
        return;
    }
    if (persist("Saved agent " + name)) {
        select_agent(name);
    }
}

void OhMyPanel::save_category() {
    Category category = category_editing_;
    category.temperature = temperature_;

    std::string error;
    const std::string name = trim(edit_name_);
    if (!store_->ohmyopencode().save_category(name, category, is_new_, error)) {
        status_.error(error);
        return;
    }
    if (persist("Saved category " + name)) {
        select_category(name);
    }
}

void OhMyPanel::render_presets_popup() {
    if (show_presets_popup_) {
        ImGui::OpenPopup("Oh My OpenCode Presets");
        show_presets_popup_ = false;
    }

    if (!ImGui::BeginPopupModal("Oh My OpenCode Presets", nullptr, ImGuiWindowFlags_AlwaysAutoResize)) return;

    const auto refs = store_->opencode().model_refs();
    label_row("Model:", 80);
    combo_string("##presetmodel", preset_model_, refs, 300, "(select)");
    if (refs.empty()) {
        ImGui::TextColored(ImGui::ColorConvertU32ToFloat4(get_current_theme().warning),
                           "Configure a provider with models first");
    }

    ImGui::Separator();
    ImGui::TextDisabled("Agents");
    for (const auto& preset : ohmy_agent_presets()) {
        ImGui::PushID(preset.name.c_str());
        ImGui::Checkbox(preset.name.c_str(), &agent_preset_checked_[preset.name]);
        ImGui::SameLine(240);
        ImGui::TextDisabled("%s", preset.description.c_str());
        ImGui::PopID();
    }

    ImGui::Separator();
    ImGui::TextDisabled("Categories");
    for (const auto& preset : category_presets()) {
        ImGui::PushID(("cat_" + preset.name).c_str());
        ImGui::Checkbox(preset.name.c_str(), &category_preset_checked_[preset.name]);
        ImGui::SameLine(240);
        ImGui::TextDisabled("t=%.1f  %s", preset.temperature, preset.description.c_str());
        ImGui::PopID();
    }

    ImGui::Spacing();
    ImGui::BeginDisabled(preset_model_.empty());
    if (ImGui::Button("Add", ImVec2(100, 0))) {
        auto& config = store_->ohmyopencode();
        int added = 0;
        std::string error;
        for (const auto& [name, checked] : agent_preset_checked_) {
            if (!checked) continue;
            if (config.add_preset_agent(name, preset_model_, error)) ++added;
        }
        for (const auto& [name, checked] : category_preset_checked_) {
            if (!checked) continue;
            if (config.add_preset_category(name, preset_model_, error)) ++added;
        }
        if (added > 0) {
            persist("Added " + std::to_string(added) + " presets");
        }
        if (!error.empty()) {
            status_.error(error);
        }
        ImGui::CloseCurrentPopup();
    }
    ImGui::EndDisabled();
    ImGui::SameLine();
    if (ImGui::Button("Cancel", ImVec2(100, 0))) {
        ImGui::CloseCurrentPopup();
    }
    ImGui::EndPopup();
}

bool OhMyPanel::persist(const std::string& ok_message) {
    if (!store_->save_ohmyopencode()) {
        status_.error(store_->last_error());
        return false;
    }
    ui_log(spdlog::level::info, "{}", ok_message);
    status_.set(ok_message);
    return true;
}

}
