#include "ui/skill_panel.h"
#include "core/json_file.h"
#include "core/logging.h"
#include "core/string_utils.h"
#include "ui/theme.h"
#include <imgui.h>
#include <nfd.h>
#include <algorithm>

namespace occm {

namespace {

bool is_editable(SkillSource source) {
    return source == SkillSource::OpenCodeGlobal || source == SkillSource::OpenCodeProject;
}

SkillScope scope_of(SkillSource source) {
    return source == SkillSource::OpenCodeProject ? SkillScope::Project : SkillScope::Global;
}

}

void SkillPanel::set_config_store(ConfigStore* store) {
    store_ = store;
    loaded_ = false;
}

void SkillPanel::render(bool* open) {
    ImGui::SetNextWindowSizeConstraints(ImVec2(320, 240), ImVec2(FLT_MAX, FLT_MAX));
    if (!ImGui::Begin("Skills", open)) {
        ImGui::End();
        return;
    }
    render_content();
    ImGui::End();
}

void SkillPanel::refresh() {
    if (!store_) return;
    skills_ = SkillDiscovery(store_->paths()).discover();
    selected_ = -1;
    preview_.clear();
    loaded_ = true;
    ui_log(spdlog::level::debug, "Discovered {} skills", skills_.size());
}

void SkillPanel::render_content() {
    if (!store_) {
        ImGui::TextColored(ImVec4(1, 0.4f, 0.4f, 1), "ConfigStore not initialized");
        return;
    }
    if (!loaded_) refresh();

    if (ImGui::Button("Refresh")) {
        refresh();
        status_.set("Found " + std::to_string(skills_.size()) + " skills");
    }
    ImGui::SameLine();
    status_.render();

    render_skill_table();
    render_preview();
    render_create_section();
    render_install_section();

    if (show_delete_confirm_) {
        ImGui::OpenPopup("Delete Skill?");
        show_delete_confirm_ = false;
    }

    if (ImGui::BeginPopupModal("Delete Skill?", nullptr, ImGuiWindowFlags_AlwaysAutoResize)) {
        bool valid = pending_delete_ >= 0 && pending_delete_ < static_cast<int>(skills_.size());
        if (valid) {
            const auto& skill = skills_[pending_delete_];
            ImGui::Text("Delete skill \"%s\" (%s)?", skill.name.c_str(), skill_source_label(skill.source));
            ImGui::TextDisabled("%s", skill.path.parent_path().string().c_str());
        }
        ImGui::Text("This removes the whole skill directory.");
        ImGui::Separator();

        if (ImGui::Button("Delete", ImVec2(100, 0))) {
            if (valid) {
                const auto skill = skills_[pending_delete_];
                std::string error;
                if (SkillInstaller(store_->paths()).remove(skill.name, scope_of(skill.source), error)) {
                    refresh();
                    status_.set("Deleted skill " + skill.name);
                } else {
                    status_.error(error);
                }
            }
            pending_delete_ = -1;
            ImGui::CloseCurrentPopup();
        }
        ImGui::SameLine();
        if (ImGui::Button("Cancel", ImVec2(100, 0))) {
            pending_delete_ = -1;
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    }
}

void SkillPanel::render_skill_table() {
    if (skills_.empty()) {
        ImGui::TextDisabled("No skills found in:");
        SkillDiscovery discovery(store_->paths());
        for (auto source : {SkillSource::OpenCodeGlobal, SkillSource::OpenCodeProject,
                            SkillSource::ClaudeGlobal, SkillSource::ClaudeProject}) {
            ImGui::BulletText("%s", discovery.root(source).string().c_str());
        }
        return;
    }

    ImGuiTableFlags flags = ImGuiTableFlags_RowBg | ImGuiTableFlags_BordersInnerV |
                            ImGuiTableFlags_Resizable | ImGuiTableFlags_ScrollY;
    float height = std::min(260.0f, ImGui::GetTextLineHeightWithSpacing() * (skills_.size() + 2));
    if (!ImGui::BeginTable("Skills", 4, flags, ImVec2(0, height))) return;

    ImGui::TableSetupColumn("Name", ImGuiTableColumnFlags_WidthFixed, 180);
    ImGui::TableSetupColumn("Source", ImGuiTableColumnFlags_WidthFixed, 130);
    ImGui::TableSetupColumn("Description", ImGuiTableColumnFlags_WidthStretch);
    ImGui::TableSetupColumn("", ImGuiTableColumnFlags_WidthFixed, 24);
    ImGui::TableSetupScrollFreeze(0, 1);
    ImGui::TableHeadersRow();

    for (int i = 0; i < static_cast<int>(skills_.size()); ++i) {
        const auto& skill = skills_[i];
        ImGui::PushID(i);
        ImGui::TableNextRow();

        ImGui::TableSetColumnIndex(0);
        if (ImGui::Selectable(skill.name.c_str(), selected_ == i)) {
            selected_ = i;
            std::string error;
            auto content = read_text_file(skill.path, error);
            preview_ = content ? *content : error;
        }

        ImGui::TableSetColumnIndex(1);
        ImGui::TextDisabled("%s", skill_source_label(skill.source));

        ImGui::TableSetColumnIndex(2);
        ImGui::TextUnformatted(skill.description.c_str());

        ImGui::TableSetColumnIndex(3);
        if (is_editable(skill.source)) {
            if (ImGui::SmallButton("X")) {
                pending_delete_ = i;
                show_delete_confirm_ = true;
            }
        }
        ImGui::PopID();
    }

    ImGui::EndTable();
}

void SkillPanel::render_preview() {
    if (selected_ < 0 || selected_ >= static_cast<int>(skills_.size())) return;
    if (!ImGui::CollapsingHeader("SKILL.md", ImGuiTreeNodeFlags_DefaultOpen)) return;

    ImGui::TextDisabled("%s", skills_[selected_].path.string().c_str());
    ImGui::BeginChild("SkillPreview", ImVec2(0, 160), true);
    ImGui::TextUnformatted(preview_.c_str());
    ImGui::EndChild();
}

void SkillPanel::render_create_section() {
    if (!ImGui::CollapsingHeader("Create Skill")) return;
    ImGui::Indent();

    label_row("Name:");
    input_text("##skillname", new_name_, "my-skill", 220);
    if (!new_name_.empty() && !is_valid_skill_name(trim(new_name_))) {
        ImGui::SameLine();
        ImGui::TextColored(ImGui::ColorConvertU32ToFloat4(get_current_theme().error), "lowercase, digits, hyphens");
    }

    label_row("Description:");
    input_text("##skilldesc", new_description_, "What the skill does and when to use it", -1);

    ImGui::TextDisabled("Body (markdown; empty uses a starter outline)");
    input_multiline("##skillbody", new_body_, 120);

    ImGui::RadioButton("Global", &create_scope_, 0);
    ImGui::SameLine();
    ImGui::RadioButton("Project", &create_scope_, 1);

    if (ImGui::Button("Create")) {
        std::string error;
        auto scope = create_scope_ == 0 ? SkillScope::Global : SkillScope::Project;
        auto path = SkillInstaller(store_->paths()).create(new_name_, new_description_, new_body_, scope, error);
        if (path) {
            status_.set("Created " + path->string());
            new_name_.clear();
            new_description_.clear();
            new_body_.clear();
            refresh();
        } else {
            status_.error(error);
        }
    }

    ImGui::Unindent();
}

void SkillPanel::render_install_section() {
    if (!ImGui::CollapsingHeader("Install From Directory")) return;
    ImGui::Indent();

    ImGui::TextDisabled("A directory containing SKILL.md");
    input_text("##installdir", install_dir_, "/path/to/skill", 360);
    ImGui::SameLine();
    if (ImGui::Button("Browse...")) {
        nfdchar_t* out_path = nullptr;
        nfdresult_t result = NFD_PickFolder(&out_path, nullptr);
        if (result == NFD_OKAY && out_path) {
            install_dir_ = out_path;
        } else if (result == NFD_ERROR) {
            status_.error(NFD_GetError() ? NFD_GetError() : "file dialog failed");
        }
        if (out_path) {
            NFD_FreePath(out_path);
        }
    }

    ImGui::RadioButton("Global##install", &install_scope_, 0);
    ImGui::SameLine();
    ImGui::RadioButton("Project##install", &install_scope_, 1);

    ImGui::BeginDisabled(trim(install_dir_).empty());
    if (ImGui::Button("Install")) {
        std::string error;
        auto scope = install_scope_ == 0 ? SkillScope::Global : SkillScope::Project;
        auto path = SkillInstaller(store_->paths()).install_from_directory(trim(install_dir_), scope, error);
        if (path) {
            status_.set("Installed " + path->parent_path().filename().string());
            install_dir_.clear();
            refresh();
        } else {
            status_.error(error);
        }
    }
    ImGui::EndDisabled();

    ImGui::Unindent();
}

}
