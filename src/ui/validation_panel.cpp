#include "ui/validation_panel.h"
#include "core/json_file.h"
#include "core/logging.h"
#include "ui/theme.h"
#include <imgui.h>

namespace occm {

void ValidationPanel::render(bool* open) {
    ImGui::SetNextWindowSizeConstraints(ImVec2(320, 200), ImVec2(FLT_MAX, FLT_MAX));
    if (!ImGui::Begin("Validation", open)) {
        ImGui::End();
        return;
    }
    render_content();
    ImGui::End();
}

void ValidationPanel::run_validation() {
    if (!store_) return;

    std::string error;
    auto on_disk = read_json_file(store_->opencode_path(), error);
    if (on_disk) {
        document_ = *on_disk;
    } else if (error.empty()) {
        document_ = store_->opencode().to_json();
    } else {
        issues_ = {{IssueSeverity::Error, "", error}};
        document_ = nlohmann::json();
        validated_ = true;
        status_.error(error);
        return;
    }

    issues_ = ConfigValidator::validate(document_);
    applied_fixes_.clear();
    validated_ = true;

    size_t errors = ConfigValidator::error_count(issues_);
    ui_log(spdlog::level::info, "Validation: {} errors, {} warnings", errors, issues_.size() - errors);
    if (issues_.empty()) {
        status_.set("No problems found");
    }
}

void ValidationPanel::render_content() {
    if (!store_) {
        ImGui::TextColored(ImVec4(1, 0.4f, 0.4f, 1), "ConfigStore not initialized");
        return;
    }

    ImGui::TextDisabled("%s", store_->opencode_path().string().c_str());
    if (ImGui::Button("Validate")) {
        run_validation();
    }
    ImGui::SameLine();
    ImGui::BeginDisabled(!validated_ || !document_.is_object() || issues_.empty());
    if (ImGui::Button("Auto Fix")) {
        apply_fixes();
    }
    ImGui::EndDisabled();
    ImGui::SameLine();
    status_.render();

    ImGui::Separator();

    if (!validated_) {
        ImGui::TextDisabled("Run Validate to check opencode.json");
        return;
    }

    render_issues();

    if (!applied_fixes_.empty()) {
        ImGui::Spacing();
        ImGui::TextDisabled("Applied fixes:");
        for (const auto& fix : applied_fixes_) {
            ImGui::BulletText("%s", fix.c_str());
        }
    }
}

void ValidationPanel::render_issues() {
    const auto& theme = get_current_theme();
    if (issues_.empty()) {
        ImGui::TextColored(ImGui::ColorConvertU32ToFloat4(theme.success), "Configuration is valid");
        return;
    }

    size_t errors = ConfigValidator::error_count(issues_);
    ImGui::Text("%zu errors, %zu warnings", errors, issues_.size() - errors);

    if (!ImGui::BeginTable("Issues", 3, ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg | ImGuiTableFlags_Resizable)) {
        return;
    }
    ImGui::TableSetupColumn("", ImGuiTableColumnFlags_WidthFixed, 60);
    ImGui::TableSetupColumn("Path", ImGuiTableColumnFlags_WidthFixed, 220);
    ImGui::TableSetupColumn("Problem", ImGuiTableColumnFlags_WidthStretch);
    ImGui::TableHeadersRow();

    for (const auto& issue : issues_) {
        ImGui::TableNextRow();
        ImGui::TableSetColumnIndex(0);
        if (issue.severity == IssueSeverity::Error) {
            ImGui::TextColored(ImGui::ColorConvertU32ToFloat4(theme.error), "error");
        } else {
            ImGui::TextColored(ImGui::ColorConvertU32ToFloat4(theme.warning), "warning");
        }
        ImGui::TableSetColumnIndex(1);
        ImGui::TextUnformatted(issue.path.empty() ? "(root)" : issue.path.c_str());
        ImGui::TableSetColumnIndex(2);
        ImGui::TextWrapped("%s", issue.message.c_str());
    }
    ImGui::EndTable();
}

void ValidationPanel::apply_fixes() {
    auto fixes = ConfigValidator::fix(document_);
    if (fixes.empty()) {
        status_.set("Nothing could be fixed automatically");
        return;
    }

    store_->opencode() = OpenCodeConfig::from_json(document_);
    if (!store_->save_opencode()) {
        status_.error(store_->last_error());
        return;
    }

    ui_log(spdlog::level::info, "Applied {} automatic fixes", fixes.size());
    run_validation();
    applied_fixes_ = std::move(fixes);
    status_.set("Applied " + std::to_string(applied_fixes_.size()) + " fixes");
}

}
