#include "ui/backup_panel.h"
#include "core/logging.h"
#include "ui/theme.h"
#include <imgui.h>
#include <algorithm>
#include <cstdio>

namespace occm {

namespace {

std::string format_size(uintmax_t size) {
    char buf[32];
    if (size < 1024) {
        std::snprintf(buf, sizeof(buf), "%ju B", size);
    } else {
        std::snprintf(buf, sizeof(buf), "%.1f KB", static_cast<double>(size) / 1024.0);
    }
    return buf;
}

// 20250101_093000 -> 2025-01-01 09:30:00
std::string format_timestamp(const std::string& ts) {
    if (ts.size() < 15 || ts[8] != '_') return ts;
    return ts.substr(0, 4) + "-" + ts.substr(4, 2) + "-" + ts.substr(6, 2) + " " +
           ts.substr(9, 2) + ":" + ts.substr(11, 2) + ":" + ts.substr(13, 2) + ts.substr(15);
}

}

void BackupPanel::set_config_store(ConfigStore* store) {
    store_ = store;
    loaded_ = false;
    if (store_) keep_count_ = static_cast<int>(store_->backup_keep_count());
}

void BackupPanel::render(bool* open) {
    ImGui::SetNextWindowSizeConstraints(ImVec2(360, 200), ImVec2(FLT_MAX, FLT_MAX));
    if (!ImGui::Begin("Backups", open)) {
        ImGui::End();
        return;
    }
    render_content();
    ImGui::End();
}

void BackupPanel::refresh() {
    backups_ = store_->backups().list_backups(filter_);
    loaded_ = true;
}

void BackupPanel::render_content() {
    if (!store_) {
        ImGui::TextColored(ImVec4(1, 0.4f, 0.4f, 1), "ConfigStore not initialized");
        return;
    }
    if (!loaded_) refresh();

    render_toolbar();
    status_.render();
    ImGui::Separator();
    render_backup_table();
    render_restore_popup();
}

void BackupPanel::render_toolbar() {
    ImGui::TextDisabled("%s", store_->backups().backup_dir().string().c_str());

    if (ImGui::Button("Backup Now")) {
        int count = store_->backup_all("manual");
        refresh();
        if (count > 0) {
            status_.set("Backed up " + std::to_string(count) + " files");
        } else {
            status_.error("No config files to back up");
        }
    }
    ImGui::SameLine();
    if (ImGui::Button("Refresh")) {
        refresh();
    }

    ImGui::SameLine();
    static const std::vector<std::string> names = {"opencode", "oh-my-opencode"};
    if (combo_string("##filter", filter_, names, 160, "(all files)")) {
        refresh();
    }

    label_row("Keep per file:", 110);
    ImGui::SetNextItemWidth(100);
    if (ImGui::InputInt("##keep", &keep_count_)) {
        keep_count_ = std::max(1, std::min(keep_count_, 100));
        store_->set_backup_keep_count(static_cast<size_t>(keep_count_));
        if (on_keep_count_changed_) on_keep_count_changed_(keep_count_);
    }
    ImGui::SameLine();
    if (ImGui::Button("Clean Up")) {
        int removed = 0;
        for (const auto& name : names) {
            removed += store_->backups().cleanup(name, static_cast<size_t>(keep_count_));
        }
        refresh();
        status_.set("Deleted " + std::to_string(removed) + " old backups");
        ui_log(spdlog::level::info, "Backup cleanup removed {} files", removed);
    }
}

void BackupPanel::render_backup_table() {
    if (backups_.empty()) {
        ImGui::TextDisabled("No backups yet. Every save makes one automatically.");
        return;
    }

    const auto& theme = get_current_theme();
    ImGuiTableFlags flags = ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg | ImGuiTableFlags_ScrollY;
    if (!ImGui::BeginTable("BackupTable", 5, flags)) return;

    ImGui::TableSetupColumn("File", ImGuiTableColumnFlags_WidthFixed, 130);
    ImGui::TableSetupColumn("Time", ImGuiTableColumnFlags_WidthFixed, 170);
    ImGui::TableSetupColumn("Tag", ImGuiTableColumnFlags_WidthFixed, 110);
    ImGui::TableSetupColumn("Size", ImGuiTableColumnFlags_WidthFixed, 80);
    ImGui::TableSetupColumn("", ImGuiTableColumnFlags_WidthStretch);
    ImGui::TableSetupScrollFreeze(0, 1);
    ImGui::TableHeadersRow();

    int to_delete = -1;
    for (int i = 0; i < static_cast<int>(backups_.size()); ++i) {
        const auto& backup = backups_[i];
        ImGui::PushID(i);
        ImGui::TableNextRow();

        ImGui::TableSetColumnIndex(0);
        ImGui::TextUnformatted(backup.name.c_str());

        ImGui::TableSetColumnIndex(1);
        ImGui::TextUnformatted(format_timestamp(backup.timestamp).c_str());

        ImGui::TableSetColumnIndex(2);
        uint32_t tag_color = backup.tag == "manual" ? theme.info
                           : backup.tag == "before_restore" ? theme.warning
                           : theme.foreground_dim;
        ImGui::TextColored(ImGui::ColorConvertU32ToFloat4(tag_color), "%s", backup.tag.c_str());

        ImGui::TableSetColumnIndex(3);
        ImGui::TextUnformatted(format_size(backup.size).c_str());

        ImGui::TableSetColumnIndex(4);
        if (ImGui::SmallButton("Restore")) {
            pending_restore_ = i;
            show_restore_confirm_ = true;
        }
        ImGui::SameLine();
        if (ImGui::SmallButton("Delete")) {
            to_delete = i;
        }
        if (ImGui::IsItemHovered()) {
            ImGui::SetTooltip("%s", backup.path.filename().string().c_str());
        }

        ImGui::PopID();
    }
    ImGui::EndTable();

    if (to_delete >= 0) {
        const auto path = backups_[to_delete].path;
        if (store_->backups().delete_backup(path)) {
            status_.set("Deleted " + path.filename().string());
        } else {
            status_.error("Could not delete " + path.filename().string());
        }
        refresh();
    }
}

std::filesystem::path BackupPanel::restore_target(const BackupInfo& info) const {
    if (info.name == store_->ohmyopencode_path().stem().string()) {
        return store_->ohmyopencode_path();
    }
    if (info.name == store_->opencode_path().stem().string()) {
        return store_->opencode_path();
    }
    return {};
}

void BackupPanel::render_restore_popup() {
    if (show_restore_confirm_) {
        ImGui::OpenPopup("Restore Backup?");
        show_restore_confirm_ = false;
    }

    if (!ImGui::BeginPopupModal("Restore Backup?", nullptr, ImGuiWindowFlags_AlwaysAutoResize)) return;

    bool valid = pending_restore_ >= 0 && pending_restore_ < static_cast<int>(backups_.size());
    std::filesystem::path target;
    if (valid) {
        const auto& backup = backups_[pending_restore_];
        target = restore_target(backup);
        ImGui::Text("Restore %s from %s?", backup.name.c_str(), format_timestamp(backup.timestamp).c_str());
        if (target.empty()) {
            ImGui::TextColored(ImGui::ColorConvertU32ToFloat4(get_current_theme().error),
                               "No config file matches this backup");
        } else {
            ImGui::TextDisabled("Overwrites %s", target.string().c_str());
            ImGui::TextDisabled("The current file is backed up first (before_restore).");
        }
    }
    ImGui::Separator();

    ImGui::BeginDisabled(!valid || target.empty());
    if (ImGui::Button("Restore", ImVec2(100, 0))) {
        std::string error;
        if (store_->backups().restore(backups_[pending_restore_].path, target, error)) {
            store_->reload();
            status_.set("Restored " + target.filename().string());
            ui_log(spdlog::level::info, "Restored {} from {}", target.string(),
                   backups_[pending_restore_].path.string());
            if (on_restored_) on_restored_();
        } else {
            status_.error(error);
        }
        refresh();
        pending_restore_ = -1;
        ImGui::CloseCurrentPopup();
    }
    ImGui::EndDisabled();
    ImGui::SameLine();
    if (ImGui::Button("Cancel", ImVec2(100, 0))) {
        pending_restore_ = -1;
        ImGui::CloseCurrentPopup();
    }
    ImGui::EndPopup();
}

}
