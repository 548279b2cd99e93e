#include "ui/overview_panel.h"
#include "core/logging.h"
#include "ui/theme.h"
#include <imgui.h>

namespace occm {

void OverviewPanel::render(bool* open) {
    ImGui::SetNextWindowSizeConstraints(ImVec2(300, 200), ImVec2(FLT_MAX, FLT_MAX));
    if (!ImGui::Begin("Overview", open)) {
        ImGui::End();
        return;
    }
    render_content();
    ImGui::End();
}

void OverviewPanel::render_content() {
    if (!store_) {
        ImGui::TextColored(ImVec4(1, 0.4f, 0.4f, 1), "ConfigStore not initialized");
        return;
    }

    render_update_banner();

    if (ImGui::Button("Reload")) {
        if (store_->reload()) {
            status_.set("Reloaded from disk");
        } else {
            status_.error(store_->last_error());
        }
    }
    ImGui::SameLine();
    if (ImGui::Button("Backup All")) {
        int count = store_->backup_all("manual");
        status_.set("Backed up " + std::to_string(count) + " files");
    }
    ImGui::SameLine();
    status_.render();

    if (!store_->last_error().empty()) {
        ImGui::TextColored(ImGui::ColorConvertU32ToFloat4(get_current_theme().error), "%s",
                           store_->last_error().c_str());
    }

    render_files_section();
    render_stats_section();
    render_models_section();
}

void OverviewPanel::render_update_banner() {
    if (!update_) return;

    const auto& theme = get_current_theme();
    ImGui::PushStyleColor(ImGuiCol_ChildBg, ImGui::ColorConvertU32ToFloat4(theme.selection));
    ImGui::BeginChild("UpdateBanner", ImVec2(0, ImGui::GetFrameHeightWithSpacing() + 8), true);
    ImGui::AlignTextToFramePadding();
    ImGui::Text("Version %s is available", update_->version.c_str());
    ImGui::SameLine();
    if (ImGui::SmallButton("Download")) {
        open_url(update_->url);
    }
    ImGui::SameLine();
    if (ImGui::SmallButton("Dismiss")) {
        update_.reset();
    }
    ImGui::EndChild();
    ImGui::PopStyleColor();
}

void OverviewPanel::render_files_section() {
    if (!ImGui::CollapsingHeader("Files", ImGuiTreeNodeFlags_DefaultOpen)) return;
    ImGui::Indent();

    const auto& theme = get_current_theme();
    const auto& paths = store_->paths();
    auto file_row = [&theme](const char* label, const std::filesystem::path& path) {
        std::error_code ec;
        bool exists = std::filesystem::exists(path, ec);
        label_row(label);
        ImGui::TextColored(ImGui::ColorConvertU32ToFloat4(exists ? theme.foreground : theme.foreground_dim),
                           "%s%s", path.string().c_str(), exists ? "" : "  (missing)");
    };

    file_row("OpenCode:", store_->opencode_path());
    file_row("Oh My OpenCode:", store_->ohmyopencode_path());
    file_row("Credentials:", paths.auth_file());
    file_row("Backups:", paths.backup_dir());

    if (ImGui::SmallButton("Open config folder")) {
        open_url(paths.opencode_dir().string());
    }

    ImGui::Unindent();
}

void OverviewPanel::render_stats_section() {
    if (!ImGui::CollapsingHeader("Summary", ImGuiTreeNodeFlags_DefaultOpen)) return;

    const auto stats = store_->stats();
    if (!ImGui::BeginTable("Stats", 3, ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg)) return;

    auto cell = [](const char* label, size_t value) {
        ImGui::TableNextColumn();
        ImGui::Text("%zu", value);
        ImGui::SameLine();
        ImGui::TextDisabled("%s", label);
    };
    cell("providers", stats.providers);
    cell("models", stats.models);
    cell("MCP servers", stats.mcp_servers);
    cell("agents", stats.agents);
    cell("oh-my agents", stats.ohmy_agents);
    cell("categories", stats.categories);

    ImGui::EndTable();
}

void OverviewPanel::render_models_section() {
    if (!ImGui::CollapsingHeader("Default Models", ImGuiTreeNodeFlags_DefaultOpen)) return;
    ImGui::Indent();

    auto& config = store_->opencode();
    const auto refs = config.model_refs();
    if (refs.empty()) {
        ImGui::TextDisabled("Add a provider with models to choose defaults");
    }

    bool changed = false;
    label_row("Model:");
    changed |= combo_string("##model", config.model, refs, 320, "(OpenCode default)");
    label_row("Small model:");
    changed |= combo_string("##smallmodel", config.small_model, refs, 320, "(OpenCode default)");
    if (ImGui::IsItemHovered()) {
        ImGui::SetTooltip("Used for titles and other lightweight tasks");
    }

    if (changed) {
        if (store_->save_opencode()) {
            status_.set("Saved default models");
            ui_log(spdlog::level::info, "Default model {} / small model {}", config.model, config.small_model);
        } else {
            status_.error(store_->last_error());
        }
    }

    ImGui::Unindent();
}

}
