#include "ui/import_panel.h"
#include "core/logging.h"
#include "ui/theme.h"
#include <imgui.h>

namespace occm {

void ImportPanel::set_config_store(ConfigStore* store) {
    store_ = store;
    scanned_ = false;
}

void ImportPanel::render(bool* open) {
    ImGui::SetNextWindowSizeConstraints(ImVec2(320, 200), ImVec2(FLT_MAX, FLT_MAX));
    if (!ImGui::Begin("Import", open)) {
        ImGui::End();
        return;
    }
    render_content();
    ImGui::End();
}

void ImportPanel::scan() {
    sources_ = ImportService(store_->paths()).scan();
    scanned_ = true;

    int found = 0;
    for (const auto& source : sources_) {
        if (source.data) ++found;
    }
    ui_log(spdlog::level::info, "Import scan: {} of {} sources readable", found, sources_.size());
}

void ImportPanel::render_content() {
    if (!store_) {
        ImGui::TextColored(ImVec4(1, 0.4f, 0.4f, 1), "ConfigStore not initialized");
        return;
    }
    if (!scanned_) scan();

    if (ImGui::Button("Rescan")) {
        scan();
        status_.set("Scanned " + std::to_string(sources_.size()) + " locations");
    }
    ImGui::SameLine();
    ImGui::Checkbox("Overwrite existing providers", &overwrite_);
    status_.render();
    ImGui::Separator();

    for (int i = 0; i < static_cast<int>(sources_.size()); ++i) {
        render_source(i);
    }

    render_result_popup();
}

void ImportPanel::render_source(int index) {
    const auto& source = sources_[index];
    const auto& theme = get_current_theme();
    ImGui::PushID(index);

    ImVec4 color = source.data ? ImGui::ColorConvertU32ToFloat4(theme.success)
                 : !source.error.empty() ? ImGui::ColorConvertU32ToFloat4(theme.error)
                 : ImGui::ColorConvertU32ToFloat4(theme.foreground_dim);
    ImGui::TextColored(color, "%s", source.label.c_str());
    ImGui::SameLine();
    ImGui::TextDisabled("%s", source.path.string().c_str());

    if (!source.exists) {
        ImGui::TextDisabled("  not found");
    } else if (!source.data) {
        ImGui::TextColored(ImGui::ColorConvertU32ToFloat4(theme.error), "  %s", source.error.c_str());
    } else {
        const auto converted = ImportService::convert(source.type, *source.data);
        const auto& providers = converted["provider"];
        const auto& permissions = converted["permission"];

        if (ImGui::TreeNode("preview", "%zu providers, %zu permissions", providers.size(), permissions.size())) {
            for (auto& [id, provider] : providers.items()) {
                bool exists = store_->opencode().providers.count(id) > 0;
                ImGui::BulletText("%s  %s%s", id.c_str(),
                                  provider.value("npm", std::string()).c_str(),
                                  exists ? "  (exists)" : "");
            }
            for (auto& [tool, level] : permissions.items()) {
                ImGui::BulletText("permission %s = %s", tool.c_str(), level.dump().c_str());
            }
            ImGui::TreePop();
        }

        ImGui::BeginDisabled(providers.empty() && permissions.empty());
        if (ImGui::Button("Import")) {
            import_source(index);
        }
        ImGui::EndDisabled();
    }

    ImGui::Separator();
    ImGui::PopID();
}

void ImportPanel::import_source(int index) {
    const auto& source = sources_[index];
    if (!source.data) return;

    const auto converted = ImportService::convert(source.type, *source.data);
    last_result_ = ImportService::merge(store_->opencode(), converted, overwrite_);
    last_source_ = source.label;

    if (last_result_.added.empty() && last_result_.permissions == 0) {
        status_.set("Nothing new to import from " + source.label);
    } else if (!store_->save_opencode()) {
        status_.error(store_->last_error());
        return;
    } else {
        ui_log(spdlog::level::info, "Imported {} providers and {} permissions from {}",
               last_result_.added.size(), last_result_.permissions, source.label);
    }
    show_result_popup_ = true;
}

void ImportPanel::render_result_popup() {
    if (show_result_popup_) {
        ImGui::OpenPopup("Import Result");
        show_result_popup_ = false;
    }

    if (!ImGui::BeginPopupModal("Import Result", nullptr, ImGuiWindowFlags_AlwaysAutoResize)) return;

    const auto& theme = get_current_theme();
    ImGui::Text("From %s", last_source_.c_str());
    ImGui::Separator();
    for (const auto& id : last_result_.added) {
        ImGui::TextColored(ImGui::ColorConvertU32ToFloat4(theme.success), "+ %s", id.c_str());
    }
    for (const auto& id : last_result_.skipped) {
        ImGui::TextDisabled("= %s (already configured)", id.c_str());
    }
    if (last_result_.permissions > 0) {
        ImGui::Text("%d permissions added", last_result_.permissions);
    }
    if (last_result_.added.empty() && last_result_.skipped.empty() && last_result_.permissions == 0) {
        ImGui::TextDisabled("Nothing to import");
    }

    ImGui::Spacing();
    if (ImGui::Button("OK", ImVec2(120, 0))) {
        ImGui::CloseCurrentPopup();
    }
    ImGui::EndPopup();
}

}
