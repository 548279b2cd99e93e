#include "app/app_shell.h"
#include "app/dockspace.h"
#include "core/logging.h"
#include "core/version.h"
#include "ui/theme.h"
#include <imgui.h>

namespace occm {

void AppShell::init(const ConfigPaths& paths, const AppSettings& settings) {
    settings_ = settings;
    settings_store_ = std::make_unique<AppSettingsStore>(paths.app_settings_file());

    config_store_ = std::make_unique<ConfigStore>(paths);
    config_store_->set_backup_keep_count(static_cast<size_t>(settings_.backup_keep_count));
    if (!config_store_->load()) {
        ui_log(spdlog::level::warn, "Config loaded with errors: {}", config_store_->last_error());
    }

    version_checker_ = std::make_unique<VersionChecker>(kAppVersion);

    overview_panel_ = std::make_unique<OverviewPanel>();
    provider_panel_ = std::make_unique<ProviderPanel>();
    mcp_panel_ = std::make_unique<McpPanel>();
    agent_panel_ = std::make_unique<AgentPanel>();
    permission_panel_ = std::make_unique<PermissionPanel>();
    skill_panel_ = std::make_unique<SkillPanel>();
    rules_panel_ = std::make_unique<RulesPanel>();
    ohmy_panel_ = std::make_unique<OhMyPanel>();
    config_panel_ = std::make_unique<ConfigPanel>();
    native_provider_panel_ = std::make_unique<NativeProviderPanel>();
    import_panel_ = std::make_unique<ImportPanel>();
    backup_panel_ = std::make_unique<BackupPanel>();
    validation_panel_ = std::make_unique<ValidationPanel>();

    ConfigStore* store = config_store_.get();
    overview_panel_->set_config_store(store);
    provider_panel_->set_config_store(store);
    mcp_panel_->set_config_store(store);
    agent_panel_->set_config_store(store);
    permission_panel_->set_config_store(store);
    skill_panel_->set_config_store(store);
    rules_panel_->set_config_store(store);
    ohmy_panel_->set_config_store(store);
    native_provider_panel_->set_config_store(store);
    import_panel_->set_config_store(store);
    backup_panel_->set_config_store(store);
    validation_panel_->set_config_store(store);

    config_panel_->set_provider_panel(provider_panel_.get());
    config_panel_->set_mcp_panel(mcp_panel_.get());
    config_panel_->set_agent_panel(agent_panel_.get());
    config_panel_->set_permission_panel(permission_panel_.get());
    config_panel_->set_skill_panel(skill_panel_.get());
    config_panel_->set_rules_panel(rules_panel_.get());
    config_panel_->set_ohmy_panel(ohmy_panel_.get());

    backup_panel_->set_on_restored([this]() {
        overview_panel_->set_status("Backup restored");
    });
    backup_panel_->set_on_keep_count_changed([this](int keep) {
        settings_.backup_keep_count = keep;
        save_settings();
    });

    if (settings_.check_updates) {
        version_checker_->check_async();
    }
}

void AppShell::save_settings() {
    std::string error;
    if (!settings_store_->save(settings_, error)) {
        ui_log(spdlog::level::err, "Could not save settings: {}", error);
    }
}

void AppShell::poll_update_check() {
    auto result = version_checker_->poll();
    if (!result) return;

    last_update_ = *result;
    if (result->success && result->update_available) {
        overview_panel_->set_update(result->release);
    }
    if (manual_update_check_) {
        show_update_popup_ = true;
        manual_update_check_ = false;
    }
}

void AppShell::render_update_popup() {
    if (show_update_popup_) {
        ImGui::OpenPopup("Check for Updates");
        show_update_popup_ = false;
    }

    if (!ImGui::BeginPopupModal("Check for Updates", nullptr, ImGuiWindowFlags_AlwaysAutoResize)) return;

    const auto& theme = get_current_theme();
    if (!last_update_.success) {
        ImGui::TextColored(ImGui::ColorConvertU32ToFloat4(theme.error), "Update check failed");
        ImGui::TextDisabled("%s", last_update_.error.c_str());
    } else if (last_update_.update_available) {
        ImGui::Text("Version %s is available (you have %s)", last_update_.release.version.c_str(), kAppVersion);
        if (ImGui::Button("Open Release Page")) {
            open_url(last_update_.release.url);
        }
    } else {
        ImGui::TextColored(ImGui::ColorConvertU32ToFloat4(theme.success), "OCCM %s is up to date", kAppVersion);
    }

    ImGui::Spacing();
    ImGui::Checkbox("Check on startup", &settings_.check_updates);
    if (ImGui::IsItemDeactivatedAfterEdit()) {
        save_settings();
    }

    if (ImGui::Button("Close", ImVec2(120, 0))) {
        ImGui::CloseCurrentPopup();
    }
    ImGui::EndPopup();
}

void AppShell::render() {
    poll_update_check();

    DockspacePanels panels{
        &show_overview_,
        &show_configuration_,
        &show_native_providers_,
        &show_import_,
        &show_backups_,
        &show_validation_
    };

    DockspaceContext context;
    context.store = config_store_.get();
    context.checking_updates = version_checker_->checking();
    context.on_theme_changed = [this](ThemeMode mode) {
        settings_.theme_mode = theme_mode_to_string(mode);
        save_settings();
    };
    context.on_check_updates = [this]() {
        manual_update_check_ = true;
        version_checker_->check_async();
    };
    context.on_status = [this](const std::string& message) {
        overview_panel_->set_status(message);
    };

    render_dockspace(first_frame_, panels, context);
    first_frame_ = false;

    if (show_overview_) {
        overview_panel_->render(&show_overview_);
    }
    if (show_configuration_) {
        config_panel_->render(&show_configuration_);
    }
    if (show_native_providers_) {
        native_provider_panel_->render(&show_native_providers_);
    }
    if (show_import_) {
        import_panel_->render(&show_import_);
    }
    if (show_backups_) {
        backup_panel_->render(&show_backups_);
    }
    if (show_validation_) {
        validation_panel_->render(&show_validation_);
    }

    render_update_popup();
}

void AppShell::shutdown() {
    // Joins a version check that is still in flight.
    version_checker_.reset();
    ui_log(spdlog::level::info, "Shutting down");
}

}
