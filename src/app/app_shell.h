#pragma once

#include "adapters/app_settings.h"
#include "adapters/config_store.h"
#include "ui/backup_panel.h"
#include "ui/config_panel.h"
#include "ui/import_panel.h"
#include "ui/native_provider_panel.h"
#include "ui/overview_panel.h"
#include "ui/validation_panel.h"
#include "update/version_checker.h"
#include <memory>

namespace occm {

class AppShell {
public:
    void init(const ConfigPaths& paths, const AppSettings& settings);
    void render();
    void shutdown();

    ConfigStore& config_store() { return *config_store_; }

private:
    void poll_update_check();
    void render_update_popup();
    void save_settings();

    bool first_frame_ = true;

    bool show_overview_ = true;
    bool show_configuration_ = true;
    bool show_native_providers_ = true;
    bool show_import_ = false;
    bool show_backups_ = true;
    bool show_validation_ = true;

    AppSettings settings_;
    std::unique_ptr<AppSettingsStore> settings_store_;
    std::unique_ptr<ConfigStore> config_store_;
    std::unique_ptr<VersionChecker> version_checker_;

    std::unique_ptr<OverviewPanel> overview_panel_;
    std::unique_ptr<ProviderPanel> provider_panel_;
    std::unique_ptr<McpPanel> mcp_panel_;
    std::unique_ptr<AgentPanel> agent_panel_;
    std::unique_ptr<PermissionPanel> permission_panel_;
    std::unique_ptr<SkillPanel> skill_panel_;
    std::unique_ptr<RulesPanel> rules_panel_;
    std::unique_ptr<OhMyPanel> ohmy_panel_;
    std::unique_ptr<ConfigPanel> config_panel_;
    std::unique_ptr<NativeProviderPanel> native_provider_panel_;
    std::unique_ptr<ImportPanel> import_panel_;
    std::unique_ptr<BackupPanel> backup_panel_;
    std::unique_ptr<ValidationPanel> validation_panel_;

    bool manual_update_check_ = false;
    bool show_update_popup_ = false;
    VersionCheckResult last_update_;
};

}
