#pragma once

#include <filesystem>
#include <string>

namespace occm {

class ConfigPaths {
public:
    // Home from $HOME (%USERPROFILE% on Windows), data home from
    // $XDG_DATA_HOME, project directory from the current working directory.
    ConfigPaths();
    ConfigPaths(std::filesystem::path home, std::filesystem::path project_dir);

    const std::filesystem::path& home() const { return home_; }
    const std::filesystem::path& project_dir() const { return project_dir_; }
    void set_data_home(std::filesystem::path data_home) { data_home_ = std::move(data_home); }

    std::filesystem::path opencode_dir() const;
    std::filesystem::path opencode_config() const;
    std::filesystem::path ohmyopencode_config() const;
    std::filesystem::path backup_dir() const;
    std::filesystem::path auth_file() const;

    std::filesystem::path claude_settings() const;
    std::filesystem::path claude_providers() const;
    std::filesystem::path codex_config() const;
    std::filesystem::path gemini_config() const;
    std::filesystem::path ccswitch_config() const;

    std::filesystem::path global_skill_dir() const;
    std::filesystem::path project_skill_dir() const;
    std::filesystem::path claude_global_skill_dir() const;
    std::filesystem::path claude_project_skill_dir() const;

    std::filesystem::path global_agents_md() const;
    std::filesystem::path project_agents_md() const;

    std::filesystem::path app_dir() const;
    std::filesystem::path app_settings_file() const;
    std::filesystem::path log_dir() const;

    // <dir>/<base>.jsonc if it exists, else <dir>/<base>.json.
    static std::filesystem::path prefer_jsonc(const std::filesystem::path& dir, const std::string& base_name);

private:
    std::filesystem::path home_;
    std::filesystem::path project_dir_;
    std::filesystem::path data_home_;
};

}
