#include "core/config_paths.h"

#include <cstdlib>

namespace occm {

namespace fs = std::filesystem;

namespace {

fs::path env_path(const char* name) {
    const char* value = std::getenv(name);
    if (!value || value[0] == '\0') return {};
    return fs::path(value);
}

fs::path default_home() {
#if defined(_WIN32)
    fs::path home = env_path("USERPROFILE");
    if (!home.empty()) return home;
#endif
    return env_path("HOME");
}

fs::path default_project_dir() {
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    return ec ? fs::path() : cwd;
}

}

ConfigPaths::ConfigPaths()
    : home_(default_home())
    , project_dir_(default_project_dir())
    , data_home_(env_path("XDG_DATA_HOME"))
{
}

ConfigPaths::ConfigPaths(fs::path home, fs::path project_dir)
    : home_(std::move(home))
    , project_dir_(std::move(project_dir))
{
}

fs::path ConfigPaths::prefer_jsonc(const fs::path& dir, const std::string& base_name) {
    const fs::path jsonc_path = dir / (base_name + ".jsonc");
    const fs::path json_path = dir / (base_name + ".json");

    std::error_code ec;
    if (fs::exists(jsonc_path, ec)) return jsonc_path;
    return json_path;
}

fs::path ConfigPaths::opencode_dir() const {
    return home_ / ".config" / "opencode";
}

fs::path ConfigPaths::opencode_config() const {
    return prefer_jsonc(opencode_dir(), "opencode");
}

fs::path ConfigPaths::ohmyopencode_config() const {
    return prefer_jsonc(opencode_dir(), "oh-my-opencode");
}

fs::path ConfigPaths::backup_dir() const {
    return opencode_dir() / "backups";
}

fs::path ConfigPaths::auth_file() const {
    const fs::path data_home = data_home_.empty() ? home_ / ".local" / "share" : data_home_;
    return data_home / "opencode" / "auth.json";
}

fs::path ConfigPaths::claude_settings() const {
    return prefer_jsonc(home_ / ".claude", "settings");
}

fs::path ConfigPaths::claude_providers() const {
    return prefer_jsonc(home_ / ".claude", "providers");
}

fs::path ConfigPaths::codex_config() const {
    return home_ / ".codex" / "config.toml";
}

fs::path ConfigPaths::gemini_config() const {
    return home_ / ".config" / "gemini" / "config.json";
}

fs::path ConfigPaths::ccswitch_config() const {
    return home_ / ".cc-switch" / "config.json";
}

fs::path ConfigPaths::global_skill_dir() const {
    return opencode_dir() / "skill";
}

fs::path ConfigPaths::project_skill_dir() const {
    return project_dir_ / ".opencode" / "skill";
}

fs::path ConfigPaths::claude_global_skill_dir() const {
    return home_ / ".claude" / "skills";
}

fs::path ConfigPaths::claude_project_skill_dir() const {
    return project_dir_ / ".claude" / "skills";
}

fs::path ConfigPaths::global_agents_md() const {
    return opencode_dir() / "AGENTS.md";
}

fs::path ConfigPaths::project_agents_md() const {
    return project_dir_ / "AGENTS.md";
}

fs::path ConfigPaths::app_dir() const {
    return home_ / ".config" / "occm";
}

fs::path ConfigPaths::app_settings_file() const {
    return app_dir() / "settings.json";
}

fs::path ConfigPaths::log_dir() const {
    return app_dir() / "logs";
}

}
