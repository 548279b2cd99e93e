#include "adapters/app_settings.h"
#include "core/json_file.h"
#include "core/logging.h"

#include <algorithm>
#include <nlohmann/json.hpp>

namespace occm {

AppSettingsStore::AppSettingsStore(std::filesystem::path settings_path)
    : settings_path_(std::move(settings_path))
{
}

AppSettings AppSettingsStore::load() const {
    AppSettings settings;
    if (settings_path_.empty()) return settings;

    std::string error;
    auto j = read_json_file(settings_path_, error);
    if (!j || !j->is_object()) {
        if (!error.empty()) {
            core_log(spdlog::level::warn, "Ignoring settings file {}: {}", settings_path_.string(), error);
        }
        return settings;
    }

    if (j->contains("theme_mode") && (*j)["theme_mode"].is_string()) {
        std::string mode = (*j)["theme_mode"].get<std::string>();
        if (mode == "system" || mode == "dark" || mode == "light") {
            settings.theme_mode = mode;
        }
    }
    if (j->contains("check_updates") && (*j)["check_updates"].is_boolean()) {
        settings.check_updates = (*j)["check_updates"].get<bool>();
    }
    if (j->contains("backup_keep_count") && (*j)["backup_keep_count"].is_number_integer()) {
        settings.backup_keep_count = std::clamp((*j)["backup_keep_count"].get<int>(), 1, 100);
    }
    if (j->contains("log_level") && (*j)["log_level"].is_string()) {
        settings.log_level = (*j)["log_level"].get<std::string>();
    }

    return settings;
}

bool AppSettingsStore::save(const AppSettings& settings, std::string& error_out) const {
    if (settings_path_.empty()) {
        error_out = "No settings path";
        return false;
    }

    nlohmann::json j = nlohmann::json::object();
    j["theme_mode"] = settings.theme_mode;
    j["check_updates"] = settings.check_updates;
    j["backup_keep_count"] = settings.backup_keep_count;
    j["log_level"] = settings.log_level;

    return write_json_file(settings_path_, j, error_out);
}

}
