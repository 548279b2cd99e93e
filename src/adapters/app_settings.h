#pragma once

#include <filesystem>
#include <string>

namespace occm {

struct AppSettings {
    std::string theme_mode = "system";  // system | dark | light
    bool check_updates = true;
    int backup_keep_count = 10;
    std::string log_level = "info";
};

class AppSettingsStore {
public:
    explicit AppSettingsStore(std::filesystem::path settings_path);

    // Defaults when the file is missing or malformed.
    AppSettings load() const;
    bool save(const AppSettings& settings, std::string& error_out) const;

    const std::filesystem::path& path() const { return settings_path_; }

private:
    std::filesystem::path settings_path_;
};

}
