#pragma once

#include "adapters/backup_manager.h"
#include "adapters/ohmyopencode_config.h"
#include "adapters/opencode_config.h"
#include "core/config_paths.h"
#include <filesystem>
#include <optional>
#include <string>

namespace occm {

struct ConfigStats {
    size_t providers = 0;
    size_t models = 0;
    size_t mcp_servers = 0;
    size_t agents = 0;
    size_t ohmy_agents = 0;
    size_t categories = 0;
};

// Owns the in-memory opencode.json and oh-my-opencode.json documents.
class ConfigStore {
public:
    explicit ConfigStore(ConfigPaths paths);

    // Missing files load as empty documents. A malformed file loads as an
    // empty document and sets last_error(); false in that case.
    bool load();
    bool reload() { return load(); }

    // Backs up the file on disk (tag "auto"), prunes old auto backups, writes.
    bool save_opencode();
    bool save_ohmyopencode();

    // Manual backup of both files; returns the number of files copied.
    int backup_all(const std::string& tag = "manual");

    // Replaces both documents and saves them.
    // Replaces and saves only the documents given; a nullopt side is left alone.
    bool replace_documents(const std::optional<nlohmann::json>& opencode,
                           const std::optional<nlohmann::json>& ohmyopencode);

    ConfigStats stats() const;

    OpenCodeConfig& opencode() { return opencode_; }
    const OpenCodeConfig& opencode() const { return opencode_; }
    OhMyOpenCodeConfig& ohmyopencode() { return ohmyopencode_; }
    const OhMyOpenCodeConfig& ohmyopencode() const { return ohmyopencode_; }

    const ConfigPaths& paths() const { return paths_; }
    BackupManager& backups() { return backups_; }

    const std::filesystem::path& opencode_path() const { return opencode_path_; }
    const std::filesystem::path& ohmyopencode_path() const { return ohmyopencode_path_; }

    const std::string& last_error() const { return last_error_; }

    void set_backup_keep_count(size_t keep) { keep_count_ = keep; }
    size_t backup_keep_count() const { return keep_count_; }

private:
    bool save_document(const std::filesystem::path& path, const nlohmann::json& j);

    ConfigPaths paths_;
    BackupManager backups_;
    OpenCodeConfig opencode_;
    OhMyOpenCodeConfig ohmyopencode_;
    std::filesystem::path opencode_path_;
    std::filesystem::path ohmyopencode_path_;
    std::string last_error_;
    size_t keep_count_ = 10;
};

}
