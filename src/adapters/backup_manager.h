#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace occm {

struct BackupInfo {
    std::filesystem::path path;
    std::string name;       // stem of the backed up file, e.g. "opencode"
    std::string timestamp;  // YYYYmmdd_HHMMSS, with _N appended on collisions
    std::string tag;
    uintmax_t size = 0;
};

// Timestamped copies <backup_dir>/<stem>.<timestamp>.<tag>.bak
class BackupManager {
public:
    explicit BackupManager(std::filesystem::path backup_dir);

    const std::filesystem::path& backup_dir() const { return backup_dir_; }

    // nullopt if the source does not exist or the copy fails.
    std::optional<std::filesystem::path> backup(const std::filesystem::path& source,
                                                const std::string& tag = "auto");

    // Newest first. An empty name lists every backup.
    std::vector<BackupInfo> list_backups(const std::string& name = "") const;

    bool restore(const std::filesystem::path& backup_path, const std::filesystem::path& target,
                 std::string& error_out);
    bool delete_backup(const std::filesystem::path& backup_path);

    // Deletes the oldest backups of name beyond keep. An empty tag matches all tags.
    int cleanup(const std::string& name, size_t keep, const std::string& tag = "");

    static std::optional<BackupInfo> parse_backup_name(const std::filesystem::path& path);

private:
    std::filesystem::path backup_dir_;
};

}
