#include "adapters/backup_manager.h"
#include "core/logging.h"
#include "core/string_utils.h"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace occm {

namespace fs = std::filesystem;

namespace {

constexpr const char* kBackupExtension = ".bak";

std::string current_timestamp() {
    auto now = std::time(nullptr);
    std::tm local{};
#if defined(_WIN32)
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y%m%d_%H%M%S");
    return oss.str();
}

// "20250101_120000_3" -> ("20250101_120000", 3)
std::pair<std::string, int> split_timestamp(const std::string& timestamp) {
    const size_t first = timestamp.find('_');
    const size_t second = first == std::string::npos ? std::string::npos : timestamp.find('_', first + 1);
    if (second == std::string::npos) {
        return {timestamp, 0};
    }
    int counter = 0;
    for (char c : timestamp.substr(second + 1)) {
        if (c < '0' || c > '9') return {timestamp, 0};
        counter = counter * 10 + (c - '0');
    }
    return {timestamp.substr(0, second), counter};
}

bool newer_first(const BackupInfo& a, const BackupInfo& b) {
    return split_timestamp(a.timestamp) > split_timestamp(b.timestamp);
}

}

BackupManager::BackupManager(fs::path backup_dir)
    : backup_dir_(std::move(backup_dir))
{
}

std::optional<BackupInfo> BackupManager::parse_backup_name(const fs::path& path) {
    std::string filename = path.filename().string();
    const std::string ext = kBackupExtension;
    if (filename.size() <= ext.size() || filename.compare(filename.size() - ext.size(), ext.size(), ext) != 0) {
        return std::nullopt;
    }
    filename.resize(filename.size() - ext.size());

    auto parts = split(filename, '.');
    if (parts.size() < 3) {
        return std::nullopt;
    }

    BackupInfo info;
    info.path = path;
    info.tag = parts.back();
    info.timestamp = parts[parts.size() - 2];
    for (size_t i = 0; i + 2 < parts.size(); ++i) {
        if (i > 0) info.name += ".";
        info.name += parts[i];
    }
    if (info.name.empty() || info.timestamp.empty()) {
        return std::nullopt;
    }
    return info;
}

std::optional<fs::path> BackupManager::backup(const fs::path& source, const std::string& tag) {
    std::error_code ec;
    if (!fs::exists(source, ec) || !fs::is_regular_file(source, ec)) {
        return std::nullopt;
    }

    fs::create_directories(backup_dir_, ec);
    if (ec) {
        core_log(spdlog::level::err, "Cannot create backup directory {}: {}", backup_dir_.string(), ec.message());
        return std::nullopt;
    }

    const std::string stem = source.stem().string();
    const std::string base_stamp = current_timestamp();
    std::string stamp = base_stamp;
    fs::path target = backup_dir_ / (stem + "." + stamp + "." + tag + kBackupExtension);
    for (int counter = 1; fs::exists(target, ec); ++counter) {
        stamp = base_stamp + "_" + std::to_string(counter);
        target = backup_dir_ / (stem + "." + stamp + "." + tag + kBackupExtension);
    }

    fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        core_log(spdlog::level::err, "Backup of {} failed: {}", source.string(), ec.message());
        return std::nullopt;
    }

    core_log(spdlog::level::info, "Backed up {} to {}", source.string(), target.string());
    return target;
}

std::vector<BackupInfo> BackupManager::list_backups(const std::string& name) const {
    std::vector<BackupInfo> backups;
    std::error_code ec;
    if (!fs::is_directory(backup_dir_, ec)) {
        return backups;
    }

    for (const auto& entry : fs::directory_iterator(backup_dir_, ec)) {
        if (!entry.is_regular_file(ec)) continue;
        auto info = parse_backup_name(entry.path());
        if (!info) continue;
        if (!name.empty() && info->name != name) continue;
        info->size = entry.file_size(ec);
        backups.push_back(*info);
    }

    std::sort(backups.begin(), backups.end(), newer_first);
    return backups;
}

bool BackupManager::restore(const fs::path& backup_path, const fs::path& target, std::string& error_out) {
    std::error_code ec;
    if (!fs::exists(backup_path, ec)) {
        error_out = "Backup not found: " + backup_path.string();
        return false;
    }

    backup(target, "before_restore");

    fs::create_directories(target.parent_path(), ec);
    ec.clear();
    fs::copy_file(backup_path, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        error_out = "Restore failed: " + ec.message();
        core_log(spdlog::level::err, "Restore of {} to {} failed: {}", backup_path.string(), target.string(), ec.message());
        return false;
    }

    core_log(spdlog::level::info, "Restored {} from {}", target.string(), backup_path.string());
    return true;
}

bool BackupManager::delete_backup(const fs::path& backup_path) {
    std::error_code ec;
    bool removed = fs::remove(backup_path, ec);
    if (ec) {
        core_log(spdlog::level::warn, "Cannot delete backup {}: {}", backup_path.string(), ec.message());
        return false;
    }
    return removed;
}

int BackupManager::cleanup(const std::string& name, size_t keep, const std::string& tag) {
    auto backups = list_backups(name);
    if (!tag.empty()) {
        backups.erase(std::remove_if(backups.begin(), backups.end(),
                                     [&](const BackupInfo& b) { return b.tag != tag; }),
                      backups.end());
    }

    int deleted = 0;
    for (size_t i = keep; i < backups.size(); ++i) {
        if (delete_backup(backups[i].path)) ++deleted;
    }
    return deleted;
}

}
