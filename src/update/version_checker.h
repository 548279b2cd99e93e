#pragma once

#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace occm {

constexpr const char* kReleasesApiUrl =
    "https://api.github.com/repos/icysaintdx/OpenCode-Config-Manager/releases/latest";
constexpr const char* kReleasesPageUrl =
    "https://github.com/icysaintdx/OpenCode-Config-Manager/releases";

struct ReleaseInfo {
    std::string version;
    std::string url;
};

struct VersionCheckResult {
    bool success = false;
    bool update_available = false;
    ReleaseInfo release;
    std::string error;
};

// Asks GitHub for the latest release on a worker thread; the UI thread
// collects the outcome with poll().
class VersionChecker {
public:
    // Returns the response body, or an empty string with error_out set.
    using Fetcher = std::function<std::string(const std::string& url, std::string& error_out)>;

    explicit VersionChecker(std::string current_version);
    VersionChecker(std::string current_version, Fetcher fetcher);
    ~VersionChecker();

    // No-op while a check is already running.
    void check_async();
    bool checking() const;

    // The finished check, once; nullopt while running or idle.
    std::optional<VersionCheckResult> poll();

    const std::string& current_version() const { return current_version_; }

    // True if latest is newer. False when either side does not parse.
    static bool compare_versions(const std::string& current, const std::string& latest);
    static std::optional<ReleaseInfo> parse_release(const nlohmann::json& release);
    static std::string http_get(const std::string& url, std::string& error_out);

private:
    VersionCheckResult run_check();

    std::string current_version_;
    Fetcher fetcher_;

    std::vector<std::future<void>> pending_tasks_;
    std::optional<VersionCheckResult> finished_;
    bool checking_ = false;
    mutable std::mutex mutex_;
};

}
