#include "update/version_checker.h"
#include "core/logging.h"
#include "core/string_utils.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <curl/curl.h>
#include <regex>

namespace occm {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

std::optional<std::vector<int>> parse_version(const std::string& version) {
    std::vector<int> parts;
    for (const auto& part : split(trim(version), '.')) {
        if (part.empty() || part.size() > 9 ||
            !std::all_of(part.begin(), part.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return std::nullopt;
        }
        parts.push_back(std::stoi(part));
    }
    return parts;
}

}

VersionChecker::VersionChecker(std::string current_version)
    : VersionChecker(std::move(current_version), &VersionChecker::http_get)
{
}

VersionChecker::VersionChecker(std::string current_version, Fetcher fetcher)
    : current_version_(std::move(current_version))
    , fetcher_(std::move(fetcher))
{
}

VersionChecker::~VersionChecker() {
    std::vector<std::future<void>> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks.swap(pending_tasks_);
    }
    for (auto& task : tasks) {
        if (task.valid()) task.wait();
    }
}

std::string VersionChecker::http_get(const std::string& url, std::string& error_out) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        error_out = "Failed to initialize curl";
        return {};
    }

    std::string response;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "User-Agent: OpenCode-Config-Manager");
    headers = curl_slist_append(headers, "Accept: application/vnd.github+json");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

    CURLcode res = curl_easy_perform(curl);
    long http_code = 0;
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        error_out = std::string("Network error: ") + curl_easy_strerror(res);
        return {};
    }
    if (http_code != 200) {
        error_out = "HTTP " + std::to_string(http_code);
        return {};
    }
    return response;
}

bool VersionChecker::compare_versions(const std::string& current, const std::string& latest) {
    auto current_parts = parse_version(current);
    auto latest_parts = parse_version(latest);
    if (!current_parts || !latest_parts) return false;
    return *latest_parts > *current_parts;
}

std::optional<ReleaseInfo> VersionChecker::parse_release(const nlohmann::json& release) {
    if (!release.is_object() || !release.contains("tag_name") || !release["tag_name"].is_string()) {
        return std::nullopt;
    }

    static const std::regex version_pattern(R"(v?(\d+\.\d+\.\d+))");
    const std::string tag = release["tag_name"].get<std::string>();
    std::smatch match;
    if (!std::regex_search(tag, match, version_pattern)) {
        return std::nullopt;
    }

    ReleaseInfo info;
    info.version = match[1].str();
    info.url = release.contains("html_url") && release["html_url"].is_string()
        ? release["html_url"].get<std::string>()
        : std::string(kReleasesPageUrl);
    return info;
}

VersionCheckResult VersionChecker::run_check() {
    VersionCheckResult result;
    std::string error;
    std::string body = fetcher_(kReleasesApiUrl, error);
    if (!error.empty()) {
        result.error = error;
        return result;
    }

    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded()) {
        result.error = "Invalid response from GitHub";
        return result;
    }

    auto release = parse_release(j);
    if (!release) {
        result.error = "No version in latest release";
        return result;
    }

    result.success = true;
    result.release = *release;
    result.update_available = compare_versions(current_version_, release->version);
    return result;
}

void VersionChecker::check_async() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (checking_) return;
    checking_ = true;
    finished_.reset();

    auto future = std::async(std::launch::async, [this]() {
        VersionCheckResult result = run_check();
        if (result.success) {
            core_log(spdlog::level::info, "Latest release {} (current {})", result.release.version, current_version_);
        } else {
            core_log(spdlog::level::warn, "Version check failed: {}", result.error);
        }

        std::lock_guard<std::mutex> done_lock(mutex_);
        finished_ = result;
        checking_ = false;
    });

    pending_tasks_.push_back(std::move(future));
}

bool VersionChecker::checking() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return checking_;
}

std::optional<VersionCheckResult> VersionChecker::poll() {
    std::lock_guard<std::mutex> lock(mutex_);

    pending_tasks_.erase(
        std::remove_if(pending_tasks_.begin(), pending_tasks_.end(),
            [](std::future<void>& task) {
                if (task.valid()) {
                    return task.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready;
                }
                return true;
            }),
        pending_tasks_.end()
    );

    std::optional<VersionCheckResult> result;
    result.swap(finished_);
    return result;
}

}
