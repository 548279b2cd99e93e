#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace occm {

struct AuthRecord {
    std::string type = "api";
    std::string key;
};

// Credentials file of native providers: {"<provider>": {"type": "api", "key": "..."}}
class AuthManager {
public:
    explicit AuthManager(std::filesystem::path auth_path);

    const std::filesystem::path& path() const { return auth_path_; }

    // Empty object when the file is missing or malformed.
    nlohmann::json read() const;
    bool write(const nlohmann::json& data, std::string& error_out) const;

    // Legacy {"apiKey": "..."} entries are returned as type "api".
    std::optional<AuthRecord> get(const std::string& provider_id) const;
    bool set(const std::string& provider_id, const std::string& key, std::string& error_out,
             const std::string& type = "api") const;
    bool remove(const std::string& provider_id, std::string& error_out) const;

    std::vector<std::string> providers() const;

private:
    std::filesystem::path auth_path_;
};

// "sk-abcdefgh1234" -> "sk-a****1234"; shorter than 8 characters -> "****".
std::string mask_api_key(const std::string& key);

}
