#include "auth/auth_manager.h"
#include "core/json_file.h"
#include "core/logging.h"
#include "core/string_utils.h"

namespace occm {

AuthManager::AuthManager(std::filesystem::path auth_path)
    : auth_path_(std::move(auth_path))
{
}

nlohmann::json AuthManager::read() const {
    std::string error;
    auto j = read_json_file(auth_path_, error);
    if (!j || !j->is_object()) {
        if (!error.empty()) {
            core_log(spdlog::level::warn, "Ignoring unreadable auth file {}: {}", auth_path_.string(), error);
        }
        return nlohmann::json::object();
    }
    return *j;
}

bool AuthManager::write(const nlohmann::json& data, std::string& error_out) const {
    return write_json_file(auth_path_, data, error_out, true);
}

std::optional<AuthRecord> AuthManager::get(const std::string& provider_id) const {
    const std::string id = trim(provider_id);
    auto data = read();
    if (!data.contains(id) || !data[id].is_object()) {
        return std::nullopt;
    }

    const auto& entry = data[id];
    AuthRecord record;
    if (entry.contains("type") && entry["type"].is_string()) {
        record.type = entry["type"].get<std::string>();
    }
    if (entry.contains("key") && entry["key"].is_string()) {
        record.key = entry["key"].get<std::string>();
    } else if (entry.contains("apiKey") && entry["apiKey"].is_string()) {
        record.key = entry["apiKey"].get<std::string>();
    }
    return record;
}

bool AuthManager::set(const std::string& provider_id, const std::string& key, std::string& error_out,
                      const std::string& type) const {
    const std::string id = trim(provider_id);
    if (id.empty()) {
        error_out = "Provider ID is required";
        return false;
    }

    auto data = read();
    data[id] = {{"type", type}, {"key", trim(key)}};
    if (!write(data, error_out)) {
        return false;
    }
    core_log(spdlog::level::info, "Stored credentials for {} ({})", id, mask_api_key(trim(key)));
    return true;
}

bool AuthManager::remove(const std::string& provider_id, std::string& error_out) const {
    const std::string id = trim(provider_id);
    auto data = read();
    if (!data.contains(id)) {
        error_out = "No credentials for " + id;
        return false;
    }
    data.erase(id);
    return write(data, error_out);
}

std::vector<std::string> AuthManager::providers() const {
    std::vector<std::string> ids;
    const auto data = read();
    for (auto& [key, value] : data.items()) {
        ids.push_back(key);
    }
    return ids;
}

std::string mask_api_key(const std::string& key) {
    if (key.empty()) return {};
    if (key.size() < 8) return "****";
    return key.substr(0, 4) + "****" + key.substr(key.size() - 4);
}

}
