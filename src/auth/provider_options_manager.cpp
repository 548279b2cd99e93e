#include "auth/provider_options_manager.h"
#include "core/string_utils.h"

#include <cstdlib>

namespace occm {

ProviderOptionsManager::ProviderOptionsManager(OpenCodeConfig& config)
    : config_(config)
{
}

bool ProviderOptionsManager::is_configured(const std::string& provider_id) const {
    return config_.providers.count(provider_id) > 0;
}

ProviderConfig& ProviderOptionsManager::ensure_provider(const std::string& provider_id) {
    auto it = config_.providers.find(provider_id);
    if (it != config_.providers.end()) {
        return it->second;
    }

    ProviderConfig provider;
    if (const auto* native = find_native_provider(provider_id)) {
        provider.npm = native->sdk;
        provider.name = native->name;
    }
    return config_.providers[provider_id] = provider;
}

nlohmann::json ProviderOptionsManager::get_options(const std::string& provider_id) const {
    auto it = config_.providers.find(provider_id);
    if (it == config_.providers.end()) {
        return nlohmann::json::object();
    }

    const auto& provider = it->second;
    nlohmann::json options = provider.options.is_object() ? provider.options : nlohmann::json::object();
    if (!provider.base_url.empty()) options["baseURL"] = provider.base_url;
    if (!provider.api_key.empty()) options["apiKey"] = provider.api_key;
    return options;
}

bool ProviderOptionsManager::set_option(const std::string& provider_id, const std::string& key,
                                        const nlohmann::json& value) {
    if (trim(provider_id).empty() || trim(key).empty()) return false;

    auto& provider = ensure_provider(provider_id);
    if (key == "baseURL" || key == "apiKey") {
        if (!value.is_string()) return false;
        (key == "baseURL" ? provider.base_url : provider.api_key) = trim(value.get<std::string>());
        return true;
    }

    if (!provider.options.is_object()) provider.options = nlohmann::json::object();
    provider.options[key] = value;
    return true;
}

bool ProviderOptionsManager::remove_option(const std::string& provider_id, const std::string& key) {
    auto it = config_.providers.find(provider_id);
    if (it == config_.providers.end()) return false;

    auto& provider = it->second;
    if (key == "baseURL") {
        bool had = !provider.base_url.empty();
        provider.base_url.clear();
        return had;
    }
    if (key == "apiKey") {
        bool had = !provider.api_key.empty();
        provider.api_key.clear();
        return had;
    }
    if (!provider.options.is_object() || !provider.options.contains(key)) return false;
    provider.options.erase(key);
    return true;
}

nlohmann::json ProviderOptionsManager::parse_option_value(const OptionField& field, const std::string& text) {
    const std::string value = trim(text);
    switch (field.kind) {
        case OptionKind::Number: {
            char* end = nullptr;
            long long number = std::strtoll(value.c_str(), &end, 10);
            if (value.empty() || (end && *end != '\0')) return value;
            return number;
        }
        case OptionKind::Bool:
            return to_lower(value) == "true" || value == "1";
        case OptionKind::Text:
            break;
    }
    return value;
}

}
