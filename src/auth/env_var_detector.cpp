#include "auth/env_var_detector.h"
#include "auth/auth_manager.h"
#include "auth/native_providers.h"

#include <cstdlib>

namespace occm {

namespace {

std::optional<std::string> process_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value || value[0] == '\0') return std::nullopt;
    return std::string(value);
}

}

EnvVarDetector::EnvVarDetector()
    : lookup_(process_env)
{
}

EnvVarDetector::EnvVarDetector(Lookup lookup)
    : lookup_(std::move(lookup))
{
}

std::vector<DetectedEnvVar> EnvVarDetector::detect(const std::string& provider_id) const {
    std::vector<DetectedEnvVar> found;
    const auto* provider = find_native_provider(provider_id);
    if (!provider) return found;

    for (const auto& name : provider->env_vars) {
        auto value = lookup_(name);
        if (!value || value->empty()) continue;
        found.push_back({provider->id, name, mask_api_key(*value)});
    }
    return found;
}

std::vector<DetectedEnvVar> EnvVarDetector::detect_all() const {
    std::vector<DetectedEnvVar> found;
    for (const auto& provider : native_providers()) {
        auto detected = detect(provider.id);
        found.insert(found.end(), detected.begin(), detected.end());
    }
    return found;
}

std::optional<std::string> EnvVarDetector::value_for(const std::string& provider_id) const {
    const auto* provider = find_native_provider(provider_id);
    if (!provider) return std::nullopt;

    for (const auto& name : provider->env_vars) {
        auto value = lookup_(name);
        if (value && !value->empty()) return value;
    }
    return std::nullopt;
}

}
