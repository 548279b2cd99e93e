#pragma once

#include "adapters/opencode_config.h"
#include "auth/native_providers.h"
#include <string>
#include <nlohmann/json.hpp>

namespace occm {

// Edits provider.<id>.options of native providers in an opencode.json document.
class ProviderOptionsManager {
public:
    explicit ProviderOptionsManager(OpenCodeConfig& config);

    bool is_configured(const std::string& provider_id) const;

    // Creates provider.<id> with the template's SDK and name if missing.
    ProviderConfig& ensure_provider(const std::string& provider_id);

    // Options as stored on disk, baseURL and apiKey included.
    nlohmann::json get_options(const std::string& provider_id) const;

    bool set_option(const std::string& provider_id, const std::string& key, const nlohmann::json& value);
    bool remove_option(const std::string& provider_id, const std::string& key);

    // Parses text entered for a template field into the JSON type it expects.
    static nlohmann::json parse_option_value(const OptionField& field, const std::string& text);

private:
    OpenCodeConfig& config_;
};

}
