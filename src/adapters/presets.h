#pragma once

#include "adapters/opencode_config.h"
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace occm {

struct ModelPreset {
    std::string id;
    std::string description;
    ModelConfig config;
};

struct ModelSeriesPreset {
    std::string name;
    std::string sdk;
    std::vector<ModelPreset> models;
};

struct OpenCodeAgentPreset {
    std::string name;
    std::string mode;
    std::string description;
    std::map<std::string, bool> tools;
    nlohmann::json permission;
};

struct OhMyAgentPreset {
    std::string name;
    std::string description;
};

struct CategoryPreset {
    std::string name;
    double temperature = 0.7;
    std::string description;
};

const std::vector<ModelSeriesPreset>& model_series_presets();
const ModelSeriesPreset* find_model_series(const std::string& name);
const ModelPreset* find_model_preset(const std::string& series, const std::string& model_id);

const std::vector<std::string>& sdk_presets();

const std::vector<OpenCodeAgentPreset>& opencode_agent_presets();
const OpenCodeAgentPreset* find_opencode_agent_preset(const std::string& name);

const std::vector<OhMyAgentPreset>& ohmy_agent_presets();
const OhMyAgentPreset* find_ohmy_agent_preset(const std::string& name);

const std::vector<CategoryPreset>& category_presets();
const CategoryPreset* find_category_preset(const std::string& name);

// Tool names offered as one-click "allow" permissions.
const std::vector<std::string>& common_permission_tools();

}
