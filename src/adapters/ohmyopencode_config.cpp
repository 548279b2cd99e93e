#include "adapters/ohmyopencode_config.h"
#include "adapters/presets.h"
#include "core/string_utils.h"

#include <cmath>

namespace occm {

double round_temperature(double value) {
    return std::round(value * 10.0) / 10.0;
}

void to_json(nlohmann::json& j, const OhMyAgent& a) {
    j = a.extra.is_object() ? a.extra : nlohmann::json::object();
    j["model"] = a.model;
    if (!a.description.empty()) j["description"] = a.description;
}

void from_json(const nlohmann::json& j, OhMyAgent& a) {
    if (!j.is_object()) return;
    if (j.contains("model") && j["model"].is_string()) {
        a.model = j["model"].get<std::string>();
    }
    if (j.contains("description") && j["description"].is_string()) {
        a.description = j["description"].get<std::string>();
    }
    a.extra = j;
    a.extra.erase("model");
    a.extra.erase("description");
}

void to_json(nlohmann::json& j, const Category& c) {
    j = c.extra.is_object() ? c.extra : nlohmann::json::object();
    j["model"] = c.model;
    j["temperature"] = c.temperature;
    if (!c.description.empty()) j["description"] = c.description;
}

void from_json(const nlohmann::json& j, Category& c) {
    if (!j.is_object()) return;
    if (j.contains("model") && j["model"].is_string()) {
        c.model = j["model"].get<std::string>();
    }
    if (j.contains("temperature") && j["temperature"].is_number()) {
        c.temperature = j["temperature"].get<double>();
    }
    if (j.contains("description") && j["description"].is_string()) {
        c.description = j["description"].get<std::string>();
    }
    c.extra = j;
    c.extra.erase("model");
    c.extra.erase("temperature");
    c.extra.erase("description");
}

OhMyOpenCodeConfig OhMyOpenCodeConfig::from_json(const nlohmann::json& j) {
    OhMyOpenCodeConfig config;
    if (!j.is_object()) {
        return config;
    }

    if (j.contains("agents") && j["agents"].is_object()) {
        for (auto& [key, value] : j["agents"].items()) {
            OhMyAgent agent;
            occm::from_json(value, agent);
            config.agents[key] = agent;
        }
    }

    if (j.contains("categories") && j["categories"].is_object()) {
        for (auto& [key, value] : j["categories"].items()) {
            Category category;
            occm::from_json(value, category);
            config.categories[key] = category;
        }
    }

    config.extra_fields = j;
    config.extra_fields.erase("agents");
    config.extra_fields.erase("categories");
    return config;
}

nlohmann::json OhMyOpenCodeConfig::to_json() const {
    nlohmann::json j = extra_fields.is_object() ? extra_fields : nlohmann::json::object();

    nlohmann::json agents_obj = nlohmann::json::object();
    for (const auto& [key, value] : agents) {
        agents_obj[key] = value;
    }
    j["agents"] = agents_obj;

    if (!categories.empty()) {
        nlohmann::json categories_obj = nlohmann::json::object();
        for (const auto& [key, value] : categories) {
            categories_obj[key] = value;
        }
        j["categories"] = categories_obj;
    }

    return j;
}

bool OhMyOpenCodeConfig::save_agent(const std::string& name, const OhMyAgent& agent,
                                    bool is_new, std::string& error_out) {
    const std::string key = trim(name);
    if (key.empty()) {
        error_out = "Agent name is required";
        return false;
    }
    if (trim(agent.model).empty()) {
        error_out = "Select a model for the agent";
        return false;
    }
    if (is_new && agents.count(key) > 0) {
        error_out = "Agent \"" + key + "\" already exists";
        return false;
    }

    OhMyAgent updated = agent;
    updated.model = trim(updated.model);
    updated.description = trim(updated.description);
    agents[key] = updated;
    return true;
}

bool OhMyOpenCodeConfig::remove_agent(const std::string& name) {
    return agents.erase(name) > 0;
}

bool OhMyOpenCodeConfig::add_preset_agent(const std::string& name, const std::string& model, std::string& error_out) {
    const auto* preset = find_ohmy_agent_preset(name);
    if (!preset) {
        error_out = "Unknown preset agent \"" + name + "\"";
        return false;
    }

    OhMyAgent agent;
    auto existing = agents.find(name);
    if (existing != agents.end()) {
        agent = existing->second;
    }
    agent.model = model;
    agent.description = preset->description;
    return save_agent(name, agent, false, error_out);
}

bool OhMyOpenCodeConfig::save_category(const std::string& name, const Category& category,
                                       bool is_new, std::string& error_out) {
    const std::string key = trim(name);
    if (key.empty()) {
        error_out = "Category name is required";
        return false;
    }
    if (trim(category.model).empty()) {
        error_out = "Select a model for the category";
        return false;
    }
    if (category.temperature < 0.0 || category.temperature > 2.0) {
        error_out = "Temperature must be between 0.0 and 2.0";
        return false;
    }
    if (is_new && categories.count(key) > 0) {
        error_out = "Category \"" + key + "\" already exists";
        return false;
    }

    Category updated = category;
    updated.model = trim(updated.model);
    updated.description = trim(updated.description);
    updated.temperature = round_temperature(updated.temperature);
    categories[key] = updated;
    return true;
}

bool OhMyOpenCodeConfig::remove_category(const std::string& name) {
    return categories.erase(name) > 0;
}

bool OhMyOpenCodeConfig::add_preset_category(const std::string& name, const std::string& model, std::string& error_out) {
    const auto* preset = find_category_preset(name);
    if (!preset) {
        error_out = "Unknown preset category \"" + name + "\"";
        return false;
    }

    Category category;
    category.model = model;
    category.temperature = preset->temperature;
    category.description = preset->description;
    return save_category(name, category, false, error_out);
}

}
