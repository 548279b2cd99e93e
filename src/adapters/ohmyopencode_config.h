#pragma once

#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace occm {

struct OhMyAgent {
    std::string model;
    std::string description;
    nlohmann::json extra = nlohmann::json::object();
};

struct Category {
    std::string model;
    double temperature = 0.7;
    std::string description;
    nlohmann::json extra = nlohmann::json::object();
};

// oh-my-opencode.json: plugin agents and task categories.
struct OhMyOpenCodeConfig {
    std::map<std::string, OhMyAgent> agents;
    std::map<std::string, Category> categories;
    nlohmann::json extra_fields = nlohmann::json::object();

    static OhMyOpenCodeConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    bool save_agent(const std::string& name, const OhMyAgent& agent, bool is_new, std::string& error_out);
    bool remove_agent(const std::string& name);
    bool add_preset_agent(const std::string& name, const std::string& model, std::string& error_out);

    bool save_category(const std::string& name, const Category& category, bool is_new, std::string& error_out);
    bool remove_category(const std::string& name);
    bool add_preset_category(const std::string& name, const std::string& model, std::string& error_out);
};

// Rounds to one decimal place.
double round_temperature(double value);

void to_json(nlohmann::json& j, const OhMyAgent& a);
void from_json(const nlohmann::json& j, OhMyAgent& a);

void to_json(nlohmann::json& j, const Category& c);
void from_json(const nlohmann::json& j, Category& c);

}
