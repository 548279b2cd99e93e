#include "adapters/config_validator.h"
#include "adapters/opencode_config.h"

#include <algorithm>
#include <regex>
#include <set>

namespace occm {

namespace {

void add_error(std::vector<ValidationIssue>& issues, const std::string& path, const std::string& message) {
    issues.push_back({IssueSeverity::Error, path, message});
}

void add_warning(std::vector<ValidationIssue>& issues, const std::string& path, const std::string& message) {
    issues.push_back({IssueSeverity::Warning, path, message});
}

bool is_string_array(const nlohmann::json& j) {
    if (!j.is_array()) return false;
    return std::all_of(j.begin(), j.end(), [](const nlohmann::json& item) { return item.is_string(); });
}

std::set<std::string> collect_model_refs(const nlohmann::json& config) {
    std::set<std::string> refs;
    if (!config.contains("provider") || !config["provider"].is_object()) return refs;
    for (auto& [provider_id, provider] : config["provider"].items()) {
        if (!provider.is_object() || !provider.contains("models") || !provider["models"].is_object()) continue;
        for (auto& [model_id, model] : provider["models"].items()) {
            refs.insert(provider_id + "/" + model_id);
        }
    }
    return refs;
}

void validate_provider(const std::string& id, const nlohmann::json& provider,
                       std::vector<ValidationIssue>& issues) {
    const std::string path = "provider." + id;
    if (!provider.is_object()) {
        add_error(issues, path, "Provider must be an object");
        return;
    }

    if (!provider.contains("npm") || !provider["npm"].is_string() || provider["npm"].get<std::string>().empty()) {
        add_warning(issues, path + ".npm", "Missing SDK package (npm)");
    }

    if (!provider.contains("options")) {
        add_warning(issues, path + ".options", "Missing options");
    } else if (!provider["options"].is_object()) {
        add_error(issues, path + ".options", "options must be an object");
    } else {
        const auto& options = provider["options"];
        if (options.contains("baseURL")) {
            if (!options["baseURL"].is_string()) {
                add_error(issues, path + ".options.baseURL", "baseURL must be a string");
            } else if (!ConfigValidator::is_valid_base_url(options["baseURL"].get<std::string>())) {
                add_error(issues, path + ".options.baseURL", "baseURL is not a valid http(s) URL");
            }
        }
    }

    if (!provider.contains("models")) {
        add_warning(issues, path + ".models", "Missing models");
        return;
    }
    if (!provider["models"].is_object()) {
        add_error(issues, path + ".models", "models must be an object");
        return;
    }

    for (auto& [model_id, model] : provider["models"].items()) {
        const std::string model_path = path + ".models." + model_id;
        if (!model.is_object()) {
            add_error(issues, model_path, "Model must be an object");
            continue;
        }
        if (!model.contains("limit")) continue;
        const auto& limit = model["limit"];
        if (!limit.is_object()) {
            add_error(issues, model_path + ".limit", "limit must be an object");
            continue;
        }
        for (const char* key : {"context", "output"}) {
            if (limit.contains(key) && !limit[key].is_number()) {
                add_error(issues, model_path + ".limit." + key, std::string(key) + " must be a number");
            }
        }
    }
}

void validate_mcp(const std::string& name, const nlohmann::json& server, std::vector<ValidationIssue>& issues) {
    const std::string path = "mcp." + name;
    if (!server.is_object()) {
        add_error(issues, path, "MCP server must be an object");
        return;
    }

    std::string type;
    if (server.contains("type") && server["type"].is_string()) {
        type = server["type"].get<std::string>();
    } else {
        add_warning(issues, path + ".type", "Missing type");
        type = server.contains("url") ? "remote" : "local";
    }

    if (type == "remote") {
        if (!server.contains("url") || !server["url"].is_string() || server["url"].get<std::string>().empty()) {
            add_error(issues, path + ".url", "Remote MCP server requires a url");
        }
    } else if (type == "local") {
        if (!server.contains("command") || !is_string_array(server["command"]) || server["command"].empty()) {
            add_error(issues, path + ".command", "Local MCP server requires a command array");
        }
    } else {
        add_error(issues, path + ".type", "type must be local or remote");
    }

    if (server.contains("enabled") && !server["enabled"].is_boolean()) {
        add_error(issues, path + ".enabled", "enabled must be a boolean");
    }
    if (server.contains("timeout") && !server["timeout"].is_number()) {
        add_error(issues, path + ".timeout", "timeout must be a number");
    }
}

void validate_agent(const std::string& name, const nlohmann::json& agent,
                    const std::set<std::string>& model_refs, std::vector<ValidationIssue>& issues) {
    const std::string path = "agent." + name;
    if (!agent.is_object()) {
        add_error(issues, path, "Agent must be an object");
        return;
    }

    if (!agent.contains("description") || !agent["description"].is_string()) {
        add_warning(issues, path + ".description", "Missing description");
    }

    if (agent.contains("mode")) {
        const auto& modes = agent_modes();
        if (!agent["mode"].is_string() ||
            std::find(modes.begin(), modes.end(), agent["mode"].get<std::string>()) == modes.end()) {
            add_error(issues, path + ".mode", "mode must be primary, subagent or all");
        }
    }

    if (agent.contains("temperature")) {
        if (!agent["temperature"].is_number()) {
            add_error(issues, path + ".temperature", "temperature must be a number");
        } else {
            double t = agent["temperature"].get<double>();
            if (t < 0.0 || t > 2.0) {
                add_error(issues, path + ".temperature", "temperature must be between 0 and 2");
            }
        }
    }

    if (agent.contains("model") && agent["model"].is_string()) {
        const std::string model = agent["model"].get<std::string>();
        if (!model.empty() && model_refs.count(model) == 0) {
            add_warning(issues, path + ".model", "Model \"" + model + "\" is not defined by any provider");
        }
    }
}

void validate_permission_value(const std::string& path, const nlohmann::json& value,
                               std::vector<ValidationIssue>& issues) {
    if (value.is_string()) {
        if (!is_valid_permission_level(value.get<std::string>())) {
            add_error(issues, path, "Permission must be allow, ask or deny");
        }
        return;
    }
    if (value.is_object()) {
        for (auto& [pattern, level] : value.items()) {
            if (!level.is_string() || !is_valid_permission_level(level.get<std::string>())) {
                add_error(issues, path + "." + pattern, "Permission must be allow, ask or deny");
            }
        }
        return;
    }
    add_error(issues, path, "Permission must be a string or an object");
}

bool ensure_object(nlohmann::json& config, const char* key, std::vector<std::string>& fixes) {
    if (!config.contains(key)) return false;
    if (config[key].is_object()) return true;
    config[key] = nlohmann::json::object();
    fixes.push_back(std::string("Reset ") + key + " to an empty object");
    return true;
}

bool drop_invalid_level(nlohmann::json& value) {
    if (value.is_string()) return !is_valid_permission_level(value.get<std::string>());
    if (!value.is_object()) return true;
    std::vector<std::string> bad;
    for (auto& [pattern, level] : value.items()) {
        if (!level.is_string() || !is_valid_permission_level(level.get<std::string>())) {
            bad.push_back(pattern);
        }
    }
    for (const auto& pattern : bad) value.erase(pattern);
    return false;
}

}

bool ConfigValidator::is_valid_base_url(const std::string& url) {
    static const std::regex pattern(R"(^https?://[\w\-.]+(:\d+)?(/.*)?$)");
    return std::regex_match(url, pattern);
}

size_t ConfigValidator::error_count(const std::vector<ValidationIssue>& issues) {
    return static_cast<size_t>(std::count_if(issues.begin(), issues.end(), [](const ValidationIssue& issue) {
        return issue.severity == IssueSeverity::Error;
    }));
}

std::vector<ValidationIssue> ConfigValidator::validate(const nlohmann::json& config) {
    std::vector<ValidationIssue> issues;
    if (!config.is_object()) {
        add_error(issues, "", "Config root must be an object");
        return issues;
    }

    if (!config.contains("$schema")) {
        add_warning(issues, "$schema", "Missing $schema");
    }

    for (const char* key : {"provider", "mcp", "agent", "permission"}) {
        if (config.contains(key) && !config[key].is_object()) {
            add_error(issues, key, std::string(key) + " must be an object");
        }
    }

    if (config.contains("provider") && config["provider"].is_object()) {
        for (auto& [id, provider] : config["provider"].items()) {
            validate_provider(id, provider, issues);
        }
    }

    if (config.contains("mcp") && config["mcp"].is_object()) {
        for (auto& [name, server] : config["mcp"].items()) {
            validate_mcp(name, server, issues);
        }
    }

    if (config.contains("agent") && config["agent"].is_object()) {
        auto refs = collect_model_refs(config);
        for (auto& [name, agent] : config["agent"].items()) {
            validate_agent(name, agent, refs, issues);
        }
    }

    if (config.contains("permission") && config["permission"].is_object()) {
        for (auto& [tool, value] : config["permission"].items()) {
            validate_permission_value("permission." + tool, value, issues);
        }
    }

    if (config.contains("compaction")) {
        const auto& compaction = config["compaction"];
        if (!compaction.is_object()) {
            add_error(issues, "compaction", "compaction must be an object");
        } else {
            for (const char* key : {"auto", "prune"}) {
                if (compaction.contains(key) && !compaction[key].is_boolean()) {
                    add_error(issues, std::string("compaction.") + key, std::string(key) + " must be a boolean");
                }
            }
        }
    }

    if (config.contains("instructions") && !is_string_array(config["instructions"])) {
        add_error(issues, "instructions", "instructions must be an array of strings");
    }

    return issues;
}

std::vector<std::string> ConfigValidator::fix(nlohmann::json& config) {
    std::vector<std::string> fixes;
    if (!config.is_object()) {
        config = nlohmann::json::object();
        fixes.push_back("Replaced config root with an empty object");
    }

    if (!config.contains("$schema")) {
        config["$schema"] = kOpenCodeSchemaUrl;
        fixes.push_back("Added $schema");
    }

    if (ensure_object(config, "provider", fixes)) {
        for (auto& [id, provider] : config["provider"].items()) {
            if (!provider.is_object()) {
                provider = nlohmann::json::object();
                fixes.push_back("Reset provider." + id + " to an empty object");
            }
            if (!provider.contains("options") || !provider["options"].is_object()) {
                provider["options"] = nlohmann::json::object();
                fixes.push_back("Added options to provider." + id);
            }
            if (!provider.contains("models") || !provider["models"].is_object()) {
                provider["models"] = nlohmann::json::object();
                fixes.push_back("Added models to provider." + id);
            }
            for (auto& [model_id, model] : provider["models"].items()) {
                if (!model.is_object()) {
                    model = nlohmann::json::object();
                    fixes.push_back("Reset provider." + id + ".models." + model_id);
                }
                if (!model.contains("name")) {
                    model["name"] = model_id;
                    fixes.push_back("Named model provider." + id + ".models." + model_id);
                }
            }
        }
    }

    if (ensure_object(config, "mcp", fixes)) {
        for (auto& [name, server] : config["mcp"].items()) {
            if (!server.is_object()) continue;
            if (!server.contains("type") || !server["type"].is_string()) {
                server["type"] = server.contains("url") ? "remote" : "local";
                fixes.push_back("Set type of mcp." + name + " to " + server["type"].get<std::string>());
            }
        }
    }

    ensure_object(config, "agent", fixes);

    if (ensure_object(config, "permission", fixes)) {
        std::vector<std::string> invalid;
        for (auto& [tool, value] : config["permission"].items()) {
            if (drop_invalid_level(value)) invalid.push_back(tool);
        }
        for (const auto& tool : invalid) {
            config["permission"].erase(tool);
            fixes.push_back("Removed invalid permission." + tool);
        }
    }

    if (config.contains("instructions") && config["instructions"].is_string()) {
        config["instructions"] = nlohmann::json::array({config["instructions"].get<std::string>()});
        fixes.push_back("Wrapped instructions in an array");
    }

    return fixes;
}

}
