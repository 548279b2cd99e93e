#include "adapters/opencode_config.h"
#include "adapters/presets.h"
#include "core/string_utils.h"

#include <algorithm>
#include <cmath>

namespace occm {

namespace {

template <typename Container>
nlohmann::json collect_extra(const nlohmann::json& j, const Container& known_keys) {
    nlohmann::json extra = nlohmann::json::object();
    for (auto& [key, value] : j.items()) {
        if (std::find(std::begin(known_keys), std::end(known_keys), key) == std::end(known_keys)) {
            extra[key] = value;
        }
    }
    return extra;
}

std::map<std::string, std::string> string_map(const nlohmann::json& j) {
    std::map<std::string, std::string> out;
    if (!j.is_object()) return out;
    for (auto& [key, value] : j.items()) {
        if (value.is_string()) {
            out[key] = value.get<std::string>();
        } else if (value.is_number() || value.is_boolean()) {
            out[key] = value.dump();
        }
    }
    return out;
}

std::vector<std::string> string_list(const nlohmann::json& j) {
    std::vector<std::string> out;
    if (!j.is_array()) return out;
    for (const auto& item : j) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

}

const std::vector<std::string>& permission_levels() {
    static const std::vector<std::string> levels = {"allow", "ask", "deny"};
    return levels;
}

bool is_valid_permission_level(const std::string& level) {
    const auto& levels = permission_levels();
    return std::find(levels.begin(), levels.end(), level) != levels.end();
}

const std::vector<std::string>& agent_modes() {
    static const std::vector<std::string> modes = {"primary", "subagent", "all"};
    return modes;
}

const char* mcp_type_name(McpType type) {
    return type == McpType::Remote ? "remote" : "local";
}

void to_json(nlohmann::json& j, const ModelConfig& m) {
    j = m.extra.is_object() ? m.extra : nlohmann::json::object();
    if (!m.name.empty()) j["name"] = m.name;
    if (m.attachment) j["attachment"] = *m.attachment;
    if (m.limit) {
        nlohmann::json limit = m.limit->extra.is_object() ? m.limit->extra : nlohmann::json::object();
        if (m.limit->has_context) limit["context"] = m.limit->context;
        if (m.limit->has_output) limit["output"] = m.limit->output;
        j["limit"] = limit;
    }
    if (!m.modalities.is_null()) j["modalities"] = m.modalities;
    if (m.options.is_object() && !m.options.empty()) j["options"] = m.options;
    if (m.variants.is_object() && !m.variants.empty()) j["variants"] = m.variants;
}

void from_json(const nlohmann::json& j, ModelConfig& m) {
    static const char* known[] = {"name", "attachment", "limit", "modalities", "options", "variants"};
    if (!j.is_object()) return;

    if (j.contains("name") && j["name"].is_string()) {
        m.name = j["name"].get<std::string>();
    }
    if (j.contains("attachment") && j["attachment"].is_boolean()) {
        m.attachment = j["attachment"].get<bool>();
    }
    if (j.contains("limit") && j["limit"].is_object()) {
        ModelLimit limit;
        limit.extra = j["limit"];
        limit.has_context = limit.extra.contains("context") && limit.extra["context"].is_number();
        limit.has_output = limit.extra.contains("output") && limit.extra["output"].is_number();
        if (limit.has_context) {
            limit.context = limit.extra["context"].get<int64_t>();
            limit.extra.erase("context");
        }
        if (limit.has_output) {
            limit.output = limit.extra["output"].get<int64_t>();
            limit.extra.erase("output");
        }
        m.limit = limit;
    }
    if (j.contains("modalities")) {
        m.modalities = j["modalities"];
    }
    if (j.contains("options") && j["options"].is_object()) {
        m.options = j["options"];
    }
    if (j.contains("variants") && j["variants"].is_object()) {
        m.variants = j["variants"];
    }
    m.extra = collect_extra(j, known);
}

void to_json(nlohmann::json& j, const ProviderConfig& p) {
    j = p.extra.is_object() ? p.extra : nlohmann::json::object();
    if (!p.npm.empty()) j["npm"] = p.npm;
    if (!p.name.empty()) j["name"] = p.name;

    nlohmann::json options = p.options.is_object() ? p.options : nlohmann::json::object();
    if (!p.base_url.empty()) options["baseURL"] = p.base_url;
    if (!p.api_key.empty()) options["apiKey"] = p.api_key;
    j["options"] = options;

    nlohmann::json models = nlohmann::json::object();
    for (const auto& [id, model] : p.models) {
        models[id] = model;
    }
    j["models"] = models;
}

void from_json(const nlohmann::json& j, ProviderConfig& p) {
    static const char* known[] = {"npm", "name", "options", "models"};
    if (!j.is_object()) return;

    if (j.contains("npm") && j["npm"].is_string()) {
        p.npm = j["npm"].get<std::string>();
    }
    if (j.contains("name") && j["name"].is_string()) {
        p.name = j["name"].get<std::string>();
    }
    if (j.contains("options") && j["options"].is_object()) {
        p.options = j["options"];
        // Non-string values (e.g. {env: ...} objects) stay in options untouched.
        if (p.options.contains("baseURL") && p.options["baseURL"].is_string()) {
            p.base_url = p.options["baseURL"].get<std::string>();
            p.options.erase("baseURL");
        }
        if (p.options.contains("apiKey") && p.options["apiKey"].is_string()) {
            p.api_key = p.options["apiKey"].get<std::string>();
            p.options.erase("apiKey");
        }
    }
    if (j.contains("models") && j["models"].is_object()) {
        for (auto& [id, value] : j["models"].items()) {
            ModelConfig model;
            occm::from_json(value, model);
            p.models[id] = model;
        }
    }
    p.extra = collect_extra(j, known);
}

void to_json(nlohmann::json& j, const McpServer& m) {
    j = m.extra.is_object() ? m.extra : nlohmann::json::object();
    j["type"] = mcp_type_name(m.type);
    if (m.type == McpType::Remote) {
        j["url"] = m.url;
        if (!m.headers.empty()) j["headers"] = m.headers;
    } else {
        if (!m.command.empty()) j["command"] = m.command;
        if (!m.environment.empty()) j["environment"] = m.environment;
    }
    j["enabled"] = m.enabled;
    if (m.timeout) j["timeout"] = *m.timeout;
}

void from_json(const nlohmann::json& j, McpServer& m) {
    static const char* known[] = {"type", "command", "environment", "url", "headers", "enabled", "timeout"};
    if (!j.is_object()) return;

    if (j.contains("type") && j["type"].is_string()) {
        m.type = j["type"].get<std::string>() == "remote" ? McpType::Remote : McpType::Local;
    } else {
        m.type = j.contains("url") ? McpType::Remote : McpType::Local;
    }

    if (j.contains("command")) {
        if (j["command"].is_array()) {
            m.command = string_list(j["command"]);
        } else if (j["command"].is_string()) {
            // Older files split the executable and its arguments.
            m.command.push_back(j["command"].get<std::string>());
            for (const auto& arg : string_list(j.value("args", nlohmann::json::array()))) {
                m.command.push_back(arg);
            }
        }
    }
    if (j.contains("environment")) {
        m.environment = string_map(j["environment"]);
    }
    if (j.contains("url") && j["url"].is_string()) {
        m.url = j["url"].get<std::string>();
    }
    if (j.contains("headers")) {
        m.headers = string_map(j["headers"]);
    }
    if (j.contains("enabled") && j["enabled"].is_boolean()) {
        m.enabled = j["enabled"].get<bool>();
    }
    if (j.contains("timeout") && j["timeout"].is_number()) {
        m.timeout = j["timeout"].get<int64_t>();
    }
    m.extra = collect_extra(j, known);
    if (j.contains("command") && j["command"].is_string()) {
        // Folded into command above.
        m.extra.erase("args");
    }
}

void to_json(nlohmann::json& j, const AgentConfig& a) {
    j = a.extra.is_object() ? a.extra : nlohmann::json::object();
    if (!a.description.empty()) j["description"] = a.description;
    if (!a.mode.empty()) j["mode"] = a.mode;
    if (!a.model.empty()) j["model"] = a.model;
    if (a.temperature) j["temperature"] = *a.temperature;
    if (a.max_steps) j["maxSteps"] = *a.max_steps;
    if (a.hidden) j["hidden"] = true;
    if (a.disable) j["disable"] = true;
    if (!a.tools.empty()) j["tools"] = a.tools;
    if (!a.permission.is_null() && !(a.permission.is_object() && a.permission.empty())) {
        j["permission"] = a.permission;
    }
    if (!a.prompt.empty()) j["prompt"] = a.prompt;
}

void from_json(const nlohmann::json& j, AgentConfig& a) {
    static const char* known[] = {"description", "mode", "model", "temperature", "maxSteps",
                                  "hidden", "disable", "tools", "permission", "prompt"};
    if (!j.is_object()) return;

    if (j.contains("description") && j["description"].is_string()) {
        a.description = j["description"].get<std::string>();
    }
    if (j.contains("mode") && j["mode"].is_string()) {
        a.mode = j["mode"].get<std::string>();
    }
    if (j.contains("model") && j["model"].is_string()) {
        a.model = j["model"].get<std::string>();
    }
    if (j.contains("temperature") && j["temperature"].is_number()) {
        a.temperature = j["temperature"].get<double>();
    }
    if (j.contains("maxSteps") && j["maxSteps"].is_number_integer()) {
        a.max_steps = j["maxSteps"].get<int>();
    }
    if (j.contains("hidden") && j["hidden"].is_boolean()) {
        a.hidden = j["hidden"].get<bool>();
    }
    if (j.contains("disable") && j["disable"].is_boolean()) {
        a.disable = j["disable"].get<bool>();
    }
    if (j.contains("tools") && j["tools"].is_object()) {
        for (auto& [tool, enabled] : j["tools"].items()) {
            if (enabled.is_boolean()) a.tools[tool] = enabled.get<bool>();
        }
    }
    if (j.contains("permission")) {
        a.permission = j["permission"];
    }
    if (j.contains("prompt") && j["prompt"].is_string()) {
        a.prompt = j["prompt"].get<std::string>();
    }
    a.extra = collect_extra(j, known);
}

void to_json(nlohmann::json& j, const CompactionConfig& c) {
    j = c.extra.is_object() ? c.extra : nlohmann::json::object();
    if (c.has_auto || !c.auto_compact) j["auto"] = c.auto_compact;
    if (c.has_prune || !c.prune) j["prune"] = c.prune;
}

void from_json(const nlohmann::json& j, CompactionConfig& c) {
    if (!j.is_object()) return;
    c.extra = j;
    c.has_auto = j.contains("auto") && j["auto"].is_boolean();
    c.has_prune = j.contains("prune") && j["prune"].is_boolean();
    if (c.has_auto) {
        c.auto_compact = j["auto"].get<bool>();
        c.extra.erase("auto");
    }
    if (c.has_prune) {
        c.prune = j["prune"].get<bool>();
        c.extra.erase("prune");
    }
}

OpenCodeConfig OpenCodeConfig::from_json(const nlohmann::json& j) {
    OpenCodeConfig config;
    if (!j.is_object()) {
        return config;
    }

    if (j.contains("$schema") && j["$schema"].is_string()) {
        config.schema = j["$schema"].get<std::string>();
    }
    if (j.contains("model") && j["model"].is_string()) {
        config.model = j["model"].get<std::string>();
    }
    if (j.contains("small_model") && j["small_model"].is_string()) {
        config.small_model = j["small_model"].get<std::string>();
    }

    if (j.contains("provider") && j["provider"].is_object()) {
        for (auto& [key, value] : j["provider"].items()) {
            ProviderConfig provider;
            occm::from_json(value, provider);
            config.providers[key] = provider;
        }
    }

    if (j.contains("agent") && j["agent"].is_object()) {
        for (auto& [key, value] : j["agent"].items()) {
            AgentConfig agent;
            occm::from_json(value, agent);
            config.agents[key] = agent;
        }
    }

    if (j.contains("mcp") && j["mcp"].is_object()) {
        for (auto& [key, value] : j["mcp"].items()) {
            McpServer server;
            occm::from_json(value, server);
            config.mcp[key] = server;
        }
    }

    if (j.contains("permission") && j["permission"].is_object()) {
        for (auto& [key, value] : j["permission"].items()) {
            config.permission[key] = value;
        }
    }

    if (j.contains("instructions")) {
        if (j["instructions"].is_array()) {
            config.instructions = string_list(j["instructions"]);
        } else if (j["instructions"].is_string()) {
            config.instructions.push_back(j["instructions"].get<std::string>());
        }
    }

    if (j.contains("compaction") && j["compaction"].is_object()) {
        CompactionConfig compaction;
        occm::from_json(j["compaction"], compaction);
        config.compaction = compaction;
    }

    static const char* known_keys[] = {
        "$schema", "model", "small_model", "provider", "agent", "mcp",
        "permission", "instructions", "compaction"
    };
    config.extra_fields = collect_extra(j, known_keys);

    return config;
}

nlohmann::json OpenCodeConfig::to_json() const {
    nlohmann::json j = extra_fields.is_object() ? extra_fields : nlohmann::json::object();

    j["$schema"] = schema.empty() ? std::string(kOpenCodeSchemaUrl) : schema;

    if (!model.empty()) j["model"] = model;
    if (!small_model.empty()) j["small_model"] = small_model;

    if (!providers.empty()) {
        nlohmann::json provider_obj = nlohmann::json::object();
        for (const auto& [key, value] : providers) {
            provider_obj[key] = value;
        }
        j["provider"] = provider_obj;
    }

    if (!agents.empty()) {
        nlohmann::json agent_obj = nlohmann::json::object();
        for (const auto& [key, value] : agents) {
            agent_obj[key] = value;
        }
        j["agent"] = agent_obj;
    }

    if (!mcp.empty()) {
        nlohmann::json mcp_obj = nlohmann::json::object();
        for (const auto& [key, value] : mcp) {
            mcp_obj[key] = value;
        }
        j["mcp"] = mcp_obj;
    }

    if (!permission.empty()) {
        j["permission"] = permission;
    }

    if (!instructions.empty()) {
        j["instructions"] = instructions;
    }

    if (compaction) {
        j["compaction"] = *compaction;
    }

    return j;
}

bool OpenCodeConfig::save_provider(const std::string& id, const ProviderConfig& provider,
                                   bool is_new, std::string& error_out) {
    const std::string key = trim(id);
    if (key.empty()) {
        error_out = "Provider name is required";
        return false;
    }

    auto it = providers.find(key);
    if (is_new && it != providers.end()) {
        error_out = "Provider \"" + key + "\" already exists";
        return false;
    }

    ProviderConfig updated = provider;
    updated.base_url = trim(updated.base_url);
    updated.api_key = trim(updated.api_key);
    if (it != providers.end()) {
        // Models are edited through save_model; keep what is there.
        updated.models = it->second.models;
    }
    providers[key] = updated;
    return true;
}

bool OpenCodeConfig::remove_provider(const std::string& id) {
    return providers.erase(id) > 0;
}

bool OpenCodeConfig::save_model(const std::string& provider_id, const std::string& model_id,
                                const ModelConfig& model, bool is_new, std::string& error_out) {
    const std::string key = trim(model_id);
    if (key.empty()) {
        error_out = "Model ID is required";
        return false;
    }
    const std::string provider_key = trim(provider_id);
    if (provider_key.empty()) {
        error_out = "Select a provider first";
        return false;
    }

    auto& models = providers[provider_key].models;
    if (is_new && models.count(key) > 0) {
        error_out = "Model \"" + key + "\" already exists";
        return false;
    }

    models[key] = model;
    return true;
}

bool OpenCodeConfig::remove_model(const std::string& provider_id, const std::string& model_id) {
    auto it = providers.find(provider_id);
    if (it == providers.end()) return false;
    return it->second.models.erase(model_id) > 0;
}

int OpenCodeConfig::add_preset_models(const std::string& provider_id, const std::string& series,
                                      const std::vector<std::string>& model_ids) {
    const auto* preset_series = find_model_series(series);
    if (!preset_series || trim(provider_id).empty()) return 0;

    auto& provider = providers[provider_id];
    if (provider.npm.empty()) {
        provider.npm = preset_series->sdk;
    }

    int added = 0;
    for (const auto& id : model_ids) {
        const auto* preset = find_model_preset(series, id);
        if (!preset || provider.models.count(id) > 0) continue;
        provider.models[id] = preset->config;
        ++added;
    }
    return added;
}

std::vector<std::string> OpenCodeConfig::model_refs() const {
    std::vector<std::string> refs;
    for (const auto& [provider_id, provider] : providers) {
        for (const auto& [model_id, model] : provider.models) {
            refs.push_back(provider_id + "/" + model_id);
        }
    }
    return refs;
}

size_t OpenCodeConfig::model_count() const {
    size_t count = 0;
    for (const auto& [id, provider] : providers) {
        count += provider.models.size();
    }
    return count;
}

bool OpenCodeConfig::save_mcp(const std::string& name, const McpServer& server, bool is_new, std::string& error_out) {
    const std::string key = trim(name);
    if (key.empty()) {
        error_out = "MCP name is required";
        return false;
    }
    if (is_new && mcp.count(key) > 0) {
        error_out = "MCP \"" + key + "\" already exists";
        return false;
    }
    if (server.type == McpType::Remote && trim(server.url).empty()) {
        error_out = "Remote MCP server requires a URL";
        return false;
    }

    McpServer updated = server;
    updated.url = trim(updated.url);
    if (!updated.timeout) updated.timeout = kDefaultMcpTimeoutMs;
    mcp[key] = updated;
    return true;
}

bool OpenCodeConfig::remove_mcp(const std::string& name) {
    return mcp.erase(name) > 0;
}

bool OpenCodeConfig::set_mcp_enabled(const std::string& name, bool enabled) {
    auto it = mcp.find(name);
    if (it == mcp.end()) return false;
    it->second.enabled = enabled;
    return true;
}

bool OpenCodeConfig::save_agent(const std::string& name, const AgentConfig& agent, bool is_new, std::string& error_out) {
    const std::string key = trim(name);
    if (key.empty()) {
        error_out = "Agent name is required";
        return false;
    }
    if (trim(agent.description).empty()) {
        error_out = "Agent description is required";
        return false;
    }
    if (is_new && agents.count(key) > 0) {
        error_out = "Agent \"" + key + "\" already exists";
        return false;
    }

    AgentConfig updated = agent;
    updated.description = trim(updated.description);
    updated.model = trim(updated.model);
    if (updated.mode.empty()) updated.mode = "subagent";
    const auto& modes = agent_modes();
    if (std::find(modes.begin(), modes.end(), updated.mode) == modes.end()) {
        error_out = "Unknown agent mode \"" + updated.mode + "\"";
        return false;
    }
    if (updated.temperature) {
        if (*updated.temperature < 0.0 || *updated.temperature > 2.0) {
            error_out = "Temperature must be between 0.0 and 2.0";
            return false;
        }
        if (near(*updated.temperature, kDefaultAgentTemperature)) {
            updated.temperature.reset();
        }
    }
    if (updated.max_steps && *updated.max_steps <= 0) {
        updated.max_steps.reset();
    }

    agents[key] = updated;
    return true;
}

bool OpenCodeConfig::remove_agent(const std::string& name) {
    return agents.erase(name) > 0;
}

int OpenCodeConfig::add_preset_agents(const std::vector<std::string>& names) {
    int added = 0;
    for (const auto& name : names) {
        const auto* preset = find_opencode_agent_preset(name);
        if (!preset) continue;

        AgentConfig agent;
        agent.mode = preset->mode;
        agent.description = preset->description;
        agent.tools = preset->tools;
        agent.permission = preset->permission;
        agents[name] = agent;
        ++added;
    }
    return added;
}

std::vector<std::pair<std::string, std::string>> OpenCodeConfig::tool_permissions() const {
    std::vector<std::pair<std::string, std::string>> out;
    for (const auto& [tool, value] : permission) {
        if (tool == "skill") continue;
        out.emplace_back(tool, value.is_string() ? value.get<std::string>() : value.dump());
    }
    return out;
}

bool OpenCodeConfig::set_permission(const std::string& tool, const std::string& level, std::string& error_out) {
    const std::string key = trim(tool);
    if (key.empty()) {
        error_out = "Tool name is required";
        return false;
    }
    if (!is_valid_permission_level(level)) {
        error_out = "Permission must be allow, ask or deny";
        return false;
    }
    permission[key] = level;
    return true;
}

void OpenCodeConfig::quick_allow(const std::string& tool) {
    permission[tool] = "allow";
}

bool OpenCodeConfig::remove_permission(const std::string& tool) {
    return permission.erase(tool) > 0;
}

std::map<std::string, std::string> OpenCodeConfig::skill_permissions() const {
    std::map<std::string, std::string> out;
    auto it = permission.find("skill");
    if (it == permission.end()) return out;

    if (it->second.is_string()) {
        out["*"] = it->second.get<std::string>();
    } else if (it->second.is_object()) {
        out = string_map(it->second);
    }
    return out;
}

bool OpenCodeConfig::set_skill_permission(const std::string& pattern, const std::string& level, std::string& error_out) {
    const std::string key = trim(pattern);
    if (key.empty()) {
        error_out = "Pattern is required";
        return false;
    }
    if (!is_valid_permission_level(level)) {
        error_out = "Permission must be allow, ask or deny";
        return false;
    }

    nlohmann::json& skill = permission["skill"];
    if (skill.is_string()) {
        skill = nlohmann::json{{"*", skill.get<std::string>()}};
    } else if (!skill.is_object()) {
        skill = nlohmann::json::object();
    }
    skill[key] = level;
    return true;
}

bool OpenCodeConfig::remove_skill_permission(const std::string& pattern) {
    auto it = permission.find("skill");
    if (it == permission.end()) return false;

    if (it->second.is_string()) {
        if (pattern != "*") return false;
        permission.erase(it);
        return true;
    }
    if (!it->second.is_object() || !it->second.contains(pattern)) return false;

    it->second.erase(pattern);
    if (it->second.empty()) permission.erase(it);
    return true;
}

bool OpenCodeConfig::add_instruction(const std::string& path) {
    const std::string value = trim(path);
    if (value.empty()) return false;
    if (std::find(instructions.begin(), instructions.end(), value) != instructions.end()) return false;
    instructions.push_back(value);
    return true;
}

bool OpenCodeConfig::remove_instruction(const std::string& path) {
    auto it = std::find(instructions.begin(), instructions.end(), path);
    if (it == instructions.end()) return false;
    instructions.erase(it);
    return true;
}

}
