#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace occm {

constexpr const char* kOpenCodeSchemaUrl = "https://opencode.ai/config.json";
constexpr int64_t kDefaultContextLimit = 200000;
constexpr int64_t kDefaultOutputLimit = 16000;
constexpr int64_t kDefaultMcpTimeoutMs = 5000;
constexpr double kDefaultAgentTemperature = 0.3;

// has_context/has_output record whether the key is written back.
struct ModelLimit {
    int64_t context = kDefaultContextLimit;
    int64_t output = kDefaultOutputLimit;
    bool has_context = true;
    bool has_output = true;
    nlohmann::json extra = nlohmann::json::object();
};

struct ModelConfig {
    std::string name;
    std::optional<bool> attachment;
    std::optional<ModelLimit> limit;
    nlohmann::json modalities;
    nlohmann::json options = nlohmann::json::object();
    nlohmann::json variants = nlohmann::json::object();
    nlohmann::json extra = nlohmann::json::object();
};

// provider.<id>. baseURL and apiKey live under "options" on disk.
struct ProviderConfig {
    std::string npm;
    std::string name;
    std::string base_url;
    std::string api_key;
    nlohmann::json options = nlohmann::json::object();
    std::map<std::string, ModelConfig> models;
    nlohmann::json extra = nlohmann::json::object();
};

enum class McpType {
    Local,
    Remote
};

struct McpServer {
    McpType type = McpType::Local;
    std::vector<std::string> command;
    std::map<std::string, std::string> environment;
    std::string url;
    std::map<std::string, std::string> headers;
    bool enabled = true;
    std::optional<int64_t> timeout;
    nlohmann::json extra = nlohmann::json::object();
};

struct AgentConfig {
    std::string description;
    std::string mode;
    std::string model;
    std::optional<double> temperature;
    std::optional<int> max_steps;
    bool hidden = false;
    bool disable = false;
    std::map<std::string, bool> tools;
    nlohmann::json permission;
    std::string prompt;
    nlohmann::json extra = nlohmann::json::object();
};

// A key absent from the file is only written once it leaves its default.
struct CompactionConfig {
    bool auto_compact = true;
    bool prune = true;
    bool has_auto = false;
    bool has_prune = false;
    nlohmann::json extra = nlohmann::json::object();
};

const std::vector<std::string>& permission_levels();
bool is_valid_permission_level(const std::string& level);
const std::vector<std::string>& agent_modes();
const char* mcp_type_name(McpType type);

struct OpenCodeConfig {
    std::string schema = kOpenCodeSchemaUrl;
    std::string model;
    std::string small_model;

    std::map<std::string, ProviderConfig> providers;
    std::map<std::string, AgentConfig> agents;
    std::map<std::string, McpServer> mcp;

    // tool -> "allow"|"ask"|"deny" or a pattern object; "skill" holds skill patterns.
    std::map<std::string, nlohmann::json> permission;

    std::vector<std::string> instructions;
    std::optional<CompactionConfig> compaction;

    nlohmann::json extra_fields = nlohmann::json::object();

    static OpenCodeConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    bool save_provider(const std::string& id, const ProviderConfig& provider, bool is_new, std::string& error_out);
    bool remove_provider(const std::string& id);

    bool save_model(const std::string& provider_id, const std::string& model_id,
                    const ModelConfig& model, bool is_new, std::string& error_out);
    bool remove_model(const std::string& provider_id, const std::string& model_id);
    int add_preset_models(const std::string& provider_id, const std::string& series,
                          const std::vector<std::string>& model_ids);
    std::vector<std::string> model_refs() const;
    size_t model_count() const;

    bool save_mcp(const std::string& name, const McpServer& server, bool is_new, std::string& error_out);
    bool remove_mcp(const std::string& name);
    bool set_mcp_enabled(const std::string& name, bool enabled);

    bool save_agent(const std::string& name, const AgentConfig& agent, bool is_new, std::string& error_out);
    bool remove_agent(const std::string& name);
    int add_preset_agents(const std::vector<std::string>& names);

    std::vector<std::pair<std::string, std::string>> tool_permissions() const;
    bool set_permission(const std::string& tool, const std::string& level, std::string& error_out);
    void quick_allow(const std::string& tool);
    bool remove_permission(const std::string& tool);

    std::map<std::string, std::string> skill_permissions() const;
    bool set_skill_permission(const std::string& pattern, const std::string& level, std::string& error_out);
    bool remove_skill_permission(const std::string& pattern);

    bool add_instruction(const std::string& path);
    bool remove_instruction(const std::string& path);

    CompactionConfig effective_compaction() const { return compaction.value_or(CompactionConfig{}); }
};

void to_json(nlohmann::json& j, const ModelConfig& m);
void from_json(const nlohmann::json& j, ModelConfig& m);

void to_json(nlohmann::json& j, const ProviderConfig& p);
void from_json(const nlohmann::json& j, ProviderConfig& p);

void to_json(nlohmann::json& j, const McpServer& m);
void from_json(const nlohmann::json& j, McpServer& m);

void to_json(nlohmann::json& j, const AgentConfig& a);
void from_json(const nlohmann::json& j, AgentConfig& a);

void to_json(nlohmann::json& j, const CompactionConfig& c);
void from_json(const nlohmann::json& j, CompactionConfig& c);

}
