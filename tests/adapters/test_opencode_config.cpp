#include <gtest/gtest.h>
#include "adapters/opencode_config.h"

using namespace occm;

TEST(OpenCodeConfigTest, FromJsonBasicFields) {
    nlohmann::json j = {
        {"model", "anthropic/claude-sonnet-4-5-20250929"},
        {"small_model", "anthropic/claude-haiku-4-5-20250514"},
        {"instructions", {"CONTRIBUTING.md", "docs/*.md"}}
    };

    auto config = OpenCodeConfig::from_json(j);

    EXPECT_EQ(config.model, "anthropic/claude-sonnet-4-5-20250929");
    EXPECT_EQ(config.small_model, "anthropic/claude-haiku-4-5-20250514");
    ASSERT_EQ(config.instructions.size(), 2u);
    EXPECT_EQ(config.instructions[1], "docs/*.md");
    EXPECT_FALSE(config.compaction.has_value());
}

TEST(OpenCodeConfigTest, ToJsonWritesSchema) {
    OpenCodeConfig config;
    config.model = "openai/gpt-5";

    auto j = config.to_json();

    EXPECT_EQ(j["$schema"], "https://opencode.ai/config.json");
    EXPECT_EQ(j["model"], "openai/gpt-5");
    EXPECT_FALSE(j.contains("provider"));
    EXPECT_FALSE(j.contains("small_model"));
}

TEST(OpenCodeConfigTest, UnknownFieldsArePreserved) {
    nlohmann::json j = {
        {"theme", "catppuccin"},
        {"keybinds", {{"leader", "ctrl+x"}}},
        {"provider", {{"relay", {
            {"npm", "@ai-sdk/openai-compatible"},
            {"custom", 42},
            {"models", {{"m1", {{"name", "M1"}, {"cost", {{"input", 1}}}}}}}
        }}}}
    };

    auto out = OpenCodeConfig::from_json(j).to_json();

    EXPECT_EQ(out["theme"], "catppuccin");
    EXPECT_EQ(out["keybinds"]["leader"], "ctrl+x");
    EXPECT_EQ(out["provider"]["relay"]["custom"], 42);
    EXPECT_EQ(out["provider"]["relay"]["models"]["m1"]["cost"]["input"], 1);
}

TEST(OpenCodeConfigTest, NestedUnknownFieldsArePreserved) {
    nlohmann::json j = {
        {"provider", {{"relay", {
            {"npm", "@ai-sdk/openai-compatible"},
            {"options", {{"baseURL", {{"env", "RELAY_URL"}}}}},
            {"models", {{"m1", {{"limit", {{"context", 1000}, {"input", 500}}}}}}}
        }}}},
        {"compaction", {{"auto", false}, {"reserved", 4096}}},
        {"mcp", {{"fs", {{"type", "local"}, {"command", {"npx", "server"}}, {"args", {"--flag"}}}}}}
    };

    auto out = OpenCodeConfig::from_json(j).to_json();

    const auto& limit = out["provider"]["relay"]["models"]["m1"]["limit"];
    EXPECT_EQ(limit["context"], 1000);
    EXPECT_EQ(limit["input"], 500);
    EXPECT_FALSE(limit.contains("output"));

    EXPECT_EQ(out["compaction"]["auto"], false);
    EXPECT_EQ(out["compaction"]["reserved"], 4096);
    EXPECT_FALSE(out["compaction"].contains("prune"));

    EXPECT_EQ(out["provider"]["relay"]["options"]["baseURL"]["env"], "RELAY_URL");
    EXPECT_EQ(out["mcp"]["fs"]["args"], nlohmann::json::array({"--flag"}));
    EXPECT_EQ(out["mcp"]["fs"]["command"], nlohmann::json::array({"npx", "server"}));
}

TEST(OpenCodeConfigTest, ProviderOptionsHoldBaseUrlAndKey) {
    nlohmann::json j = {
        {"provider", {{"relay", {
            {"npm", "@ai-sdk/anthropic"},
            {"options", {{"baseURL", "https://relay.example.com/v1"},
                         {"apiKey", "{env:RELAY_KEY}"},
                         {"timeout", 60000}}}
        }}}}
    };

    auto config = OpenCodeConfig::from_json(j);
    const auto& provider = config.providers["relay"];

    EXPECT_EQ(provider.base_url, "https://relay.example.com/v1");
    EXPECT_EQ(provider.api_key, "{env:RELAY_KEY}");
    EXPECT_FALSE(provider.options.contains("baseURL"));
    EXPECT_EQ(provider.options["timeout"], 60000);

    auto out = config.to_json();
    EXPECT_EQ(out["provider"]["relay"]["options"]["baseURL"], "https://relay.example.com/v1");
    EXPECT_EQ(out["provider"]["relay"]["options"]["apiKey"], "{env:RELAY_KEY}");
    EXPECT_EQ(out["provider"]["relay"]["options"]["timeout"], 60000);
}

TEST(OpenCodeConfigTest, SaveProviderRejectsDuplicateAndEmpty) {
    OpenCodeConfig config;
    std::string error;

    EXPECT_FALSE(config.save_provider("  ", ProviderConfig{}, true, error));
    EXPECT_EQ(error, "Provider name is required");

    ASSERT_TRUE(config.save_provider("relay", ProviderConfig{}, true, error));
    EXPECT_FALSE(config.save_provider("relay", ProviderConfig{}, true, error));
    EXPECT_NE(error.find("already exists"), std::string::npos);
}

TEST(OpenCodeConfigTest, SaveProviderKeepsExistingModels) {
    OpenCodeConfig config;
    std::string error;
    ASSERT_TRUE(config.save_provider("relay", ProviderConfig{}, true, error));
    ASSERT_TRUE(config.save_model("relay", "m1", ModelConfig{}, true, error));

    ProviderConfig edited;
    edited.name = "Relay";
    edited.base_url = " https://relay.example.com ";
    ASSERT_TRUE(config.save_provider("relay", edited, false, error));

    EXPECT_EQ(config.providers["relay"].name, "Relay");
    EXPECT_EQ(config.providers["relay"].base_url, "https://relay.example.com");
    EXPECT_EQ(config.providers["relay"].models.count("m1"), 1u);
}

TEST(OpenCodeConfigTest, ModelRefsAndCount) {
    OpenCodeConfig config;
    std::string error;
    ASSERT_TRUE(config.save_model("a", "m1", ModelConfig{}, true, error));
    ASSERT_TRUE(config.save_model("a", "m2", ModelConfig{}, true, error));
    ASSERT_TRUE(config.save_model("b", "m3", ModelConfig{}, true, error));

    EXPECT_EQ(config.model_count(), 3u);
    auto refs = config.model_refs();
    ASSERT_EQ(refs.size(), 3u);
    EXPECT_EQ(refs[0], "a/m1");
    EXPECT_EQ(refs[2], "b/m3");

    EXPECT_FALSE(config.save_model("a", "m1", ModelConfig{}, true, error));
    EXPECT_TRUE(config.remove_model("a", "m1"));
    EXPECT_FALSE(config.remove_model("missing", "m1"));
}

TEST(OpenCodeConfigTest, SaveModelTrimsProviderId) {
    OpenCodeConfig config;
    std::string error;
    ASSERT_TRUE(config.save_model(" relay ", "m1", ModelConfig{}, true, error)) << error;

    EXPECT_EQ(config.providers.count("relay"), 1u);
    EXPECT_EQ(config.providers.count(" relay "), 0u);
    EXPECT_EQ(config.model_refs(), std::vector<std::string>{"relay/m1"});
}

TEST(OpenCodeConfigTest, AddPresetModelsSkipsExisting) {
    OpenCodeConfig config;
    std::string error;
    ModelConfig mine;
    mine.name = "Mine";
    ASSERT_TRUE(config.save_model("anthropic", "claude-sonnet-4-20250514", mine, true, error));

    int added = config.add_preset_models("anthropic", "Claude",
                                         {"claude-sonnet-4-20250514", "claude-opus-4-5-20251101", "no-such-model"});

    EXPECT_EQ(added, 1);
    EXPECT_EQ(config.providers["anthropic"].npm, "@ai-sdk/anthropic");
    EXPECT_EQ(config.providers["anthropic"].models["claude-sonnet-4-20250514"].name, "Mine");
    EXPECT_EQ(config.providers["anthropic"].models.count("claude-opus-4-5-20251101"), 1u);
    EXPECT_EQ(config.add_preset_models("anthropic", "Unknown Series", {"x"}), 0);
}

TEST(OpenCodeConfigTest, LegacyMcpCommandWithArgs) {
    nlohmann::json j = {
        {"mcp", {
            {"fs", {{"command", "npx"}, {"args", {"-y", "@modelcontextprotocol/server-filesystem"}}}},
            {"web", {{"url", "https://mcp.example.com"}, {"headers", {{"Authorization", "Bearer x"}}}}}
        }}
    };

    auto config = OpenCodeConfig::from_json(j);

    const auto& fs_server = config.mcp["fs"];
    EXPECT_EQ(fs_server.type, McpType::Local);
    ASSERT_EQ(fs_server.command.size(), 3u);
    EXPECT_EQ(fs_server.command[0], "npx");
    EXPECT_EQ(fs_server.command[2], "@modelcontextprotocol/server-filesystem");

    const auto& web = config.mcp["web"];
    EXPECT_EQ(web.type, McpType::Remote);
    EXPECT_EQ(web.headers.at("Authorization"), "Bearer x");

    auto out = config.to_json();
    EXPECT_TRUE(out["mcp"]["fs"]["command"].is_array());
    EXPECT_FALSE(out["mcp"]["fs"].contains("args"));
    EXPECT_EQ(out["mcp"]["web"]["type"], "remote");
}

TEST(OpenCodeConfigTest, SaveMcpValidatesAndDefaultsTimeout) {
    OpenCodeConfig config;
    std::string error;

    McpServer remote;
    remote.type = McpType::Remote;
    EXPECT_FALSE(config.save_mcp("web", remote, true, error));
    EXPECT_EQ(error, "Remote MCP server requires a URL");

    remote.url = "https://mcp.example.com";
    ASSERT_TRUE(config.save_mcp("web", remote, true, error));
    EXPECT_EQ(config.mcp["web"].timeout, kDefaultMcpTimeoutMs);

    EXPECT_TRUE(config.set_mcp_enabled("web", false));
    EXPECT_FALSE(config.mcp["web"].enabled);
    EXPECT_FALSE(config.set_mcp_enabled("missing", true));
}

TEST(OpenCodeConfigTest, SaveAgentValidation) {
    OpenCodeConfig config;
    std::string error;

    AgentConfig agent;
    EXPECT_FALSE(config.save_agent("reviewer", agent, true, error));
    EXPECT_EQ(error, "Agent description is required");

    agent.description = "Reviews code";
    agent.temperature = 2.5;
    EXPECT_FALSE(config.save_agent("reviewer", agent, true, error));

    agent.temperature = 0.3;
    agent.max_steps = 0;
    ASSERT_TRUE(config.save_agent("reviewer", agent, true, error));

    const auto& saved = config.agents["reviewer"];
    EXPECT_EQ(saved.mode, "subagent");
    EXPECT_FALSE(saved.temperature.has_value());
    EXPECT_FALSE(saved.max_steps.has_value());

    agent.mode = "sidekick";
    EXPECT_FALSE(config.save_agent("other", agent, true, error));
}

TEST(OpenCodeConfigTest, AddPresetAgentsReplacesExisting) {
    OpenCodeConfig config;
    AgentConfig custom;
    custom.description = "custom plan";
    config.agents["plan"] = custom;

    int added = config.add_preset_agents({"plan", "code-reviewer", "not-a-preset"});

    EXPECT_EQ(added, 2);
    EXPECT_EQ(config.agents["plan"].mode, "primary");
    EXPECT_EQ(config.agents["plan"].permission["edit"], "ask");
    EXPECT_FALSE(config.agents["code-reviewer"].tools["write"]);
}

TEST(OpenCodeConfigTest, ToolPermissions) {
    OpenCodeConfig config;
    std::string error;

    EXPECT_FALSE(config.set_permission("bash", "maybe", error));
    ASSERT_TRUE(config.set_permission("bash", "ask", error));
    config.quick_allow("read");
    config.permission["edit"] = {{"*.md", "allow"}};
    config.permission["skill"] = "allow";

    auto tools = config.tool_permissions();
    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(tools[0].first, "bash");
    EXPECT_EQ(tools[0].second, "ask");
    EXPECT_EQ(tools[1].first, "edit");
    EXPECT_EQ(tools[2].second, "allow");

    EXPECT_TRUE(config.remove_permission("bash"));
    EXPECT_FALSE(config.remove_permission("bash"));
}

TEST(OpenCodeConfigTest, SkillPermissionsPromoteStringToObject) {
    OpenCodeConfig config;
    config.permission["skill"] = "ask";
    std::string error;

    ASSERT_TRUE(config.set_skill_permission("internal-*", "deny", error));

    auto skills = config.skill_permissions();
    ASSERT_EQ(skills.size(), 2u);
    EXPECT_EQ(skills["*"], "ask");
    EXPECT_EQ(skills["internal-*"], "deny");

    EXPECT_TRUE(config.remove_skill_permission("*"));
    EXPECT_TRUE(config.remove_skill_permission("internal-*"));
    EXPECT_EQ(config.permission.count("skill"), 0u);
}

TEST(OpenCodeConfigTest, InstructionsAreUnique) {
    OpenCodeConfig config;

    EXPECT_TRUE(config.add_instruction("AGENTS.md"));
    EXPECT_FALSE(config.add_instruction(" AGENTS.md "));
    EXPECT_FALSE(config.add_instruction(""));
    EXPECT_TRUE(config.remove_instruction("AGENTS.md"));
    EXPECT_TRUE(config.instructions.empty());
}

TEST(OpenCodeConfigTest, CompactionDefaults) {
    auto config = OpenCodeConfig::from_json({{"compaction", {{"auto", false}}}});

    ASSERT_TRUE(config.compaction.has_value());
    EXPECT_FALSE(config.compaction->auto_compact);
    EXPECT_TRUE(config.compaction->prune);
    EXPECT_TRUE(OpenCodeConfig{}.effective_compaction().auto_compact);
}
