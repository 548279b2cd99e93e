#include <gtest/gtest.h>
#include "adapters/config_validator.h"
#include <algorithm>

using namespace occm;

namespace {

bool has_issue(const std::vector<ValidationIssue>& issues, const std::string& path, IssueSeverity severity) {
    return std::any_of(issues.begin(), issues.end(), [&](const ValidationIssue& issue) {
        return issue.path == path && issue.severity == severity;
    });
}

}

TEST(ConfigValidatorTest, CleanConfigHasNoErrors) {
    nlohmann::json config = {
        {"$schema", "https://opencode.ai/config.json"},
        {"provider", {{"relay", {
            {"npm", "@ai-sdk/openai-compatible"},
            {"options", {{"baseURL", "https://relay.example.com:8443/v1"}}},
            {"models", {{"m1", {{"limit", {{"context", 128000}, {"output", 8192}}}}}}}
        }}}},
        {"agent", {{"review", {{"description", "Reviews"}, {"mode", "subagent"}, {"model", "relay/m1"}}}}},
        {"permission", {{"bash", "ask"}, {"edit", {{"*.md", "allow"}}}}}
    };

    auto issues = ConfigValidator::validate(config);
    EXPECT_TRUE(issues.empty());
    EXPECT_EQ(ConfigValidator::error_count(issues), 0u);
}

TEST(ConfigValidatorTest, NonObjectRoot) {
    auto issues = ConfigValidator::validate(nlohmann::json::array());
    ASSERT_EQ(issues.size(), 1u);
    EXPECT_EQ(issues[0].severity, IssueSeverity::Error);
}

TEST(ConfigValidatorTest, ProviderProblems) {
    nlohmann::json config = {
        {"$schema", "https://opencode.ai/config.json"},
        {"provider", {
            {"bad-url", {{"npm", "@ai-sdk/openai"}, {"options", {{"baseURL", "ftp://nope"}}}, {"models", {}}}},
            {"bare", nlohmann::json::object()},
            {"bad-limit", {{"npm", "x"}, {"options", {}}, {"models", {{"m", {{"limit", {{"context", "big"}}}}}}}}}
        }}
    };

    auto issues = ConfigValidator::validate(config);

    EXPECT_TRUE(has_issue(issues, "provider.bad-url.options.baseURL", IssueSeverity::Error));
    EXPECT_TRUE(has_issue(issues, "provider.bare.npm", IssueSeverity::Warning));
    EXPECT_TRUE(has_issue(issues, "provider.bare.options", IssueSeverity::Warning));
    EXPECT_TRUE(has_issue(issues, "provider.bare.models", IssueSeverity::Warning));
    EXPECT_TRUE(has_issue(issues, "provider.bad-limit.models.m.limit.context", IssueSeverity::Error));
}

TEST(ConfigValidatorTest, McpAgentAndPermissionProblems) {
    nlohmann::json config = {
        {"mcp", {
            {"remote-no-url", {{"type", "remote"}}},
            {"local-no-cmd", {{"type", "local"}, {"enabled", "yes"}}}
        }},
        {"agent", {{"x", {{"mode", "boss"}, {"temperature", 3}, {"model", "ghost/model"}}}}},
        {"permission", {{"bash", "sometimes"}}}
    };

    auto issues = ConfigValidator::validate(config);

    EXPECT_TRUE(has_issue(issues, "$schema", IssueSeverity::Warning));
    EXPECT_TRUE(has_issue(issues, "mcp.remote-no-url.url", IssueSeverity::Error));
    EXPECT_TRUE(has_issue(issues, "mcp.local-no-cmd.command", IssueSeverity::Error));
    EXPECT_TRUE(has_issue(issues, "mcp.local-no-cmd.enabled", IssueSeverity::Error));
    EXPECT_TRUE(has_issue(issues, "agent.x.description", IssueSeverity::Warning));
    EXPECT_TRUE(has_issue(issues, "agent.x.mode", IssueSeverity::Error));
    EXPECT_TRUE(has_issue(issues, "agent.x.temperature", IssueSeverity::Error));
    EXPECT_TRUE(has_issue(issues, "agent.x.model", IssueSeverity::Warning));
    EXPECT_TRUE(has_issue(issues, "permission.bash", IssueSeverity::Error));
}

TEST(ConfigValidatorTest, BaseUrlPattern) {
    EXPECT_TRUE(ConfigValidator::is_valid_base_url("https://api.example.com"));
    EXPECT_TRUE(ConfigValidator::is_valid_base_url("http://localhost:11434/v1"));
    EXPECT_FALSE(ConfigValidator::is_valid_base_url("api.example.com"));
    EXPECT_FALSE(ConfigValidator::is_valid_base_url("https://"));
}

TEST(ConfigValidatorTest, FixRepairsStructure) {
    nlohmann::json config = {
        {"provider", {{"relay", {{"models", {{"m1", {}}}}}}}},
        {"mcp", {{"web", {{"url", "https://mcp.example.com"}}}}},
        {"agent", "oops"},
        {"permission", {{"bash", "sometimes"}, {"edit", {{"*", "allow"}, {"x", "nope"}}}}},
        {"instructions", "AGENTS.md"}
    };

    auto fixes = ConfigValidator::fix(config);

    EXPECT_FALSE(fixes.empty());
    EXPECT_EQ(config["$schema"], "https://opencode.ai/config.json");
    EXPECT_TRUE(config["provider"]["relay"]["options"].is_object());
    EXPECT_EQ(config["provider"]["relay"]["models"]["m1"]["name"], "m1");
    EXPECT_EQ(config["mcp"]["web"]["type"], "remote");
    EXPECT_TRUE(config["agent"].is_object());
    EXPECT_FALSE(config["permission"].contains("bash"));
    EXPECT_FALSE(config["permission"]["edit"].contains("x"));
    EXPECT_TRUE(config["instructions"].is_array());

    EXPECT_EQ(ConfigValidator::error_count(ConfigValidator::validate(config)), 0u);
}
