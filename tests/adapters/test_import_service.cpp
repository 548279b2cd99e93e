#include <gtest/gtest.h>
#include "adapters/import_service.h"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace occm;

class ImportServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        home_ = fs::temp_directory_path() / "occm_import_home";
        fs::remove_all(home_);
        fs::create_directories(home_);
    }

    void TearDown() override {
        fs::remove_all(home_);
    }

    void write(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream file(path);
        file << content;
    }

    fs::path home_;
};

TEST_F(ImportServiceTest, ScanReportsAllSources) {
    write(home_ / ".claude" / "settings.json", R"({"apiKey": "sk-ant-xyz"})");
    write(home_ / ".codex" / "config.toml", "model = \"o3\"\n[model_providers.azure]\nname = \"Azure\"\n");

    ImportService service(ConfigPaths(home_, home_));
    auto sources = service.scan();

    ASSERT_EQ(sources.size(), 5u);
    EXPECT_TRUE(sources[0].exists);
    ASSERT_TRUE(sources[0].data.has_value());
    EXPECT_EQ((*sources[0].data)["apiKey"], "sk-ant-xyz");

    EXPECT_EQ(sources[2].type, ImportSourceType::Codex);
    ASSERT_TRUE(sources[2].data.has_value()) << sources[2].error;
    EXPECT_EQ((*sources[2].data)["model_providers"]["azure"]["name"], "Azure");

    EXPECT_FALSE(sources[3].exists);
    EXPECT_FALSE(sources[3].data.has_value());
}

TEST_F(ImportServiceTest, MalformedTomlReportsError) {
    write(home_ / ".codex" / "config.toml", "model = \n");

    std::string error;
    auto data = ImportService::read_toml_as_json(home_ / ".codex" / "config.toml", error);

    EXPECT_FALSE(data.has_value());
    EXPECT_NE(error.find("TOML parse error"), std::string::npos);
}

TEST_F(ImportServiceTest, ConvertClaudeSettings) {
    nlohmann::json data = {
        {"apiKey", "sk-ant-xyz"},
        {"permissions", {
            {"allow", {"Bash(npm run:*)", "Read"}},
            {"deny", {"WebFetch"}},
            {"defaultMode", "acceptEdits"}
        }}
    };

    auto converted = ImportService::convert(ImportSourceType::Claude, data);

    EXPECT_EQ(converted["provider"]["anthropic"]["npm"], "@ai-sdk/anthropic");
    EXPECT_EQ(converted["provider"]["anthropic"]["options"]["apiKey"], "sk-ant-xyz");
    EXPECT_EQ(converted["permission"]["bash"], "allow");
    EXPECT_EQ(converted["permission"]["read"], "allow");
    EXPECT_EQ(converted["permission"]["webfetch"], "deny");
    EXPECT_FALSE(converted["permission"].contains("defaultMode"));
}

TEST_F(ImportServiceTest, ConvertCodexUsesEnvReference) {
    nlohmann::json data = {
        {"model_providers", {{"azure", {{"name", "Azure"}, {"base_url", "https://x.openai.azure.com"},
                                        {"env_key", "AZURE_OPENAI_API_KEY"}}}}}
    };

    auto converted = ImportService::convert(ImportSourceType::Codex, data);
    const auto& azure = converted["provider"]["azure"];

    EXPECT_EQ(azure["npm"], "@ai-sdk/openai-compatible");
    EXPECT_EQ(azure["options"]["baseURL"], "https://x.openai.azure.com");
    EXPECT_EQ(azure["options"]["apiKey"], "{env:AZURE_OPENAI_API_KEY}");
}

TEST_F(ImportServiceTest, ConvertCcSwitchGuessesSdk) {
    nlohmann::json data = {
        {"providers", {
            {"claude-relay", {{"baseUrl", "https://relay.example.com"}, {"apiKey", "k1"}}},
            {"gemini-proxy", {{"base_url", "https://g.example.com"}, {"api_key", "k2"}}},
            {"other", {{"name", "Other"}}}
        }}
    };

    auto converted = ImportService::convert(ImportSourceType::CcSwitch, data);

    EXPECT_EQ(converted["provider"]["claude-relay"]["npm"], "@ai-sdk/anthropic");
    EXPECT_EQ(converted["provider"]["gemini-proxy"]["npm"], "@ai-sdk/google");
    EXPECT_EQ(converted["provider"]["gemini-proxy"]["options"]["apiKey"], "k2");
    EXPECT_EQ(converted["provider"]["other"]["npm"], "@ai-sdk/openai");
    EXPECT_EQ(converted["provider"]["other"]["name"], "Other");
}

TEST_F(ImportServiceTest, MergeSkipsExistingUnlessOverwrite) {
    OpenCodeConfig config;
    config.providers["anthropic"].name = "Mine";
    config.permission["bash"] = "deny";

    nlohmann::json converted = {
        {"provider", {
            {"anthropic", {{"npm", "@ai-sdk/anthropic"}, {"name", "Imported"}}},
            {"google", {{"npm", "@ai-sdk/google"}, {"options", {{"apiKey", "g"}}}}}
        }},
        {"permission", {{"bash", "allow"}, {"read", "allow"}}}
    };

    auto result = ImportService::merge(config, converted, false);

    ASSERT_EQ(result.added.size(), 1u);
    EXPECT_EQ(result.added[0], "google");
    ASSERT_EQ(result.skipped.size(), 1u);
    EXPECT_EQ(config.providers["anthropic"].name, "Mine");
    EXPECT_EQ(config.providers["google"].api_key, "g");
    EXPECT_EQ(result.permissions, 1);
    EXPECT_EQ(config.permission["bash"], "deny");

    result = ImportService::merge(config, converted, true);
    EXPECT_EQ(result.added.size(), 2u);
    EXPECT_EQ(config.providers["anthropic"].name, "Imported");
}
