#include <gtest/gtest.h>
#include "auth/provider_options_manager.h"

using namespace occm;

TEST(ProviderOptionsManagerTest, EnsureProviderUsesNativeTemplate) {
    OpenCodeConfig config;
    ProviderOptionsManager manager(config);

    EXPECT_FALSE(manager.is_configured("anthropic"));
    auto& provider = manager.ensure_provider("anthropic");

    EXPECT_TRUE(manager.is_configured("anthropic"));
    EXPECT_EQ(provider.npm, "@ai-sdk/anthropic");
    EXPECT_EQ(provider.name, "Anthropic");
}

TEST(ProviderOptionsManagerTest, EnsureProviderKeepsExisting) {
    OpenCodeConfig config;
    config.providers["openai"].name = "Custom";
    ProviderOptionsManager manager(config);

    EXPECT_EQ(manager.ensure_provider("openai").name, "Custom");
}

TEST(ProviderOptionsManagerTest, BaseUrlAndApiKeyMapToFields) {
    OpenCodeConfig config;
    ProviderOptionsManager manager(config);

    ASSERT_TRUE(manager.set_option("openai", "baseURL", " https://proxy.example.com/v1 "));
    ASSERT_TRUE(manager.set_option("openai", "apiKey", "{env:OPENAI_API_KEY}"));
    ASSERT_TRUE(manager.set_option("openai", "timeout", 120000));
    EXPECT_FALSE(manager.set_option("openai", "baseURL", 5));

    EXPECT_EQ(config.providers["openai"].base_url, "https://proxy.example.com/v1");

    auto options = manager.get_options("openai");
    EXPECT_EQ(options["baseURL"], "https://proxy.example.com/v1");
    EXPECT_EQ(options["apiKey"], "{env:OPENAI_API_KEY}");
    EXPECT_EQ(options["timeout"], 120000);

    EXPECT_TRUE(manager.remove_option("openai", "baseURL"));
    EXPECT_FALSE(manager.remove_option("openai", "baseURL"));
    EXPECT_TRUE(manager.remove_option("openai", "timeout"));
    EXPECT_FALSE(manager.get_options("openai").contains("timeout"));
}

TEST(ProviderOptionsManagerTest, ParseOptionValue) {
    OptionField number{"timeout", "Timeout", OptionKind::Number, "", ""};
    OptionField flag{"stream", "Stream", OptionKind::Bool, "", ""};
    OptionField text{"region", "Region", OptionKind::Text, "", ""};

    EXPECT_EQ(ProviderOptionsManager::parse_option_value(number, " 300000 "), 300000);
    EXPECT_EQ(ProviderOptionsManager::parse_option_value(number, "5m"), "5m");
    EXPECT_EQ(ProviderOptionsManager::parse_option_value(flag, "TRUE"), true);
    EXPECT_EQ(ProviderOptionsManager::parse_option_value(flag, "no"), false);
    EXPECT_EQ(ProviderOptionsManager::parse_option_value(text, " us-east-1 "), "us-east-1");
}
