#include <gtest/gtest.h>
#include "auth/native_providers.h"
#include <set>

using namespace occm;

TEST(NativeProvidersTest, IdsAreUnique) {
    std::set<std::string> ids;
    for (const auto& provider : native_providers()) {
        EXPECT_TRUE(ids.insert(provider.id).second) << provider.id;
        EXPECT_FALSE(provider.name.empty()) << provider.id;
        EXPECT_FALSE(provider.sdk.empty()) << provider.id;
    }
    EXPECT_GE(ids.size(), 10u);
}

TEST(NativeProvidersTest, FindAnthropic) {
    const auto* anthropic = find_native_provider("anthropic");
    ASSERT_NE(anthropic, nullptr);

    EXPECT_EQ(anthropic->sdk, "@ai-sdk/anthropic");
    ASSERT_FALSE(anthropic->env_vars.empty());
    EXPECT_EQ(anthropic->env_vars.front(), "ANTHROPIC_API_KEY");
    ASSERT_FALSE(anthropic->auth_fields.empty());
    EXPECT_EQ(anthropic->auth_fields.front().key, "key");
}

TEST(NativeProvidersTest, UnknownProvider) {
    EXPECT_EQ(find_native_provider("not-a-provider"), nullptr);
}
