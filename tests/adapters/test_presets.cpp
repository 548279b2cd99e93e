#include <gtest/gtest.h>
#include "adapters/presets.h"

using namespace occm;

TEST(PresetsTest, ModelSeriesLookup) {
    const auto* claude = find_model_series("Claude");
    ASSERT_NE(claude, nullptr);
    EXPECT_EQ(claude->sdk, "@ai-sdk/anthropic");
    EXPECT_FALSE(claude->models.empty());
    EXPECT_EQ(find_model_series("Nope"), nullptr);
}

TEST(PresetsTest, ThinkingModelCarriesVariants) {
    const auto* opus = find_model_preset("Claude", "claude-opus-4-5-20251101");
    ASSERT_NE(opus, nullptr);

    EXPECT_TRUE(opus->config.options.contains("thinking"));
    EXPECT_TRUE(opus->config.variants.contains("high"));
    ASSERT_TRUE(opus->config.limit.has_value());
    EXPECT_EQ(opus->config.limit->context, 200000);
}

TEST(PresetsTest, EveryModelHasAnId) {
    for (const auto& series : model_series_presets()) {
        EXPECT_FALSE(series.sdk.empty()) << series.name;
        for (const auto& model : series.models) {
            EXPECT_FALSE(model.id.empty()) << series.name;
            EXPECT_FALSE(model.config.name.empty()) << model.id;
        }
    }
}

TEST(PresetsTest, AgentAndCategoryPresets) {
    const auto* plan = find_opencode_agent_preset("plan");
    ASSERT_NE(plan, nullptr);
    EXPECT_EQ(plan->mode, "primary");

    EXPECT_NE(find_ohmy_agent_preset("oracle"), nullptr);

    const auto* logic = find_category_preset("business-logic");
    ASSERT_NE(logic, nullptr);
    EXPECT_DOUBLE_EQ(logic->temperature, 0.1);
}
