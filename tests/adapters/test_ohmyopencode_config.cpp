#include <gtest/gtest.h>
#include "adapters/ohmyopencode_config.h"

using namespace occm;

TEST(OhMyOpenCodeConfigTest, FromJsonAgentsAndCategories) {
    nlohmann::json j = {
        {"$schema", "https://example.com/oh-my-opencode.schema.json"},
        {"agents", {{"oracle", {{"model", "openai/gpt-5"}, {"description", "Architect"}, {"color", "#fff"}}}}},
        {"categories", {{"visual", {{"model", "google/gemini-2.5-pro"}, {"temperature", 0.7}}}}}
    };

    auto config = OhMyOpenCodeConfig::from_json(j);

    ASSERT_EQ(config.agents.size(), 1u);
    EXPECT_EQ(config.agents["oracle"].model, "openai/gpt-5");
    EXPECT_EQ(config.agents["oracle"].extra["color"], "#fff");
    EXPECT_DOUBLE_EQ(config.categories["visual"].temperature, 0.7);

    auto out = config.to_json();
    EXPECT_EQ(out["$schema"], "https://example.com/oh-my-opencode.schema.json");
    EXPECT_EQ(out["agents"]["oracle"]["color"], "#fff");
}

TEST(OhMyOpenCodeConfigTest, EmptyConfigStillWritesAgents) {
    auto out = OhMyOpenCodeConfig{}.to_json();

    EXPECT_TRUE(out["agents"].is_object());
    EXPECT_FALSE(out.contains("categories"));
}

TEST(OhMyOpenCodeConfigTest, SaveAgentRequiresModel) {
    OhMyOpenCodeConfig config;
    std::string error;

    OhMyAgent agent;
    EXPECT_FALSE(config.save_agent("oracle", agent, true, error));
    EXPECT_EQ(error, "Select a model for the agent");

    agent.model = " openai/gpt-5 ";
    ASSERT_TRUE(config.save_agent("oracle", agent, true, error));
    EXPECT_EQ(config.agents["oracle"].model, "openai/gpt-5");
    EXPECT_FALSE(config.save_agent("oracle", agent, true, error));
}

TEST(OhMyOpenCodeConfigTest, CategoryTemperatureIsRounded) {
    OhMyOpenCodeConfig config;
    std::string error;

    Category category;
    category.model = "anthropic/claude-sonnet-4-5-20250929";
    category.temperature = 0.34;
    ASSERT_TRUE(config.save_category("analysis", category, true, error));
    EXPECT_DOUBLE_EQ(config.categories["analysis"].temperature, 0.3);

    category.temperature = 2.1;
    EXPECT_FALSE(config.save_category("hot", category, true, error));
}

TEST(OhMyOpenCodeConfigTest, PresetsUseChosenModel) {
    OhMyOpenCodeConfig config;
    std::string error;

    ASSERT_TRUE(config.add_preset_agent("oracle", "openai/gpt-5", error));
    EXPECT_EQ(config.agents["oracle"].model, "openai/gpt-5");
    EXPECT_FALSE(config.agents["oracle"].description.empty());

    ASSERT_TRUE(config.add_preset_category("business-logic", "openai/gpt-5", error));
    EXPECT_DOUBLE_EQ(config.categories["business-logic"].temperature, 0.1);

    EXPECT_FALSE(config.add_preset_agent("not-a-preset", "openai/gpt-5", error));
    EXPECT_FALSE(config.add_preset_category("oracle", "", error));
}

TEST(OhMyOpenCodeConfigTest, RoundTemperature) {
    EXPECT_DOUBLE_EQ(round_temperature(0.25), 0.3);
    EXPECT_DOUBLE_EQ(round_temperature(1.04), 1.0);
    EXPECT_DOUBLE_EQ(round_temperature(0.0), 0.0);
}
