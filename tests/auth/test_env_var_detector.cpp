#include <gtest/gtest.h>
#include "auth/env_var_detector.h"
#include <map>

using namespace occm;

namespace {

EnvVarDetector::Lookup fake_env(std::map<std::string, std::string> vars) {
    return [vars](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

}

TEST(EnvVarDetectorTest, DetectsAndMasks) {
    EnvVarDetector detector(fake_env({{"ANTHROPIC_API_KEY", "sk-ant-abcdefgh9876"}}));

    auto found = detector.detect("anthropic");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].variable, "ANTHROPIC_API_KEY");
    EXPECT_EQ(found[0].masked_value, "sk-a****9876");
    EXPECT_TRUE(detector.detect("openai").empty());
}

TEST(EnvVarDetectorTest, ValueForUsesFirstSetVariable) {
    EnvVarDetector detector(fake_env({{"GEMINI_API_KEY", "gemini-key-123"},
                                      {"GOOGLE_GENERATIVE_AI_API_KEY", ""}}));

    auto value = detector.value_for("google");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "gemini-key-123");
    EXPECT_FALSE(detector.value_for("unknown").has_value());
}

TEST(EnvVarDetectorTest, DetectAllSpansProviders) {
    EnvVarDetector detector(fake_env({{"OPENAI_API_KEY", "sk-openai-000000"},
                                      {"GROQ_API_KEY", "gsk_111111111"}}));

    auto found = detector.detect_all();
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0].provider_id, "openai");
    EXPECT_EQ(found[1].provider_id, "groq");
}
