#include <gtest/gtest.h>
#include "core/jsonc.h"

using namespace occm;

TEST(JsoncTest, PlainJsonParses) {
    std::string error;
    auto j = parse_jsonc(R"({"model": "anthropic/claude-sonnet-4"})", error);

    ASSERT_TRUE(j.has_value());
    EXPECT_TRUE(error.empty());
    EXPECT_EQ((*j)["model"], "anthropic/claude-sonnet-4");
}

TEST(JsoncTest, LineAndBlockCommentsAreStripped) {
    const std::string text = R"({
  // default model
  "model": "openai/gpt-4o", /* trailing */
  "small_model": "openai/gpt-4o-mini"
})";

    std::string error;
    auto j = parse_jsonc(text, error);

    ASSERT_TRUE(j.has_value()) << error;
    EXPECT_EQ((*j)["model"], "openai/gpt-4o");
    EXPECT_EQ((*j)["small_model"], "openai/gpt-4o-mini");
}

TEST(JsoncTest, CommentMarkersInsideStringsSurvive) {
    const std::string text = R"({"baseURL": "https://api.example.com/v1", "note": "a /* b */ c"} // done)";

    std::string error;
    auto j = parse_jsonc(text, error);

    ASSERT_TRUE(j.has_value()) << error;
    EXPECT_EQ((*j)["baseURL"], "https://api.example.com/v1");
    EXPECT_EQ((*j)["note"], "a /* b */ c");
}

TEST(JsoncTest, EscapedQuoteDoesNotEndString) {
    const std::string cleaned = strip_jsonc_comments(R"({"a": "say \"//hi\""} // x)");
    EXPECT_EQ(cleaned, R"({"a": "say \"//hi\""} )");
}

TEST(JsoncTest, UnterminatedBlockCommentSwallowsRest) {
    EXPECT_EQ(strip_jsonc_comments("{} /* never closed"), "{} ");
}

TEST(JsoncTest, MalformedInputReportsError) {
    std::string error;
    auto j = parse_jsonc("{\"model\": ", error);

    EXPECT_FALSE(j.has_value());
    EXPECT_FALSE(error.empty());
}
