#include <gtest/gtest.h>
#include "auth/auth_manager.h"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace occm;

class AuthManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "occm_auth_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
        auth_path_ = test_dir_ / "opencode" / "auth.json";
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    fs::path test_dir_;
    fs::path auth_path_;
};

TEST_F(AuthManagerTest, MissingFileReadsEmpty) {
    AuthManager auth(auth_path_);

    EXPECT_TRUE(auth.read().empty());
    EXPECT_FALSE(auth.get("anthropic").has_value());
    EXPECT_TRUE(auth.providers().empty());
}

TEST_F(AuthManagerTest, SetGetRemove) {
    AuthManager auth(auth_path_);
    std::string error;

    ASSERT_TRUE(auth.set("anthropic", " sk-ant-1234567890 ", error)) << error;
    ASSERT_TRUE(auth.set("openai", "sk-openai-abcdef", error));

    auto record = auth.get("anthropic");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->type, "api");
    EXPECT_EQ(record->key, "sk-ant-1234567890");

    auto ids = auth.providers();
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(ids[0], "anthropic");

    ASSERT_TRUE(auth.remove("anthropic", error));
    EXPECT_FALSE(auth.get("anthropic").has_value());
    EXPECT_FALSE(auth.remove("anthropic", error));
    EXPECT_EQ(error, "No credentials for anthropic");
}

TEST_F(AuthManagerTest, PreservesOtherEntries) {
    fs::create_directories(auth_path_.parent_path());
    std::ofstream(auth_path_) << R"({"github-copilot": {"type": "oauth", "refresh": "r", "access": "a"}})";

    AuthManager auth(auth_path_);
    std::string error;
    ASSERT_TRUE(auth.set("groq", "gsk_0123456789", error));

    auto data = auth.read();
    EXPECT_EQ(data["github-copilot"]["type"], "oauth");
    EXPECT_EQ(data["github-copilot"]["refresh"], "r");
    EXPECT_EQ(data["groq"]["key"], "gsk_0123456789");
}

TEST_F(AuthManagerTest, LegacyApiKeyEntry) {
    fs::create_directories(auth_path_.parent_path());
    std::ofstream(auth_path_) << R"({"deepseek": {"apiKey": "sk-legacy-key"}})";

    auto record = AuthManager(auth_path_).get("deepseek");

    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->type, "api");
    EXPECT_EQ(record->key, "sk-legacy-key");
}

TEST_F(AuthManagerTest, EmptyProviderIdRejected) {
    std::string error;
    EXPECT_FALSE(AuthManager(auth_path_).set("  ", "key", error));
    EXPECT_EQ(error, "Provider ID is required");
}

TEST_F(AuthManagerTest, ProviderIdIsTrimmedEverywhere) {
    AuthManager auth(auth_path_);
    std::string error;
    ASSERT_TRUE(auth.set(" openai ", "sk-test-abcdefgh", error)) << error;

    ASSERT_TRUE(auth.get(" openai").has_value());
    EXPECT_EQ(auth.get("openai ")->key, "sk-test-abcdefgh");
    EXPECT_TRUE(auth.remove(" openai ", error)) << error;
    EXPECT_FALSE(auth.get("openai").has_value());
}

#if !defined(_WIN32)
TEST_F(AuthManagerTest, FileIsOwnerOnly) {
    AuthManager auth(auth_path_);
    std::string error;
    ASSERT_TRUE(auth.set("anthropic", "sk-ant-1234567890", error));

    auto perms = fs::status(auth_path_).permissions();
    EXPECT_EQ(perms & (fs::perms::group_all | fs::perms::others_all), fs::perms::none);
}

TEST_F(AuthManagerTest, RewriteOfReadableFileBecomesOwnerOnly) {
    fs::create_directories(auth_path_.parent_path());
    std::ofstream(auth_path_) << R"({"openai": {"type": "api", "key": "sk-old"}})";
    fs::permissions(auth_path_, fs::perms::owner_read | fs::perms::owner_write |
                                fs::perms::group_read | fs::perms::others_read,
                    fs::perm_options::replace);

    AuthManager auth(auth_path_);
    std::string error;
    ASSERT_TRUE(auth.set("anthropic", "sk-ant-1234567890", error)) << error;

    auto perms = fs::status(auth_path_).permissions();
    EXPECT_EQ(perms & (fs::perms::group_all | fs::perms::others_all), fs::perms::none);
    EXPECT_FALSE(fs::exists(auth_path_.string() + ".tmp"));
    EXPECT_EQ(auth.get("openai")->key, "sk-old");
}
#endif

TEST(MaskApiKeyTest, Masks) {
    EXPECT_EQ(mask_api_key(""), "");
    EXPECT_EQ(mask_api_key("short"), "****");
    EXPECT_EQ(mask_api_key("sk-abcdefgh1234"), "sk-a****1234");
}
