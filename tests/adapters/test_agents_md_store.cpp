#include <gtest/gtest.h>
#include "adapters/agents_md_store.h"
#include <filesystem>

namespace fs = std::filesystem;
using namespace occm;

class AgentsMdStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_ = fs::temp_directory_path() / "occm_agents_md";
        fs::remove_all(base_);
        fs::create_directories(base_ / "home");
        fs::create_directories(base_ / "project");
    }

    void TearDown() override {
        fs::remove_all(base_);
    }

    fs::path base_;
};

TEST_F(AgentsMdStoreTest, MissingFileReadsEmpty) {
    AgentsMdStore store(ConfigPaths(base_ / "home", base_ / "project"));
    std::string error;

    auto content = store.read(RulesScope::Global, error);
    ASSERT_TRUE(content.has_value());
    EXPECT_TRUE(content->empty());
    EXPECT_TRUE(error.empty());
}

TEST_F(AgentsMdStoreTest, WriteEachScope) {
    AgentsMdStore store(ConfigPaths(base_ / "home", base_ / "project"));
    std::string error;

    ASSERT_TRUE(store.write(RulesScope::Global, "# Global\n", error)) << error;
    ASSERT_TRUE(store.write(RulesScope::Project, AgentsMdStore::template_text(), error));

    EXPECT_EQ(*store.read(RulesScope::Global, error), "# Global\n");
    EXPECT_TRUE(fs::exists(base_ / "home" / ".config" / "opencode" / "AGENTS.md"));
    EXPECT_TRUE(fs::exists(base_ / "project" / "AGENTS.md"));
    EXPECT_NE(store.read(RulesScope::Project, error)->find("# Project Rules"), std::string::npos);
}
