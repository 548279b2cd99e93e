#include <gtest/gtest.h>
#include "core/config_paths.h"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace occm;

class ConfigPathsTest : public ::testing::Test {
protected:
    void SetUp() override {
        home_ = fs::temp_directory_path() / "occm_paths_home";
        project_ = fs::temp_directory_path() / "occm_paths_project";
        fs::remove_all(home_);
        fs::remove_all(project_);
        fs::create_directories(home_ / ".config" / "opencode");
        fs::create_directories(project_);
    }

    void TearDown() override {
        fs::remove_all(home_);
        fs::remove_all(project_);
    }

    fs::path home_;
    fs::path project_;
};

TEST_F(ConfigPathsTest, DefaultsToJsonWhenNoJsoncExists) {
    ConfigPaths paths(home_, project_);

    EXPECT_EQ(paths.opencode_config(), home_ / ".config" / "opencode" / "opencode.json");
    EXPECT_EQ(paths.ohmyopencode_config(), home_ / ".config" / "opencode" / "oh-my-opencode.json");
}

TEST_F(ConfigPathsTest, PrefersJsoncWhenPresent) {
    std::ofstream(home_ / ".config" / "opencode" / "opencode.jsonc") << "{}";
    ConfigPaths paths(home_, project_);

    EXPECT_EQ(paths.opencode_config().filename(), "opencode.jsonc");
    EXPECT_EQ(paths.ohmyopencode_config().filename(), "oh-my-opencode.json");
}

TEST_F(ConfigPathsTest, AuthFileFollowsDataHome) {
    ConfigPaths paths(home_, project_);
    EXPECT_EQ(paths.auth_file(), home_ / ".local" / "share" / "opencode" / "auth.json");

    paths.set_data_home(home_ / "data");
    EXPECT_EQ(paths.auth_file(), home_ / "data" / "opencode" / "auth.json");
}

TEST_F(ConfigPathsTest, SkillAndAgentsLocations) {
    ConfigPaths paths(home_, project_);

    EXPECT_EQ(paths.global_skill_dir(), home_ / ".config" / "opencode" / "skill");
    EXPECT_EQ(paths.project_skill_dir(), project_ / ".opencode" / "skill");
    EXPECT_EQ(paths.claude_global_skill_dir(), home_ / ".claude" / "skills");
    EXPECT_EQ(paths.global_agents_md(), home_ / ".config" / "opencode" / "AGENTS.md");
    EXPECT_EQ(paths.project_agents_md(), project_ / "AGENTS.md");
    EXPECT_EQ(paths.backup_dir(), home_ / ".config" / "opencode" / "backups");
}
