#include <gtest/gtest.h>
#include "skills/skill_discovery.h"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace occm;

class SkillDiscoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        home_ = fs::temp_directory_path() / "occm_skill_home";
        project_ = fs::temp_directory_path() / "occm_skill_project";
        fs::remove_all(home_);
        fs::remove_all(project_);
        fs::create_directories(home_);
        fs::create_directories(project_);
    }

    void TearDown() override {
        fs::remove_all(home_);
        fs::remove_all(project_);
    }

    void write_skill(const fs::path& dir, const std::string& content) {
        fs::create_directories(dir);
        std::ofstream file(dir / "SKILL.md");
        file << content;
    }

    fs::path home_;
    fs::path project_;
};

TEST(SkillNameTest, Validation) {
    EXPECT_TRUE(is_valid_skill_name("git-release"));
    EXPECT_TRUE(is_valid_skill_name("pdf2text"));
    EXPECT_FALSE(is_valid_skill_name(""));
    EXPECT_FALSE(is_valid_skill_name("Git-Release"));
    EXPECT_FALSE(is_valid_skill_name("double--hyphen"));
    EXPECT_FALSE(is_valid_skill_name("-leading"));
    EXPECT_FALSE(is_valid_skill_name("trailing-"));
    EXPECT_FALSE(is_valid_skill_name(std::string(65, 'a')));
}

TEST(FrontMatterTest, ParsesFieldsAndBody) {
    auto front = parse_front_matter("---\nname: git-release\ndescription: \"Cut a release\"\n---\n\n## Steps\n");

    EXPECT_EQ(front.fields["name"], "git-release");
    EXPECT_EQ(front.fields["description"], "Cut a release");
    EXPECT_EQ(front.body, "## Steps\n");
}

TEST(FrontMatterTest, MissingOrUnclosedFrontMatter) {
    auto plain = parse_front_matter("# Just markdown\n");
    EXPECT_TRUE(plain.fields.empty());
    EXPECT_EQ(plain.body, "# Just markdown\n");

    auto unclosed = parse_front_matter("---\nname: x\nbody without end\n");
    EXPECT_TRUE(unclosed.fields.empty());
}

TEST_F(SkillDiscoveryTest, DiscoversAllRootsSortedByName) {
    ConfigPaths paths(home_, project_);
    write_skill(paths.global_skill_dir() / "zeta", "---\nname: zeta\ndescription: Last\n---\n");
    write_skill(paths.project_skill_dir() / "alpha", "---\nname: alpha\ndescription: First\n---\n");
    write_skill(paths.claude_global_skill_dir() / "middle", "no front matter\n");
    fs::create_directories(paths.global_skill_dir() / "empty-dir");

    auto skills = SkillDiscovery(paths).discover();

    ASSERT_EQ(skills.size(), 3u);
    EXPECT_EQ(skills[0].name, "alpha");
    EXPECT_EQ(skills[0].source, SkillSource::OpenCodeProject);
    EXPECT_EQ(skills[1].name, "middle");
    EXPECT_EQ(skills[1].source, SkillSource::ClaudeGlobal);
    EXPECT_TRUE(skills[1].description.empty());
    EXPECT_EQ(skills[2].description, "Last");
}

TEST_F(SkillDiscoveryTest, NoRootsNoSkills) {
    EXPECT_TRUE(SkillDiscovery(ConfigPaths(home_, project_)).discover().empty());
}
