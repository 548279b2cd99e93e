#include <gtest/gtest.h>
#include "skills/skill_installer.h"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace occm;

class SkillInstallerTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_ = fs::temp_directory_path() / "occm_skill_installer";
        fs::remove_all(base_);
        fs::create_directories(base_ / "home");
        fs::create_directories(base_ / "project");
    }

    void TearDown() override {
        fs::remove_all(base_);
    }

    ConfigPaths paths() const { return ConfigPaths(base_ / "home", base_ / "project"); }

    fs::path base_;
};

TEST_F(SkillInstallerTest, CreateWritesFrontMatter) {
    SkillInstaller installer(paths());
    std::string error;

    auto path = installer.create("git-release", "Cut a release", "", SkillScope::Project, error);

    ASSERT_TRUE(path.has_value()) << error;
    EXPECT_EQ(*path, base_ / "project" / ".opencode" / "skill" / "git-release" / "SKILL.md");

    SkillInfo info;
    ASSERT_TRUE(SkillDiscovery::read_skill(*path, SkillSource::OpenCodeProject, info));
    EXPECT_EQ(info.name, "git-release");
    EXPECT_EQ(info.description, "Cut a release");
}

TEST_F(SkillInstallerTest, CreateValidatesInput) {
    SkillInstaller installer(paths());
    std::string error;

    EXPECT_FALSE(installer.create("", "desc", "", SkillScope::Global, error).has_value());
    EXPECT_EQ(error, "Skill name is required");
    EXPECT_FALSE(installer.create("ok-name", " ", "", SkillScope::Global, error).has_value());
    EXPECT_EQ(error, "Skill description is required");
    EXPECT_FALSE(installer.create("Bad Name", "desc", "", SkillScope::Global, error).has_value());
}

TEST_F(SkillInstallerTest, RenderUsesDefaultBodyWhenEmpty) {
    auto text = SkillInstaller::render_skill("demo", "Demo skill", "   ");

    EXPECT_EQ(text.rfind("---\nname: demo\ndescription: Demo skill\n---\n\n", 0), 0u);
    EXPECT_NE(text.find("## Instructions"), std::string::npos);
}

TEST_F(SkillInstallerTest, InstallFromDirectoryCopiesTree) {
    const fs::path source = base_ / "download" / "some-folder";
    fs::create_directories(source / "scripts");
    std::ofstream(source / "SKILL.md") << "---\nname: pdf-tools\ndescription: PDF helpers\n---\nBody\n";
    std::ofstream(source / "scripts" / "run.sh") << "echo hi\n";

    SkillInstaller installer(paths());
    std::string error;
    auto installed = installer.install_from_directory(source, SkillScope::Global, error);

    ASSERT_TRUE(installed.has_value()) << error;
    const fs::path target = paths().global_skill_dir() / "pdf-tools";
    EXPECT_TRUE(fs::exists(target / "SKILL.md"));
    EXPECT_TRUE(fs::exists(target / "scripts" / "run.sh"));

    EXPECT_FALSE(installer.install_from_directory(source, SkillScope::Global, error).has_value());
    EXPECT_NE(error.find("already installed"), std::string::npos);
}

TEST_F(SkillInstallerTest, InstallRequiresSkillMd) {
    fs::create_directories(base_ / "empty");
    std::string error;

    EXPECT_FALSE(SkillInstaller(paths()).install_from_directory(base_ / "empty", SkillScope::Global, error));
    EXPECT_NE(error.find("No SKILL.md"), std::string::npos);
}

TEST_F(SkillInstallerTest, RemoveDeletesDirectory) {
    SkillInstaller installer(paths());
    std::string error;
    ASSERT_TRUE(installer.create("temp-skill", "Temporary", "", SkillScope::Global, error));

    EXPECT_TRUE(installer.remove("temp-skill", SkillScope::Global, error)) << error;
    EXPECT_FALSE(fs::exists(paths().global_skill_dir() / "temp-skill"));
    EXPECT_FALSE(installer.remove("temp-skill", SkillScope::Global, error));
    EXPECT_FALSE(installer.remove("../escape", SkillScope::Global, error));
}
