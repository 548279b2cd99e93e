#include <gtest/gtest.h>
#include "adapters/backup_manager.h"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using namespace occm;

class BackupManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "occm_backup_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
        source_ = test_dir_ / "opencode.json";
        write(source_, "{\"model\": \"a/b\"}");
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    void write(const fs::path& path, const std::string& content) {
        std::ofstream file(path, std::ios::trunc);
        file << content;
    }

    std::string read(const fs::path& path) {
        std::ifstream file(path);
        std::stringstream ss;
        ss << file.rdbuf();
        return ss.str();
    }

    fs::path test_dir_;
    fs::path source_;
};

TEST_F(BackupManagerTest, ParseBackupName) {
    auto info = BackupManager::parse_backup_name("oh-my-opencode.20250101_120000_2.manual.bak");

    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->name, "oh-my-opencode");
    EXPECT_EQ(info->timestamp, "20250101_120000_2");
    EXPECT_EQ(info->tag, "manual");

    EXPECT_FALSE(BackupManager::parse_backup_name("opencode.json").has_value());
    EXPECT_FALSE(BackupManager::parse_backup_name("opencode.bak").has_value());
}

TEST_F(BackupManagerTest, MissingSourceIsNotBackedUp) {
    BackupManager manager(test_dir_ / "backups");
    EXPECT_FALSE(manager.backup(test_dir_ / "absent.json").has_value());
}

TEST_F(BackupManagerTest, CollidingTimestampsGetCounterSuffix) {
    BackupManager manager(test_dir_ / "backups");

    auto first = manager.backup(source_, "manual");
    auto second = manager.backup(source_, "manual");

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(*first, *second);
    EXPECT_EQ(manager.list_backups("opencode").size(), 2u);
}

TEST_F(BackupManagerTest, ListIsNewestFirstAndFiltersByName) {
    fs::create_directories(test_dir_ / "backups");
    write(test_dir_ / "backups" / "opencode.20250101_120000.auto.bak", "1");
    write(test_dir_ / "backups" / "opencode.20250102_120000.auto.bak", "2");
    write(test_dir_ / "backups" / "opencode.20250102_120000_1.auto.bak", "3");
    write(test_dir_ / "backups" / "oh-my-opencode.20250103_120000.manual.bak", "4");
    write(test_dir_ / "backups" / "notes.txt", "x");

    BackupManager manager(test_dir_ / "backups");
    auto backups = manager.list_backups("opencode");

    ASSERT_EQ(backups.size(), 3u);
    EXPECT_EQ(backups[0].timestamp, "20250102_120000_1");
    EXPECT_EQ(backups[1].timestamp, "20250102_120000");
    EXPECT_EQ(backups[2].timestamp, "20250101_120000");
    EXPECT_EQ(manager.list_backups().size(), 4u);
}

TEST_F(BackupManagerTest, RestoreBacksUpCurrentFileFirst) {
    BackupManager manager(test_dir_ / "backups");
    auto saved = manager.backup(source_, "manual");
    ASSERT_TRUE(saved.has_value());

    write(source_, "{\"model\": \"changed\"}");

    std::string error;
    ASSERT_TRUE(manager.restore(*saved, source_, error)) << error;
    EXPECT_EQ(read(source_), "{\"model\": \"a/b\"}");

    bool found_before_restore = false;
    for (const auto& b : manager.list_backups("opencode")) {
        if (b.tag == "before_restore") found_before_restore = true;
    }
    EXPECT_TRUE(found_before_restore);
}

TEST_F(BackupManagerTest, RestoreMissingBackupFails) {
    BackupManager manager(test_dir_ / "backups");
    std::string error;

    EXPECT_FALSE(manager.restore(test_dir_ / "backups" / "nope.bak", source_, error));
    EXPECT_NE(error.find("Backup not found"), std::string::npos);
}

TEST_F(BackupManagerTest, CleanupKeepsNewestOfTag) {
    fs::create_directories(test_dir_ / "backups");
    write(test_dir_ / "backups" / "opencode.20250101_000000.auto.bak", "");
    write(test_dir_ / "backups" / "opencode.20250102_000000.auto.bak", "");
    write(test_dir_ / "backups" / "opencode.20250103_000000.auto.bak", "");
    write(test_dir_ / "backups" / "opencode.20250101_000000.manual.bak", "");

    BackupManager manager(test_dir_ / "backups");
    EXPECT_EQ(manager.cleanup("opencode", 1, "auto"), 2);

    auto remaining = manager.list_backups("opencode");
    ASSERT_EQ(remaining.size(), 2u);
    EXPECT_EQ(remaining[0].timestamp, "20250103_000000");
    EXPECT_EQ(remaining[1].tag, "manual");
}
