#include <gtest/gtest.h>
#include "adapters/app_settings.h"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace occm;

class AppSettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "occm_settings_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    fs::path test_dir_;
};

TEST_F(AppSettingsTest, DefaultsWhenMissing) {
    AppSettingsStore store(test_dir_ / "settings.json");
    auto settings = store.load();

    EXPECT_EQ(settings.theme_mode, "system");
    EXPECT_TRUE(settings.check_updates);
    EXPECT_EQ(settings.backup_keep_count, 10);
}

TEST_F(AppSettingsTest, SaveAndLoad) {
    AppSettingsStore store(test_dir_ / "nested" / "settings.json");

    AppSettings settings;
    settings.theme_mode = "light";
    settings.check_updates = false;
    settings.backup_keep_count = 25;
    std::string error;
    ASSERT_TRUE(store.save(settings, error)) << error;

    auto loaded = store.load();
    EXPECT_EQ(loaded.theme_mode, "light");
    EXPECT_FALSE(loaded.check_updates);
    EXPECT_EQ(loaded.backup_keep_count, 25);
}

TEST_F(AppSettingsTest, InvalidValuesFallBack) {
    std::ofstream(test_dir_ / "settings.json")
        << R"({"theme_mode": "purple", "backup_keep_count": 500, "check_updates": "yes"})";

    auto settings = AppSettingsStore(test_dir_ / "settings.json").load();

    EXPECT_EQ(settings.theme_mode, "system");
    EXPECT_EQ(settings.backup_keep_count, 100);
    EXPECT_TRUE(settings.check_updates);
}
