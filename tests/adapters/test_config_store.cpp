#include <gtest/gtest.h>
#include "adapters/config_exporter.h"
#include "adapters/config_store.h"
#include "core/json_file.h"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace occm;

class ConfigStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        home_ = fs::temp_directory_path() / "occm_store_home";
        fs::remove_all(home_);
        fs::create_directories(home_ / ".config" / "opencode");
    }

    void TearDown() override {
        fs::remove_all(home_);
    }

    ConfigPaths paths() const { return ConfigPaths(home_, home_ / "project"); }

    fs::path opencode_dir() const { return home_ / ".config" / "opencode"; }

    fs::path home_;
};

TEST_F(ConfigStoreTest, MissingFilesLoadEmpty) {
    ConfigStore store(paths());

    EXPECT_TRUE(store.load());
    EXPECT_TRUE(store.last_error().empty());
    EXPECT_TRUE(store.opencode().providers.empty());
    EXPECT_TRUE(store.ohmyopencode().agents.empty());
}

TEST_F(ConfigStoreTest, MalformedFileSetsLastError) {
    std::ofstream(opencode_dir() / "opencode.json") << "{ broken";
    ConfigStore store(paths());

    EXPECT_FALSE(store.load());
    EXPECT_NE(store.last_error().find("Malformed JSON"), std::string::npos);
    EXPECT_TRUE(store.opencode().providers.empty());
}

TEST_F(ConfigStoreTest, LoadsJsoncVariant) {
    std::ofstream(opencode_dir() / "opencode.jsonc")
        << "{\n  // relay\n  \"provider\": {\"relay\": {\"models\": {\"m1\": {}}}}\n}\n";
    ConfigStore store(paths());

    ASSERT_TRUE(store.load()) << store.last_error();
    EXPECT_EQ(store.opencode_path().filename(), "opencode.jsonc");
    EXPECT_EQ(store.stats().models, 1u);
}

TEST_F(ConfigStoreTest, SaveWritesFileAndBacksUpPrevious) {
    ConfigStore store(paths());
    store.load();

    store.opencode().model = "relay/m1";
    ASSERT_TRUE(store.save_opencode()) << store.last_error();
    EXPECT_TRUE(store.backups().list_backups("opencode").empty());

    store.opencode().model = "relay/m2";
    ASSERT_TRUE(store.save_opencode());

    auto backups = store.backups().list_backups("opencode");
    ASSERT_EQ(backups.size(), 1u);
    EXPECT_EQ(backups[0].tag, "auto");

    std::string error;
    auto j = read_json_file(opencode_dir() / "opencode.json", error);
    ASSERT_TRUE(j.has_value());
    EXPECT_EQ((*j)["model"], "relay/m2");
}

TEST_F(ConfigStoreTest, AutoBackupsArePrunedToKeepCount) {
    ConfigStore store(paths());
    store.load();
    store.set_backup_keep_count(2);

    for (int i = 0; i < 5; ++i) {
        store.opencode().model = "relay/m" + std::to_string(i);
        ASSERT_TRUE(store.save_opencode());
    }

    EXPECT_EQ(store.backups().list_backups("opencode").size(), 2u);
}

TEST_F(ConfigStoreTest, BackupAllCountsExistingFiles) {
    ConfigStore store(paths());
    store.load();
    EXPECT_EQ(store.backup_all(), 0);

    ASSERT_TRUE(store.save_opencode());
    EXPECT_EQ(store.backup_all(), 1);

    ASSERT_TRUE(store.save_ohmyopencode());
    EXPECT_EQ(store.backup_all(), 2);
}

TEST_F(ConfigStoreTest, ReplaceDocumentsSavesBoth) {
    ConfigStore store(paths());
    store.load();

    std::optional<nlohmann::json> opencode;
    opencode.emplace(nlohmann::json{{"model", "a/b"}});
    std::optional<nlohmann::json> ohmy;
    ohmy.emplace(nlohmann::json{{"agents", {{"oracle", {{"model", "a/b"}}}}}});
    ASSERT_TRUE(store.replace_documents(opencode, ohmy));

    ConfigStore reloaded(paths());
    ASSERT_TRUE(reloaded.load());
    EXPECT_EQ(reloaded.opencode().model, "a/b");
    EXPECT_EQ(reloaded.stats().ohmy_agents, 1u);
}

TEST_F(ConfigStoreTest, PartialBundleLeavesOtherDocumentOnDisk) {
    std::ofstream(opencode_dir() / "oh-my-opencode.json")
        << R"({"agents": {"oracle": {"model": "anthropic/claude-opus-4-5"}}})";
    ConfigStore store(paths());
    ASSERT_TRUE(store.load());

    std::string error;
    auto bundle = ConfigExporter::import_from_json(R"({"opencode": {"model": "x/y"}})", error);
    ASSERT_TRUE(bundle.has_value()) << error;
    ASSERT_TRUE(store.replace_documents(bundle->opencode, bundle->oh_my_opencode));

    auto ohmy = read_json_file(opencode_dir() / "oh-my-opencode.json", error);
    ASSERT_TRUE(ohmy.has_value()) << error;
    EXPECT_TRUE((*ohmy)["agents"].contains("oracle"));

    ConfigStore reloaded(paths());
    ASSERT_TRUE(reloaded.load());
    EXPECT_EQ(reloaded.opencode().model, "x/y");
    EXPECT_EQ(reloaded.stats().ohmy_agents, 1u);
}
