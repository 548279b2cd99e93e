#include <gtest/gtest.h>
#include "adapters/config_exporter.h"
#include <filesystem>

namespace fs = std::filesystem;
using namespace occm;

TEST(ConfigExporterTest, ExportContainsBothDocuments) {
    nlohmann::json opencode = {{"model", "a/b"}};
    nlohmann::json ohmy = {{"agents", {{"oracle", {{"model", "a/b"}}}}}};

    auto root = nlohmann::json::parse(ConfigExporter::export_to_json(opencode, ohmy));

    EXPECT_EQ(root["version"], "1.0");
    EXPECT_FALSE(root["exported_at"].get<std::string>().empty());
    EXPECT_EQ(root["opencode"]["model"], "a/b");
    EXPECT_EQ(root["oh_my_opencode"]["agents"]["oracle"]["model"], "a/b");
}

TEST(ConfigExporterTest, ImportAcceptsPartialBundle) {
    std::string error;
    auto bundle = ConfigExporter::import_from_json(R"({"opencode": {"model": "x/y"}})", error);

    ASSERT_TRUE(bundle.has_value()) << error;
    ASSERT_TRUE(bundle->opencode.has_value());
    EXPECT_EQ((*bundle->opencode)["model"], "x/y");
    EXPECT_FALSE(bundle->oh_my_opencode.has_value());
}

TEST(ConfigExporterTest, ImportRejectsInvalid) {
    std::string error;

    EXPECT_FALSE(ConfigExporter::import_from_json("not json", error).has_value());
    EXPECT_EQ(error, "Not a valid export file");

    EXPECT_FALSE(ConfigExporter::import_from_json(R"({"version": "1.0"})", error).has_value());
    EXPECT_EQ(error, "Export file contains no configuration");
}

TEST(ConfigExporterTest, FileRoundTrip) {
    const fs::path path = fs::temp_directory_path() / "occm_export_test" / "bundle.json";
    fs::remove_all(path.parent_path());

    std::string error;
    ASSERT_TRUE(ConfigExporter::export_to_file(path, {{"model", "a/b"}}, nlohmann::json::object(), error)) << error;

    auto bundle = ConfigExporter::import_from_file(path, error);
    ASSERT_TRUE(bundle.has_value()) << error;
    ASSERT_TRUE(bundle->opencode.has_value());
    EXPECT_EQ((*bundle->opencode)["model"], "a/b");

    EXPECT_FALSE(ConfigExporter::import_from_file(path.parent_path() / "missing.json", error).has_value());
    EXPECT_NE(error.find("File not found"), std::string::npos);

    fs::remove_all(path.parent_path());
}
