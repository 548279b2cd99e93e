#include "adapters/config_exporter.h"
#include "core/json_file.h"
#include "core/logging.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace occm {

namespace {

std::string utc_now() {
    auto now = std::time(nullptr);
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&now), "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

nlohmann::json build_export_root(const nlohmann::json& opencode, const nlohmann::json& oh_my_opencode) {
    nlohmann::json root;
    root["version"] = "1.0";
    root["exported_at"] = utc_now();
    root["opencode"] = opencode;
    root["oh_my_opencode"] = oh_my_opencode;
    return root;
}

}

std::string ConfigExporter::export_to_json(const nlohmann::json& opencode, const nlohmann::json& oh_my_opencode) {
    return build_export_root(opencode, oh_my_opencode).dump(2);
}

std::optional<ExportBundle> ConfigExporter::import_from_json(const std::string& json_str, std::string& error_out) {
    auto root = nlohmann::json::parse(json_str, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        error_out = "Not a valid export file";
        return std::nullopt;
    }

    bool has_opencode = root.contains("opencode") && root["opencode"].is_object();
    bool has_ohmy = root.contains("oh_my_opencode") && root["oh_my_opencode"].is_object();
    if (!has_opencode && !has_ohmy) {
        error_out = "Export file contains no configuration";
        return std::nullopt;
    }

    ExportBundle bundle;
    if (root.contains("version") && root["version"].is_string()) {
        bundle.version = root["version"].get<std::string>();
    }
    if (root.contains("exported_at") && root["exported_at"].is_string()) {
        bundle.exported_at = root["exported_at"].get<std::string>();
    }
    if (has_opencode) bundle.opencode.emplace(root["opencode"]);
    if (has_ohmy) bundle.oh_my_opencode.emplace(root["oh_my_opencode"]);
    return bundle;
}

bool ConfigExporter::export_to_file(const std::filesystem::path& path, const nlohmann::json& opencode,
                                    const nlohmann::json& oh_my_opencode, std::string& error_out) {
    if (!write_text_file(path, export_to_json(opencode, oh_my_opencode) + "\n", error_out)) {
        return false;
    }
    core_log(spdlog::level::info, "Exported configuration to {}", path.string());
    return true;
}

std::optional<ExportBundle> ConfigExporter::import_from_file(const std::filesystem::path& path, std::string& error_out) {
    auto content = read_text_file(path, error_out);
    if (!content) {
        if (error_out.empty()) error_out = "File not found: " + path.string();
        return std::nullopt;
    }
    return import_from_json(*content, error_out);
}

}
