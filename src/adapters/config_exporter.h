#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace occm {

struct ExportBundle {
    std::string version = "1.0";
    std::string exported_at;
    // Absent when the bundle does not carry that document.
    std::optional<nlohmann::json> opencode;
    std::optional<nlohmann::json> oh_my_opencode;
};

// Both documents in a single file, for moving a setup between machines.
class ConfigExporter {
public:
    static std::string export_to_json(const nlohmann::json& opencode, const nlohmann::json& oh_my_opencode);
    static std::optional<ExportBundle> import_from_json(const std::string& json_str, std::string& error_out);

    static bool export_to_file(const std::filesystem::path& path, const nlohmann::json& opencode,
                               const nlohmann::json& oh_my_opencode, std::string& error_out);
    static std::optional<ExportBundle> import_from_file(const std::filesystem::path& path, std::string& error_out);
};

}
