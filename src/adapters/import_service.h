#pragma once

#include "adapters/opencode_config.h"
#include "core/config_paths.h"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace occm {

enum class ImportSourceType {
    Claude,
    ClaudeProviders,
    Codex,
    Gemini,
    CcSwitch
};

struct ImportSource {
    std::string label;
    ImportSourceType type = ImportSourceType::Claude;
    std::filesystem::path path;
    bool exists = false;
    std::optional<nlohmann::json> data;
    std::string error;
};

struct MergeResult {
    std::vector<std::string> added;
    std::vector<std::string> skipped;
    int permissions = 0;
};

const char* import_source_type_name(ImportSourceType type);

// Reads Claude Code, Codex, Gemini and cc-switch configs and converts them
// into opencode.json providers and permissions.
class ImportService {
public:
    explicit ImportService(ConfigPaths paths);

    std::vector<ImportSource> scan() const;

    // {"provider": {...}, "permission": {...}}
    static nlohmann::json convert(ImportSourceType type, const nlohmann::json& data);

    // Existing providers are skipped unless overwrite is set. Permissions are
    // only added for tools that have none yet.
    static MergeResult merge(OpenCodeConfig& config, const nlohmann::json& converted, bool overwrite);

    // Codex config.toml as JSON. nullopt and error_out on parse failure.
    static std::optional<nlohmann::json> read_toml_as_json(const std::filesystem::path& path, std::string& error_out);

    static std::string guess_sdk(const std::string& provider_name);

private:
    ImportSource scan_json(const std::string& label, ImportSourceType type, const std::filesystem::path& path) const;

    ConfigPaths paths_;
};

}
