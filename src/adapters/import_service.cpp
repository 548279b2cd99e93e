#include "adapters/import_service.h"
#include "core/json_file.h"
#include "core/logging.h"
#include "core/string_utils.h"

#include <sstream>
#include <toml++/toml.hpp>

namespace occm {

namespace fs = std::filesystem;

namespace {

std::string string_field(const nlohmann::json& j, const char* key, const char* fallback_key = nullptr) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    if (fallback_key && j.contains(fallback_key) && j[fallback_key].is_string()) {
        return j[fallback_key].get<std::string>();
    }
    return {};
}

nlohmann::json make_provider(const std::string& npm, const std::string& name,
                             const std::string& base_url, const std::string& api_key) {
    nlohmann::json options = nlohmann::json::object();
    if (!base_url.empty()) options["baseURL"] = base_url;
    if (!api_key.empty()) options["apiKey"] = api_key;
    return {
        {"npm", npm},
        {"name", name},
        {"options", options},
        {"models", nlohmann::json::object()}
    };
}

// Claude Code keeps {"allow": ["Bash(npm run:*)", "Read"], "deny": [...]}.
void convert_claude_permissions(const nlohmann::json& permissions, nlohmann::json& out) {
    if (!permissions.is_object()) return;

    for (auto& [key, value] : permissions.items()) {
        if (value.is_string() && is_valid_permission_level(value.get<std::string>())) {
            out[key] = value;
            continue;
        }
        if (!value.is_array() || !is_valid_permission_level(key)) continue;

        for (const auto& rule : value) {
            if (!rule.is_string()) continue;
            std::string tool = rule.get<std::string>();
            size_t paren = tool.find('(');
            if (paren != std::string::npos) tool = tool.substr(0, paren);
            tool = to_lower(trim(tool));
            if (!tool.empty()) out[tool] = key;
        }
    }
}

}

const char* import_source_type_name(ImportSourceType type) {
    switch (type) {
        case ImportSourceType::Claude: return "claude";
        case ImportSourceType::ClaudeProviders: return "claude_providers";
        case ImportSourceType::Codex: return "codex";
        case ImportSourceType::Gemini: return "gemini";
        case ImportSourceType::CcSwitch: return "ccswitch";
    }
    return "unknown";
}

ImportService::ImportService(ConfigPaths paths)
    : paths_(std::move(paths))
{
}

ImportSource ImportService::scan_json(const std::string& label, ImportSourceType type, const fs::path& path) const {
    ImportSource source;
    source.label = label;
    source.type = type;
    source.path = path;

    std::error_code ec;
    source.exists = fs::exists(path, ec);
    if (source.exists) {
        source.data = read_json_file(path, source.error);
    }
    return source;
}

std::vector<ImportSource> ImportService::scan() const {
    std::vector<ImportSource> sources;
    sources.push_back(scan_json("Claude Code Settings", ImportSourceType::Claude, paths_.claude_settings()));
    sources.push_back(scan_json("Claude Providers", ImportSourceType::ClaudeProviders, paths_.claude_providers()));

    ImportSource codex;
    codex.label = "Codex Config";
    codex.type = ImportSourceType::Codex;
    codex.path = paths_.codex_config();
    std::error_code ec;
    codex.exists = fs::exists(codex.path, ec);
    if (codex.exists) {
        codex.data = read_toml_as_json(codex.path, codex.error);
    }
    sources.push_back(std::move(codex));

    sources.push_back(scan_json("Gemini Config", ImportSourceType::Gemini, paths_.gemini_config()));
    sources.push_back(scan_json("CC-Switch Config", ImportSourceType::CcSwitch, paths_.ccswitch_config()));
    return sources;
}

std::optional<nlohmann::json> ImportService::read_toml_as_json(const fs::path& path, std::string& error_out) {
    try {
        auto tbl = toml::parse_file(path.string());
        std::ostringstream oss;
        oss << toml::json_formatter{tbl};
        return nlohmann::json::parse(oss.str());
    } catch (const toml::parse_error& e) {
        error_out = std::string("TOML parse error: ") + std::string(e.description());
        core_log(spdlog::level::warn, "Failed to parse {}: {}", path.string(), error_out);
    } catch (const nlohmann::json::exception& e) {
        error_out = e.what();
        core_log(spdlog::level::warn, "Failed to convert {}: {}", path.string(), error_out);
    }
    return std::nullopt;
}

std::string ImportService::guess_sdk(const std::string& provider_name) {
    if (contains_ci(provider_name, "anthropic") || contains_ci(provider_name, "claude")) {
        return "@ai-sdk/anthropic";
    }
    if (contains_ci(provider_name, "google") || contains_ci(provider_name, "gemini")) {
        return "@ai-sdk/google";
    }
    return "@ai-sdk/openai";
}

nlohmann::json ImportService::convert(ImportSourceType type, const nlohmann::json& data) {
    nlohmann::json result = {
        {"provider", nlohmann::json::object()},
        {"permission", nlohmann::json::object()}
    };
    if (!data.is_object()) return result;

    auto& providers = result["provider"];

    switch (type) {
        case ImportSourceType::Claude: {
            std::string key = string_field(data, "apiKey");
            if (!key.empty()) {
                providers["anthropic"] = make_provider("@ai-sdk/anthropic", "Anthropic (Claude)", "", key);
            }
            if (data.contains("permissions")) {
                convert_claude_permissions(data["permissions"], result["permission"]);
            }
            break;
        }
        case ImportSourceType::ClaudeProviders: {
            for (auto& [id, value] : data.items()) {
                if (!value.is_object()) continue;
                std::string name = string_field(value, "name");
                providers[id] = make_provider("@ai-sdk/anthropic", name.empty() ? id : name,
                                              string_field(value, "baseUrl", "base_url"),
                                              string_field(value, "apiKey", "api_key"));
            }
            break;
        }
        case ImportSourceType::Codex: {
            if (data.contains("api") && data["api"].is_object()) {
                const auto& api = data["api"];
                providers["openai"] = make_provider("@ai-sdk/openai", "OpenAI (Codex)",
                                                    string_field(api, "base_url"),
                                                    string_field(api, "api_key"));
            }
            if (data.contains("model_providers") && data["model_providers"].is_object()) {
                for (auto& [id, value] : data["model_providers"].items()) {
                    if (!value.is_object()) continue;
                    std::string name = string_field(value, "name");
                    std::string env_key = string_field(value, "env_key");
                    providers[id] = make_provider("@ai-sdk/openai-compatible", name.empty() ? id : name,
                                                  string_field(value, "base_url"),
                                                  env_key.empty() ? "" : "{env:" + env_key + "}");
                }
            }
            break;
        }
        case ImportSourceType::Gemini: {
            std::string key = string_field(data, "apiKey");
            if (!key.empty()) {
                providers["google"] = make_provider("@ai-sdk/google", "Google (Gemini)", "", key);
            }
            break;
        }
        case ImportSourceType::CcSwitch: {
            if (!data.contains("providers") || !data["providers"].is_object()) break;
            for (auto& [id, value] : data["providers"].items()) {
                if (!value.is_object()) continue;
                std::string name = string_field(value, "name");
                providers[id] = make_provider(guess_sdk(id), name.empty() ? id : name,
                                              string_field(value, "baseUrl", "base_url"),
                                              string_field(value, "apiKey", "api_key"));
            }
            break;
        }
    }

    return result;
}

MergeResult ImportService::merge(OpenCodeConfig& config, const nlohmann::json& converted, bool overwrite) {
    MergeResult result;
    if (!converted.is_object()) return result;

    if (converted.contains("provider") && converted["provider"].is_object()) {
        for (auto& [id, value] : converted["provider"].items()) {
            if (config.providers.count(id) > 0 && !overwrite) {
                result.skipped.push_back(id);
                continue;
            }
            ProviderConfig provider;
            occm::from_json(value, provider);
            config.providers[id] = provider;
            result.added.push_back(id);
        }
    }

    if (converted.contains("permission") && converted["permission"].is_object()) {
        for (auto& [tool, level] : converted["permission"].items()) {
            if (config.permission.count(tool) > 0) continue;
            config.permission[tool] = level;
            ++result.permissions;
        }
    }

    core_log(spdlog::level::info, "Import merged {} providers, skipped {}, {} permissions",
             result.added.size(), result.skipped.size(), result.permissions);
    return result;
}

}
