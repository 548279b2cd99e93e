#pragma once

#include <nlohmann/json.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace occm {

// Missing file: nullopt with an empty error_out. Unreadable or malformed
// file: nullopt with a message in error_out. Accepts JSONC.
std::optional<nlohmann::json> read_json_file(const std::filesystem::path& path, std::string& error_out);

// Writes indented JSON to <path>.tmp and renames it over path. With
// owner_only the temp file is restricted to 0600 before any content is written.
bool write_json_file(const std::filesystem::path& path, const nlohmann::json& j, std::string& error_out,
                     bool owner_only = false);

std::optional<std::string> read_text_file(const std::filesystem::path& path, std::string& error_out);
bool write_text_file(const std::filesystem::path& path, const std::string& content, std::string& error_out,
                     bool owner_only = false);

}
