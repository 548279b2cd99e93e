#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace occm {

// Removes // and /* */ comments that appear outside string literals.
std::string strip_jsonc_comments(const std::string& content);

// Plain JSON first, then the comment-stripped text. nullopt if both fail;
// error_out receives the parser message of the second attempt.
std::optional<nlohmann::json> parse_jsonc(const std::string& content, std::string& error_out);

}
