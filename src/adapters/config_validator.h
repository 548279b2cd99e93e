#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace occm {

enum class IssueSeverity {
    Error,
    Warning
};

struct ValidationIssue {
    IssueSeverity severity = IssueSeverity::Error;
    std::string path;
    std::string message;
};

class ConfigValidator {
public:
    static std::vector<ValidationIssue> validate(const nlohmann::json& config);

    // Repairs structural problems in place; returns a description per fix.
    static std::vector<std::string> fix(nlohmann::json& config);

    static bool is_valid_base_url(const std::string& url);
    static size_t error_count(const std::vector<ValidationIssue>& issues);
};

}
