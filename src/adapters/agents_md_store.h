#pragma once

#include "core/config_paths.h"
#include <optional>
#include <string>

namespace occm {

enum class RulesScope {
    Global,
    Project
};

// AGENTS.md rule files read by OpenCode at session start.
class AgentsMdStore {
public:
    explicit AgentsMdStore(ConfigPaths paths);

    std::filesystem::path path(RulesScope scope) const;

    // Empty string when the file does not exist; nullopt when unreadable.
    std::optional<std::string> read(RulesScope scope, std::string& error_out) const;
    bool write(RulesScope scope, const std::string& content, std::string& error_out) const;

    static const char* template_text();

private:
    ConfigPaths paths_;
};

}
