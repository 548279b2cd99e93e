#pragma once

#include "skills/skill_discovery.h"
#include <filesystem>
#include <optional>
#include <string>

namespace occm {

enum class SkillScope {
    Global,
    Project
};

class SkillInstaller {
public:
    explicit SkillInstaller(ConfigPaths paths);

    std::filesystem::path root(SkillScope scope) const;

    // Writes <root>/<name>/SKILL.md. Returns the file written.
    std::optional<std::filesystem::path> create(const std::string& name, const std::string& description,
                                                const std::string& body, SkillScope scope,
                                                std::string& error_out) const;

    // Copies a directory containing SKILL.md into the scope root. The skill
    // name comes from the front matter, else from the directory name.
    std::optional<std::filesystem::path> install_from_directory(const std::filesystem::path& source,
                                                                SkillScope scope, std::string& error_out) const;

    bool remove(const std::string& name, SkillScope scope, std::string& error_out) const;

    static std::string render_skill(const std::string& name, const std::string& description, const std::string& body);
    static const char* default_body();

private:
    ConfigPaths paths_;
};

}
