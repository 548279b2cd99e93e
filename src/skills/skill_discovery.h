#pragma once

#include "core/config_paths.h"
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace occm {

enum class SkillSource {
    OpenCodeGlobal,
    OpenCodeProject,
    ClaudeGlobal,
    ClaudeProject
};

struct SkillInfo {
    std::string name;
    std::string description;
    SkillSource source = SkillSource::OpenCodeGlobal;
    std::filesystem::path path;  // the SKILL.md file
};

struct SkillFrontMatter {
    std::map<std::string, std::string> fields;
    std::string body;
};

const char* skill_source_label(SkillSource source);

// Lowercase letters and digits separated by single hyphens, 1-64 characters.
bool is_valid_skill_name(const std::string& name);

// "---\nkey: value\n---\nbody". Without front matter, fields is empty and body
// holds the whole content.
SkillFrontMatter parse_front_matter(const std::string& content);

class SkillDiscovery {
public:
    explicit SkillDiscovery(ConfigPaths paths);

    std::filesystem::path root(SkillSource source) const;

    // <root>/<name>/SKILL.md across all roots, sorted by name.
    std::vector<SkillInfo> discover() const;

    static bool read_skill(const std::filesystem::path& skill_md, SkillSource source, SkillInfo& out);

private:
    ConfigPaths paths_;
};

}
