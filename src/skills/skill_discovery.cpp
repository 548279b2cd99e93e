#include "skills/skill_discovery.h"
#include "core/json_file.h"
#include "core/logging.h"
#include "core/string_utils.h"

#include <algorithm>
#include <regex>
#include <sstream>

namespace occm {

namespace fs = std::filesystem;

namespace {

std::string unquote(const std::string& value) {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

}

const char* skill_source_label(SkillSource source) {
    switch (source) {
        case SkillSource::OpenCodeGlobal: return "OpenCode (global)";
        case SkillSource::OpenCodeProject: return "OpenCode (project)";
        case SkillSource::ClaudeGlobal: return "Claude (global)";
        case SkillSource::ClaudeProject: return "Claude (project)";
    }
    return "unknown";
}

bool is_valid_skill_name(const std::string& name) {
    static const std::regex pattern("^[a-z0-9]+(-[a-z0-9]+)*$");
    if (name.empty() || name.size() > 64) return false;
    return std::regex_match(name, pattern);
}

SkillFrontMatter parse_front_matter(const std::string& content) {
    SkillFrontMatter result;
    std::istringstream stream(content);
    std::string line;

    if (!std::getline(stream, line) || trim(line) != "---") {
        result.body = content;
        return result;
    }

    bool closed = false;
    while (std::getline(stream, line)) {
        if (trim(line) == "---") {
            closed = true;
            break;
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string key = trim(line.substr(0, colon));
        if (key.empty()) continue;
        result.fields[key] = unquote(trim(line.substr(colon + 1)));
    }

    if (!closed) {
        result.fields.clear();
        result.body = content;
        return result;
    }

    std::ostringstream body;
    body << stream.rdbuf();
    result.body = body.str();
    size_t start = result.body.find_first_not_of('\n');
    result.body = start == std::string::npos ? std::string() : result.body.substr(start);
    return result;
}

SkillDiscovery::SkillDiscovery(ConfigPaths paths)
    : paths_(std::move(paths))
{
}

fs::path SkillDiscovery::root(SkillSource source) const {
    switch (source) {
        case SkillSource::OpenCodeGlobal: return paths_.global_skill_dir();
        case SkillSource::OpenCodeProject: return paths_.project_skill_dir();
        case SkillSource::ClaudeGlobal: return paths_.claude_global_skill_dir();
        case SkillSource::ClaudeProject: return paths_.claude_project_skill_dir();
    }
    return {};
}

bool SkillDiscovery::read_skill(const fs::path& skill_md, SkillSource source, SkillInfo& out) {
    std::string error;
    auto content = read_text_file(skill_md, error);
    if (!content) {
        if (!error.empty()) core_log(spdlog::level::warn, "Skipping skill {}: {}", skill_md.string(), error);
        return false;
    }

    auto front = parse_front_matter(*content);
    out.path = skill_md;
    out.source = source;
    out.name = front.fields.count("name") ? front.fields["name"] : skill_md.parent_path().filename().string();
    out.description = front.fields.count("description") ? front.fields["description"] : std::string();
    return true;
}

std::vector<SkillInfo> SkillDiscovery::discover() const {
    std::vector<SkillInfo> skills;
    for (auto source : {SkillSource::OpenCodeGlobal, SkillSource::OpenCodeProject,
                        SkillSource::ClaudeGlobal, SkillSource::ClaudeProject}) {
        const fs::path dir = root(source);
        std::error_code ec;
        if (dir.empty() || !fs::is_directory(dir, ec)) continue;

        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            if (!entry.is_directory(ec)) continue;
            const fs::path skill_md = entry.path() / "SKILL.md";
            if (!fs::is_regular_file(skill_md, ec)) continue;

            SkillInfo info;
            if (read_skill(skill_md, source, info)) {
                skills.push_back(std::move(info));
            }
        }
    }

    std::stable_sort(skills.begin(), skills.end(), [](const SkillInfo& a, const SkillInfo& b) {
        return a.name < b.name;
    });
    return skills;
}

}
