#include "skills/skill_installer.h"
#include "core/json_file.h"
#include "core/logging.h"
#include "core/string_utils.h"

namespace occm {

namespace fs = std::filesystem;

SkillInstaller::SkillInstaller(ConfigPaths paths)
    : paths_(std::move(paths))
{
}

fs::path SkillInstaller::root(SkillScope scope) const {
    return scope == SkillScope::Global ? paths_.global_skill_dir() : paths_.project_skill_dir();
}

const char* SkillInstaller::default_body() {
    return "## What I do\n- Describe what this skill does\n\n## Instructions\n- Step-by-step instructions\n";
}

std::string SkillInstaller::render_skill(const std::string& name, const std::string& description,
                                         const std::string& body) {
    std::string text = "---\nname: " + name + "\ndescription: " + description + "\n---\n\n";
    const std::string content = trim(body);
    text += content.empty() ? std::string(default_body()) : content + "\n";
    return text;
}

std::optional<fs::path> SkillInstaller::create(const std::string& name, const std::string& description,
                                               const std::string& body, SkillScope scope,
                                               std::string& error_out) const {
    const std::string skill_name = trim(name);
    const std::string desc = trim(description);
    if (skill_name.empty()) {
        error_out = "Skill name is required";
        return std::nullopt;
    }
    if (desc.empty()) {
        error_out = "Skill description is required";
        return std::nullopt;
    }
    if (!is_valid_skill_name(skill_name)) {
        error_out = "Skill name must use lowercase letters, digits and single hyphens (max 64)";
        return std::nullopt;
    }

    const fs::path skill_md = root(scope) / skill_name / "SKILL.md";
    if (!write_text_file(skill_md, render_skill(skill_name, desc, body), error_out)) {
        return std::nullopt;
    }
    core_log(spdlog::level::info, "Created skill {} at {}", skill_name, skill_md.string());
    return skill_md;
}

std::optional<fs::path> SkillInstaller::install_from_directory(const fs::path& source, SkillScope scope,
                                                               std::string& error_out) const {
    std::error_code ec;
    const fs::path skill_md = source / "SKILL.md";
    if (!fs::is_regular_file(skill_md, ec)) {
        error_out = "No SKILL.md in " + source.string();
        return std::nullopt;
    }

    SkillInfo info;
    if (!SkillDiscovery::read_skill(skill_md, SkillSource::OpenCodeGlobal, info)) {
        error_out = "Cannot read " + skill_md.string();
        return std::nullopt;
    }
    if (!is_valid_skill_name(info.name)) {
        error_out = "Invalid skill name \"" + info.name + "\"";
        return std::nullopt;
    }

    const fs::path target = root(scope) / info.name;
    if (fs::exists(target, ec)) {
        error_out = "Skill \"" + info.name + "\" is already installed";
        return std::nullopt;
    }

    fs::create_directories(target.parent_path(), ec);
    ec.clear();
    fs::copy(source, target, fs::copy_options::recursive, ec);
    if (ec) {
        error_out = "Copy failed: " + ec.message();
        core_log(spdlog::level::err, "Installing skill from {} failed: {}", source.string(), ec.message());
        return std::nullopt;
    }

    core_log(spdlog::level::info, "Installed skill {} to {}", info.name, target.string());
    return target / "SKILL.md";
}

bool SkillInstaller::remove(const std::string& name, SkillScope scope, std::string& error_out) const {
    if (!is_valid_skill_name(name)) {
        error_out = "Invalid skill name \"" + name + "\"";
        return false;
    }

    const fs::path dir = root(scope) / name;
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        error_out = "Skill \"" + name + "\" not found";
        return false;
    }
    fs::remove_all(dir, ec);
    if (ec) {
        error_out = "Remove failed: " + ec.message();
        return false;
    }
    core_log(spdlog::level::info, "Removed skill {}", name);
    return true;
}

}
