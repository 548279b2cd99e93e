#include "adapters/agents_md_store.h"
#include "core/json_file.h"

namespace occm {

AgentsMdStore::AgentsMdStore(ConfigPaths paths)
    : paths_(std::move(paths))
{
}

std::filesystem::path AgentsMdStore::path(RulesScope scope) const {
    return scope == RulesScope::Global ? paths_.global_agents_md() : paths_.project_agents_md();
}

std::optional<std::string> AgentsMdStore::read(RulesScope scope, std::string& error_out) const {
    auto content = read_text_file(path(scope), error_out);
    if (!content) {
        if (!error_out.empty()) return std::nullopt;
        return std::string();
    }
    return content;
}

bool AgentsMdStore::write(RulesScope scope, const std::string& content, std::string& error_out) const {
    return write_text_file(path(scope), content, error_out);
}

const char* AgentsMdStore::template_text() {
    return "# Project Rules\n"
           "\n"
           "## Code Style\n"
           "- Follow the existing formatting and naming conventions\n"
           "- Keep functions small and focused\n"
           "\n"
           "## Workflow\n"
           "- Run the tests before committing\n"
           "- Explain non-obvious changes in the commit message\n"
           "\n"
           "## Notes\n"
           "- Add project-specific instructions here\n";
}

}
