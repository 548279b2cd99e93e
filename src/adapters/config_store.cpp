#include "adapters/config_store.h"
#include "core/json_file.h"
#include "core/logging.h"

namespace occm {

ConfigStore::ConfigStore(ConfigPaths paths)
    : paths_(std::move(paths))
    , backups_(paths_.backup_dir())
{
}

bool ConfigStore::load() {
    last_error_.clear();
    opencode_path_ = paths_.opencode_config();
    ohmyopencode_path_ = paths_.ohmyopencode_config();

    bool ok = true;
    std::string error;

    auto opencode_json = read_json_file(opencode_path_, error);
    if (opencode_json) {
        opencode_ = OpenCodeConfig::from_json(*opencode_json);
    } else {
        opencode_ = OpenCodeConfig{};
        if (!error.empty()) {
            last_error_ = error;
            ok = false;
        }
    }

    auto ohmy_json = read_json_file(ohmyopencode_path_, error);
    if (ohmy_json) {
        ohmyopencode_ = OhMyOpenCodeConfig::from_json(*ohmy_json);
    } else {
        ohmyopencode_ = OhMyOpenCodeConfig{};
        if (!error.empty()) {
            last_error_ = last_error_.empty() ? error : last_error_ + "; " + error;
            ok = false;
        }
    }

    core_log(spdlog::level::info, "Loaded {} ({} providers, {} agents)",
             opencode_path_.string(), opencode_.providers.size(), opencode_.agents.size());
    return ok;
}

bool ConfigStore::save_document(const std::filesystem::path& path, const nlohmann::json& j) {
    last_error_.clear();

    if (backups_.backup(path, "auto")) {
        backups_.cleanup(path.stem().string(), keep_count_, "auto");
    }

    std::string error;
    if (!write_json_file(path, j, error)) {
        last_error_ = error;
        return false;
    }
    core_log(spdlog::level::info, "Saved {}", path.string());
    return true;
}

bool ConfigStore::save_opencode() {
    if (opencode_path_.empty()) opencode_path_ = paths_.opencode_config();
    return save_document(opencode_path_, opencode_.to_json());
}

bool ConfigStore::save_ohmyopencode() {
    if (ohmyopencode_path_.empty()) ohmyopencode_path_ = paths_.ohmyopencode_config();
    return save_document(ohmyopencode_path_, ohmyopencode_.to_json());
}

int ConfigStore::backup_all(const std::string& tag) {
    int count = 0;
    if (backups_.backup(paths_.opencode_config(), tag)) ++count;
    if (backups_.backup(paths_.ohmyopencode_config(), tag)) ++count;
    return count;
}

bool ConfigStore::replace_documents(const std::optional<nlohmann::json>& opencode,
                                    const std::optional<nlohmann::json>& ohmyopencode) {
    if (opencode) {
        opencode_ = OpenCodeConfig::from_json(*opencode);
        if (!save_opencode()) return false;
    }
    if (ohmyopencode) {
        ohmyopencode_ = OhMyOpenCodeConfig::from_json(*ohmyopencode);
        if (!save_ohmyopencode()) return false;
    }
    return true;
}

ConfigStats ConfigStore::stats() const {
    ConfigStats s;
    s.providers = opencode_.providers.size();
    s.models = opencode_.model_count();
    s.mcp_servers = opencode_.mcp.size();
    s.agents = opencode_.agents.size();
    s.ohmy_agents = ohmyopencode_.agents.size();
    s.categories = ohmyopencode_.categories.size();
    return s;
}

}
