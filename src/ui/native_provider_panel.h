#pragma once

#include "adapters/config_store.h"
#include "auth/auth_manager.h"
#include "auth/env_var_detector.h"
#include "auth/native_providers.h"
#include "ui/widgets.h"
#include <map>
#include <memory>
#include <string>

namespace occm {

// Built-in OpenCode providers: credentials in auth.json, options in
// provider.<id>.options of opencode.json.
class NativeProviderPanel {
public:
    NativeProviderPanel();

    void render(bool* open);
    void render_content();

    void set_config_store(ConfigStore* store);

private:
    void render_provider_list();
    void render_provider_details();
    void render_auth_section(const NativeProvider& provider);
    void render_env_section(const NativeProvider& provider);
    void render_options_section(const NativeProvider& provider);

    void select_provider(const std::string& id);
    void load_option_buffers(const NativeProvider& provider);
    bool persist_options(const std::string& ok_message);

    ConfigStore* store_ = nullptr;
    std::unique_ptr<AuthManager> auth_;
    EnvVarDetector env_detector_;
    StatusLine status_;

    std::string filter_;
    std::string selected_;
    std::string key_input_;
    bool show_key_ = false;
    std::map<std::string, std::string> option_buffers_;

    bool show_remove_confirm_ = false;
};

}
