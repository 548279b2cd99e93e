#pragma once

#include "adapters/config_store.h"
#include "ui/widgets.h"
#include <map>
#include <string>

namespace occm {

// agent.<name> entries of opencode.json.
class AgentPanel {
public:
    void render(bool* open);
    void render_content();

    void set_config_store(ConfigStore* store) { store_ = store; }

private:
    void render_agent_list();
    void render_agent_editor();
    void render_tools_section();
    void render_presets_popup();

    void select_agent(const std::string& name);
    void begin_new_agent();
    void save_agent();

    bool persist(const std::string& ok_message);

    ConfigStore* store_ = nullptr;
    StatusLine status_;

    std::string selected_;
    std::string edit_name_;
    AgentConfig editing_;
    bool is_new_ = false;
    bool override_temperature_ = false;
    float temperature_ = 0.3f;
    int max_steps_ = 0;
    std::string permission_text_;
    std::string new_tool_;

    std::map<std::string, bool> preset_checked_;
    bool show_presets_popup_ = false;
    std::string pending_delete_;
    bool show_delete_confirm_ = false;
};

}
