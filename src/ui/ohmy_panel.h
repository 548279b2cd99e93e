#pragma once

#include "adapters/config_store.h"
#include "ui/widgets.h"
#include <map>
#include <string>

namespace occm {

// oh-my-opencode.json: plugin agents and task categories.
class OhMyPanel {
public:
    void render(bool* open);
    void render_content();

    void set_config_store(ConfigStore* store) { store_ = store; }

private:
    enum class Selection {
        None,
        Agent,
        Category
    };

    void render_lists();
    void render_editor();
    void render_agent_editor();
    void render_category_editor();
    void render_presets_popup();

    void select_agent(const std::string& name);
    void select_category(const std::string& name);
    void save_agent();
    void save_category();

    bool persist(const std::string& ok_message);

    ConfigStore* store_ = nullptr;
    StatusLine status_;

    Selection selection_ = Selection::None;
    std::string selected_;
    std::string edit_name_;
    bool is_new_ = false;
    OhMyAgent agent_editing_;
    Category category_editing_;
    float temperature_ = 0.7f;

    std::string preset_model_;
    std::map<std::string, bool> agent_preset_checked_;
    std::map<std::string, bool> category_preset_checked_;
    bool show_presets_popup_ = false;
};

}
