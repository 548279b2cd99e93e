#pragma once

#include "adapters/config_store.h"
#include "ui/widgets.h"
#include <string>

namespace occm {

// Top-level permission.<tool> levels and permission.skill patterns.
class PermissionPanel {
public:
    void render(bool* open);
    void render_content();

    void set_config_store(ConfigStore* store) { store_ = store; }

private:
    void render_tool_section();
    void render_quick_allow();
    void render_skill_section();

    bool persist(const std::string& ok_message);

    ConfigStore* store_ = nullptr;
    StatusLine status_;

    std::string new_tool_;
    std::string new_tool_level_ = "ask";
    std::string new_pattern_;
    std::string new_pattern_level_ = "allow";
};

}
