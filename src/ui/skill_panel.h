#pragma once

#include "adapters/config_store.h"
#include "skills/skill_discovery.h"
#include "skills/skill_installer.h"
#include "ui/widgets.h"
#include <string>
#include <vector>

namespace occm {

class SkillPanel {
public:
    void render(bool* open);
    void render_content();

    void set_config_store(ConfigStore* store);

private:
    void refresh();
    void render_skill_table();
    void render_create_section();
    void render_install_section();
    void render_preview();

    ConfigStore* store_ = nullptr;
    StatusLine status_;

    std::vector<SkillInfo> skills_;
    bool loaded_ = false;
    int selected_ = -1;
    std::string preview_;

    std::string new_name_;
    std::string new_description_;
    std::string new_body_;
    int create_scope_ = 0;

    std::string install_dir_;
    int install_scope_ = 0;

    int pending_delete_ = -1;
    bool show_delete_confirm_ = false;
};

}
