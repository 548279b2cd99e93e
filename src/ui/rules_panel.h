#pragma once

#include "adapters/agents_md_store.h"
#include "adapters/config_store.h"
#include "ui/widgets.h"
#include <string>

namespace occm {

// instructions[], AGENTS.md and compaction settings.
class RulesPanel {
public:
    void render(bool* open);
    void render_content();

    void set_config_store(ConfigStore* store);

private:
    void render_instructions_section();
    void render_agents_md_section();
    void render_compaction_section();

    void load_agents_md();

    bool persist(const std::string& ok_message);

    ConfigStore* store_ = nullptr;
    StatusLine status_;

    std::string new_instruction_;

    int scope_ = 0;
    std::string agents_md_;
    bool agents_md_loaded_ = false;
    bool agents_md_modified_ = false;
};

}
