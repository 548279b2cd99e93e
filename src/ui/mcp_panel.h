#pragma once

#include "adapters/config_store.h"
#include "ui/widgets.h"
#include <string>

namespace occm {

class McpPanel {
public:
    void render(bool* open);
    void render_content();

    void set_config_store(ConfigStore* store) { store_ = store; }

private:
    void render_server_list();
    void render_server_editor();

    void select_server(const std::string& name);
    void begin_new_server();
    void save_server();

    bool persist(const std::string& ok_message);

    ConfigStore* store_ = nullptr;
    StatusLine status_;

    std::string selected_;
    std::string edit_name_;
    McpServer editing_;
    int64_t timeout_ms_ = kDefaultMcpTimeoutMs;
    bool is_new_ = false;

    std::string pending_delete_;
    bool show_delete_confirm_ = false;
};

}
