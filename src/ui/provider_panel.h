#pragma once

#include "adapters/config_store.h"
#include "ui/widgets.h"
#include <map>
#include <string>

namespace occm {

// Custom providers (provider.<id>) and their models.
class ProviderPanel {
public:
    void render(bool* open);
    void render_content();

    void set_config_store(ConfigStore* store) { store_ = store; }

private:
    void render_provider_list();
    void render_provider_editor();
    void render_models_section();
    void render_model_editor();
    void render_preset_section();

    void select_provider(const std::string& id);
    void begin_new_provider();
    void save_provider();
    void delete_provider();

    void select_model(const std::string& id);
    void begin_new_model();
    void save_model();

    bool persist(const std::string& ok_message);

    ConfigStore* store_ = nullptr;
    StatusLine status_;

    std::string selected_provider_;
    std::string edit_id_;
    ProviderConfig editing_;
    std::string timeout_text_;
    bool is_new_provider_ = false;

    std::string selected_model_;
    std::string model_id_;
    ModelConfig model_editing_;
    bool model_is_new_ = false;
    bool model_has_limit_ = true;
    std::string model_options_text_;
    std::string model_variants_text_;

    std::string preset_series_;
    std::map<std::string, bool> preset_checked_;

    bool show_delete_confirm_ = false;
};

}
