#pragma once

#include "adapters/config_store.h"
#include "update/version_checker.h"
#include "ui/widgets.h"
#include <optional>
#include <string>

namespace occm {

// Home window: file locations, counts and the default models.
class OverviewPanel {
public:
    void render(bool* open);
    void render_content();

    void set_config_store(ConfigStore* store) { store_ = store; }
    void set_update(const ReleaseInfo& release) { update_ = release; }
    void set_status(const std::string& message) { status_.set(message, 4.0f); }

private:
    void render_update_banner();
    void render_files_section();
    void render_stats_section();
    void render_models_section();

    ConfigStore* store_ = nullptr;
    StatusLine status_;
    std::optional<ReleaseInfo> update_;
};

}
