#pragma once

#include "adapters/config_store.h"
#include "adapters/import_service.h"
#include "ui/widgets.h"
#include <string>
#include <vector>

namespace occm {

// Pulls providers and permissions from other coding tools' configs.
class ImportPanel {
public:
    void render(bool* open);
    void render_content();

    void set_config_store(ConfigStore* store);

private:
    void scan();
    void render_source(int index);
    void import_source(int index);
    void render_result_popup();

    ConfigStore* store_ = nullptr;
    StatusLine status_;

    std::vector<ImportSource> sources_;
    bool scanned_ = false;
    bool overwrite_ = false;

    MergeResult last_result_;
    std::string last_source_;
    bool show_result_popup_ = false;
};

}
