#pragma once

#include "adapters/config_store.h"
#include "adapters/config_validator.h"
#include "ui/widgets.h"
#include <string>
#include <vector>

namespace occm {

// Checks opencode.json as it is on disk and offers automatic repairs.
class ValidationPanel {
public:
    void render(bool* open);
    void render_content();

    void set_config_store(ConfigStore* store) { store_ = store; }

    void run_validation();

private:
    void render_issues();
    void apply_fixes();

    ConfigStore* store_ = nullptr;
    StatusLine status_;

    nlohmann::json document_;
    std::vector<ValidationIssue> issues_;
    std::vector<std::string> applied_fixes_;
    bool validated_ = false;
};

}
