#pragma once

#include "ui/theme.h"
#include <functional>
#include <string>

namespace occm {

class ConfigStore;

struct DockspacePanels {
    bool* show_overview = nullptr;
    bool* show_configuration = nullptr;
    bool* show_native_providers = nullptr;
    bool* show_import = nullptr;
    bool* show_backups = nullptr;
    bool* show_validation = nullptr;
};

struct DockspaceContext {
    ConfigStore* store = nullptr;
    bool checking_updates = false;
    std::function<void(ThemeMode)> on_theme_changed;
    std::function<void()> on_check_updates;
    // Status text for the Overview window after a menu action.
    std::function<void(const std::string&)> on_status;
};

void render_dockspace(bool first_frame, const DockspacePanels& panels, const DockspaceContext& context);

}
