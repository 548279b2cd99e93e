#pragma once

#include "adapters/config_store.h"
#include "ui/widgets.h"
#include <functional>
#include <string>
#include <vector>

namespace occm {

class BackupPanel {
public:
    void render(bool* open);
    void render_content();

    void set_config_store(ConfigStore* store);

    // Called after a restore replaced a document on disk.
    void set_on_restored(std::function<void()> callback) { on_restored_ = std::move(callback); }
    void set_on_keep_count_changed(std::function<void(int)> callback) { on_keep_count_changed_ = std::move(callback); }

private:
    void refresh();
    void render_toolbar();
    void render_backup_table();
    void render_restore_popup();

    std::filesystem::path restore_target(const BackupInfo& info) const;

    ConfigStore* store_ = nullptr;
    StatusLine status_;
    std::function<void()> on_restored_;
    std::function<void(int)> on_keep_count_changed_;

    std::vector<BackupInfo> backups_;
    bool loaded_ = false;
    std::string filter_;
    int keep_count_ = 10;

    int pending_restore_ = -1;
    bool show_restore_confirm_ = false;
};

}
