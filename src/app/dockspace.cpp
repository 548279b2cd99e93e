#include "app/dockspace.h"
#include "adapters/config_exporter.h"
#include "adapters/config_store.h"
#include "core/logging.h"
#include "core/version.h"
#include "ui/widgets.h"

#include "imgui.h"
#include "imgui_internal.h"

#include <nfd.h>
#include <string>

extern "C" void occm_request_exit();

namespace occm {

namespace {

constexpr const char* kProjectUrl = "https://github.com/icysaintdx/OpenCode-Config-Manager";
constexpr const char* kOpenCodeDocsUrl = "https://opencode.ai/docs/config";
constexpr const char* kAboutPopup = "About OCCM";
constexpr const char* kBundleConfirmPopup = "Import Bundle?";
constexpr const char* kBundleResultPopup = "Bundle Import";

const nfdfilteritem_t kBundleFilter[1] = {{"OCCM bundle", "json"}};

enum class BundleStep { Idle, Confirm, Result };

struct DockspaceState {
    bool about_open = false;
    BundleStep bundle_step = BundleStep::Idle;
    std::string bundle_path;
    bool bundle_ok = false;
    std::string bundle_message;
};

DockspaceState& state() {
    static DockspaceState s;
    return s;
}

const char* platform_name() {
#if defined(__APPLE__)
    return "macOS";
#elif defined(_WIN32)
    return "Windows";
#elif defined(__linux__)
    return "Linux";
#else
    return "unknown platform";
#endif
}

ImVec4 color_of(uint32_t packed) {
    return ImGui::ColorConvertU32ToFloat4(packed);
}

void report(const DockspaceContext& context, const std::string& text) {
    if (context.on_status) context.on_status(text);
}

void reload_store(const DockspaceContext& context) {
    if (!context.store) return;
    if (context.store->reload()) {
        report(context, "Reloaded from disk");
    } else {
        report(context, "Error: " + context.store->last_error());
    }
}

// Left column: Overview above Validation/Backups. Editors share the center.
void build_default_layout(ImGuiID root, const ImVec2& size) {
    ImGui::DockBuilderRemoveNode(root);
    ImGui::DockBuilderAddNode(root, ImGuiDockNodeFlags_DockSpace);
    ImGui::DockBuilderSetNodeSize(root, size);

    ImGuiID center = root;
    ImGuiID sidebar = ImGui::DockBuilderSplitNode(center, ImGuiDir_Left, 0.28f, nullptr, &center);
    ImGuiID sidebar_bottom = ImGui::DockBuilderSplitNode(sidebar, ImGuiDir_Down, 0.45f, nullptr, &sidebar);

    ImGui::DockBuilderDockWindow("Overview", sidebar);
    for (const char* name : {"Validation", "Backups"}) {
        ImGui::DockBuilderDockWindow(name, sidebar_bottom);
    }
    for (const char* name : {"Configuration", "Native Providers", "Import"}) {
        ImGui::DockBuilderDockWindow(name, center);
    }
    ImGui::DockBuilderFinish(root);
}

void begin_host_window() {
    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);
    ImGui::SetNextWindowViewport(viewport->ID);

    const ImGuiWindowFlags host_flags =
        ImGuiWindowFlags_MenuBar | ImGuiWindowFlags_NoDocking | ImGuiWindowFlags_NoTitleBar |
        ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove |
        ImGuiWindowFlags_NoBringToFrontOnFocus | ImGuiWindowFlags_NoNavFocus;

    ImGui::PushStyleVar(ImGuiStyleVar_WindowRounding, 0.0f);
    ImGui::PushStyleVar(ImGuiStyleVar_WindowBorderSize, 0.0f);
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(0.0f, 0.0f));
    ImGui::Begin("OccmHost", nullptr, host_flags);
    ImGui::PopStyleVar(3);
}

void submit_dockspace(bool first_frame) {
    if (!(ImGui::GetIO().ConfigFlags & ImGuiConfigFlags_DockingEnable)) return;

    ImGuiID root = ImGui::GetID("OccmDockSpace");
    ImGui::DockSpace(root, ImVec2(0.0f, 0.0f));
    if (!first_frame) return;

    // A split root means imgui.ini already restored a layout.
    ImGuiDockNode* node = ImGui::DockBuilderGetNode(root);
    if (!node || node->IsLeafNode()) {
        build_default_layout(root, ImGui::GetMainViewport()->Size);
    }
}

void pick_bundle_to_import() {
    nfdchar_t* picked = nullptr;
    if (NFD_OpenDialog(&picked, kBundleFilter, 1, nullptr) == NFD_OKAY && picked) {
        state().bundle_path = picked;
        state().bundle_step = BundleStep::Confirm;
    }
    if (picked) NFD_FreePath(picked);
}

void export_bundle(const DockspaceContext& context) {
    nfdchar_t* picked = nullptr;
    if (NFD_SaveDialog(&picked, kBundleFilter, 1, nullptr, "occm-export.json") == NFD_OKAY && picked) {
        std::string error;
        const std::string target = picked;
        if (ConfigExporter::export_to_file(target, context.store->opencode().to_json(),
                                           context.store->ohmyopencode().to_json(), error)) {
            report(context, "Exported to " + target);
        } else {
            report(context, "Error: " + error);
        }
    }
    if (picked) NFD_FreePath(picked);
}

void file_menu(const DockspaceContext& context) {
    if (!ImGui::BeginMenu("File")) return;
    const bool has_store = context.store != nullptr;

    if (ImGui::MenuItem("Reload", "Ctrl+R", false, has_store)) {
        reload_store(context);
    }
    if (ImGui::MenuItem("Backup All", nullptr, false, has_store)) {
        const int count = context.store->backup_all("manual");
        report(context, "Backed up " + std::to_string(count) + " files");
    }
    ImGui::Separator();
    if (ImGui::MenuItem("Import Bundle...", nullptr, false, has_store)) pick_bundle_to_import();
    if (ImGui::MenuItem("Export Bundle...", nullptr, false, has_store)) export_bundle(context);
    ImGui::Separator();
    if (ImGui::MenuItem("Exit", "Alt+F4")) occm_request_exit();
    ImGui::EndMenu();
}

struct PanelEntry {
    const char* title;
    const char* shortcut;
    bool* flag;
};

void theme_menu(const DockspaceContext& context) {
    if (!ImGui::BeginMenu("Theme")) return;
    const ThemeMode current = get_theme_mode();
    struct {
        const char* label;
        ThemeMode mode;
    } const choices[] = {
        {"Follow System", ThemeMode::System},
        {"Dark (Night)", ThemeMode::Dark},
        {"Light (Paper)", ThemeMode::Light},
    };
    for (const auto& choice : choices) {
        if (ImGui::MenuItem(choice.label, nullptr, current == choice.mode) && current != choice.mode) {
            set_theme_mode(choice.mode);
            if (context.on_theme_changed) context.on_theme_changed(choice.mode);
        }
    }
    ImGui::EndMenu();
}

void view_menu(const PanelEntry (&entries)[6], const DockspaceContext& context) {
    if (!ImGui::BeginMenu("View")) return;
    for (const auto& entry : entries) {
        if (entry.flag) ImGui::MenuItem(entry.title, entry.shortcut, entry.flag);
    }
    ImGui::Separator();
    theme_menu(context);
    ImGui::EndMenu();
}

void help_menu(const DockspaceContext& context) {
    if (!ImGui::BeginMenu("Help")) return;
    if (ImGui::MenuItem("OpenCode Config Reference")) open_url(kOpenCodeDocsUrl);
    if (ImGui::MenuItem("Report Issue")) open_url(std::string(kProjectUrl) + "/issues");
    if (ImGui::MenuItem("Check for Updates", nullptr, false, !context.checking_updates) &&
        context.on_check_updates) {
        context.on_check_updates();
    }
    ImGui::Separator();
    if (ImGui::MenuItem("About OCCM")) state().about_open = true;
    ImGui::EndMenu();
}

void handle_shortcuts(const PanelEntry (&entries)[6], const DockspaceContext& context) {
    const ImGuiIO& io = ImGui::GetIO();
    if (io.WantTextInput || !(io.KeyCtrl || io.KeySuper)) return;

    for (int i = 0; i < 6; ++i) {
        bool* flag = entries[i].flag;
        if (flag && ImGui::IsKeyPressed(static_cast<ImGuiKey>(ImGuiKey_1 + i))) *flag = !*flag;
    }
    if (ImGui::IsKeyPressed(ImGuiKey_R)) reload_store(context);
}

void apply_bundle(ConfigStore* store) {
    auto& s = state();
    s.bundle_ok = false;
    s.bundle_message.clear();
    if (!store || s.bundle_path.empty()) return;

    std::string error;
    auto bundle = ConfigExporter::import_from_file(s.bundle_path, error);
    if (!bundle) {
        s.bundle_message = error;
    } else {
        store->backup_all("before_import");
        s.bundle_ok = store->replace_documents(bundle->opencode, bundle->oh_my_opencode);
        s.bundle_message = s.bundle_ok ? "Bundle from " + bundle->exported_at + " applied"
                                       : store->last_error();
    }
    ui_log(s.bundle_ok ? spdlog::level::info : spdlog::level::err,
           "Bundle import {}: {}", s.bundle_path, s.bundle_message);
}

void bundle_confirm_popup(ConfigStore* store) {
    auto& s = state();
    if (s.bundle_step == BundleStep::Confirm && !ImGui::IsPopupOpen(kBundleConfirmPopup)) {
        ImGui::OpenPopup(kBundleConfirmPopup);
    }
    if (!ImGui::BeginPopupModal(kBundleConfirmPopup, nullptr, ImGuiWindowFlags_AlwaysAutoResize)) return;

    ImGui::TextColored(color_of(get_current_theme().warning), "This replaces the configuration files in the bundle");
    ImGui::TextDisabled("%s", s.bundle_path.c_str());
    if (store) {
        ImGui::Separator();
        ImGui::BulletText("%s", store->opencode_path().string().c_str());
        ImGui::BulletText("%s", store->ohmyopencode_path().string().c_str());
    }
    ImGui::Spacing();
    ImGui::TextWrapped("A \"before_import\" backup is taken first.");
    ImGui::Spacing();

    if (ImGui::Button("Apply", ImVec2(110, 0))) {
        apply_bundle(store);
        s.bundle_step = BundleStep::Result;
        s.bundle_path.clear();
        ImGui::CloseCurrentPopup();
    }
    ImGui::SameLine();
    if (ImGui::Button("Cancel", ImVec2(110, 0)) || ImGui::IsKeyPressed(ImGuiKey_Escape)) {
        s.bundle_step = BundleStep::Idle;
        s.bundle_path.clear();
        ImGui::CloseCurrentPopup();
    }
    ImGui::EndPopup();
}

void bundle_result_popup() {
    auto& s = state();
    if (s.bundle_step == BundleStep::Result && !ImGui::IsPopupOpen(kBundleResultPopup)) {
        ImGui::OpenPopup(kBundleResultPopup);
    }
    if (!ImGui::BeginPopupModal(kBundleResultPopup, nullptr, ImGuiWindowFlags_AlwaysAutoResize)) return;

    const auto& theme = get_current_theme();
    ImGui::TextColored(color_of(s.bundle_ok ? theme.success : theme.error),
                       s.bundle_ok ? "Bundle imported" : "Bundle import failed");
    ImGui::TextWrapped("%s", s.bundle_message.c_str());
    ImGui::Spacing();
    if (ImGui::Button("Close", ImVec2(-1, 0))) {
        s.bundle_step = BundleStep::Idle;
        ImGui::CloseCurrentPopup();
    }
    ImGui::EndPopup();
}

void about_popup() {
    auto& s = state();
    if (s.about_open && !ImGui::IsPopupOpen(kAboutPopup)) {
        ImGui::OpenPopup(kAboutPopup);
    }
    ImGui::SetNextWindowPos(ImGui::GetMainViewport()->GetCenter(), ImGuiCond_Appearing, ImVec2(0.5f, 0.5f));
    if (!ImGui::BeginPopupModal(kAboutPopup, &s.about_open, ImGuiWindowFlags_AlwaysAutoResize)) return;

    ImGui::TextColored(color_of(get_current_theme().accent), "OpenCode Config Manager %s", kAppVersion);
    ImGui::TextDisabled("Edits opencode.json, oh-my-opencode.json and auth.json");
    ImGui::Separator();

    if (ImGui::BeginTable("##about", 2, ImGuiTableFlags_SizingFixedFit)) {
        auto row = [](const char* key, const char* value) {
            ImGui::TableNextRow();
            ImGui::TableNextColumn();
            ImGui::TextDisabled("%s", key);
            ImGui::TableNextColumn();
            ImGui::TextUnformatted(value);
        };
        row("Build", __DATE__);
        row("System", platform_name());
        row("ImGui", IMGUI_VERSION);
        ImGui::EndTable();
    }

    ImGui::Spacing();
    if (ImGui::SmallButton("Project page")) open_url(kProjectUrl);
    ImGui::SameLine();
    if (ImGui::SmallButton("Close")) {
        s.about_open = false;
        ImGui::CloseCurrentPopup();
    }
    ImGui::EndPopup();
}

}

void render_dockspace(bool first_frame, const DockspacePanels& panels, const DockspaceContext& context) {
    const PanelEntry entries[6] = {
        {"Overview", "Ctrl+1", panels.show_overview},
        {"Configuration", "Ctrl+2", panels.show_configuration},
        {"Native Providers", "Ctrl+3", panels.show_native_providers},
        {"Import", "Ctrl+4", panels.show_import},
        {"Backups", "Ctrl+5", panels.show_backups},
        {"Validation", "Ctrl+6", panels.show_validation},
    };

    begin_host_window();
    submit_dockspace(first_frame);

    if (ImGui::BeginMenuBar()) {
        file_menu(context);
        view_menu(entries, context);
        help_menu(context);
        ImGui::EndMenuBar();
    }

    handle_shortcuts(entries, context);

    bundle_confirm_popup(context.store);
    bundle_result_popup();
    about_popup();

    ImGui::End();
}

}
