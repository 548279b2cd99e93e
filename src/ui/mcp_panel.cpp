#include "ui/mcp_panel.h"
#include "core/logging.h"
#include "core/string_utils.h"
#include "ui/theme.h"
#include <imgui.h>
#include <algorithm>

namespace occm {

void McpPanel::render(bool* open) {
    ImGui::SetNextWindowSizeConstraints(ImVec2(320, 240), ImVec2(FLT_MAX, FLT_MAX));
    if (!ImGui::Begin("MCP Servers", open)) {
        ImGui::End();
        return;
    }
    render_content();
    ImGui::End();
}

void McpPanel::render_content() {
    if (!store_) {
        ImGui::TextColored(ImVec4(1, 0.4f, 0.4f, 1), "ConfigStore not initialized");
        return;
    }

    status_.render();

    ImGui::BeginChild("McpList", ImVec2(220, 0), true);
    render_server_list();
    ImGui::EndChild();

    ImGui::SameLine();

    ImGui::BeginChild("McpEditor", ImVec2(0, 0), true);
    render_server_editor();
    ImGui::EndChild();

    if (show_delete_confirm_) {
        ImGui::OpenPopup("Delete MCP Server?");
        show_delete_confirm_ = false;
    }

    if (ImGui::BeginPopupModal("Delete MCP Server?", nullptr, ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::Text("Delete MCP server \"%s\"?", pending_delete_.c_str());
        ImGui::Separator();

        if (ImGui::Button("Delete", ImVec2(100, 0))) {
            if (store_->opencode().remove_mcp(pending_delete_)) {
                persist("Deleted MCP " + pending_delete_);
            }
            if (selected_ == pending_delete_) selected_.clear();
            pending_delete_.clear();
            ImGui::CloseCurrentPopup();
        }
        ImGui::SameLine();
        if (ImGui::Button("Cancel", ImVec2(100, 0))) {
            pending_delete_.clear();
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    }
}

void McpPanel::render_server_list() {
    if (ImGui::Button("+ New Server", ImVec2(-1, 0))) {
        begin_new_server();
    }
    ImGui::Separator();

    const auto& theme = get_current_theme();
    auto& servers = store_->opencode().mcp;
    if (servers.empty()) {
        ImGui::TextDisabled("(no MCP servers)");
    }

    std::string toggled;
    bool toggled_value = false;
    for (auto& [name, server] : servers) {
        ImGui::PushID(name.c_str());

        bool enabled = server.enabled;
        if (ImGui::Checkbox("##enabled", &enabled)) {
            toggled = name;
            toggled_value = enabled;
        }
        if (ImGui::IsItemHovered()) {
            ImGui::SetTooltip("%s", enabled ? "Enabled" : "Disabled");
        }
        ImGui::SameLine();

        bool selected = !is_new_ && selected_ == name;
        if (ImGui::Selectable(name.c_str(), selected, 0, ImVec2(ImGui::GetContentRegionAvail().x - 60, 0))) {
            select_server(name);
        }
        ImGui::SameLine();
        ImGui::TextColored(ImGui::ColorConvertU32ToFloat4(server.type == McpType::Remote ? theme.info : theme.foreground_dim),
                           "%s", mcp_type_name(server.type));

        ImGui::PopID();
    }

    if (!toggled.empty()) {
        store_->opencode().set_mcp_enabled(toggled, toggled_value);
        persist(std::string(toggled_value ? "Enabled " : "Disabled ") + toggled);
        if (selected_ == toggled) editing_.enabled = toggled_value;
    }
}

void McpPanel::select_server(const std::string& name) {
    auto& servers = store_->opencode().mcp;
    auto it = servers.find(name);
    if (it == servers.end()) return;

    selected_ = name;
    edit_name_ = name;
    editing_ = it->second;
    timeout_ms_ = editing_.timeout.value_or(kDefaultMcpTimeoutMs);
    is_new_ = false;
}

void McpPanel::begin_new_server() {
    selected_.clear();
    edit_name_.clear();
    editing_ = McpServer{};
    timeout_ms_ = kDefaultMcpTimeoutMs;
    is_new_ = true;
}

void McpPanel::render_server_editor() {
    if (selected_.empty() && !is_new_) {
        ImGui::TextDisabled("Select an MCP server or create a new one");
        return;
    }

    ImGui::Text("%s", is_new_ ? "New MCP server" : selected_.c_str());
    ImGui::Separator();

    label_row("Name:");
    ImGui::BeginDisabled(!is_new_);
    input_text("##name", edit_name_, "filesystem", 220);
    ImGui::EndDisabled();

    label_row("Type:");
    int type = editing_.type == McpType::Remote ? 1 : 0;
    if (ImGui::RadioButton("local", &type, 0)) editing_.type = McpType::Local;
    ImGui::SameLine();
    if (ImGui::RadioButton("remote", &type, 1)) editing_.type = McpType::Remote;

    ImGui::Checkbox("Enabled", &editing_.enabled);

    label_row("Timeout (ms):");
    ImGui::SetNextItemWidth(140);
    ImGui::InputScalar("##timeout", ImGuiDataType_S64, &timeout_ms_);

    ImGui::Spacing();
    if (editing_.type == McpType::Local) {
        render_string_list("Command", editing_.command, "argument");
        ImGui::TextDisabled("e.g. npx, -y, @modelcontextprotocol/server-filesystem");
        ImGui::Spacing();
        render_string_map("Environment", editing_.environment);
    } else {
        label_row("URL:");
        input_text("##url", editing_.url, "https://mcp.example.com/sse", -1);
        ImGui::Spacing();
        render_string_map("Headers", editing_.headers);
    }

    ImGui::Spacing();
    if (ImGui::Button("Save")) {
        save_server();
    }
    if (!is_new_) {
        ImGui::SameLine();
        if (ImGui::Button("Delete")) {
            pending_delete_ = selected_;
            show_delete_confirm_ = true;
        }
    }
}

void McpPanel::save_server() {
    if (timeout_ms_ <= 0) {
        status_.error("Timeout must be positive");
        return;
    }

    McpServer server = editing_;
    server.timeout = timeout_ms_;
    server.command.erase(std::remove_if(server.command.begin(), server.command.end(),
                                        [](const std::string& arg) { return trim(arg).empty(); }),
                         server.command.end());
    if (server.type == McpType::Local && server.command.empty()) {
        status_.error("Local MCP server requires a command");
        return;
    }

    std::string error;
    const std::string name = trim(edit_name_);
    if (!store_->opencode().save_mcp(name, server, is_new_, error)) {
        status_.error(error);
        return;
    }
    if (persist("Saved MCP " + name)) {
        select_server(name);
    }
}

bool McpPanel::persist(const std::string& ok_message) {
    if (!store_->save_opencode()) {
        status_.error(store_->last_error());
        return false;
    }
    ui_log(spdlog::level::info, "{}", ok_message);
    status_.set(ok_message);
    return true;
}

}
