#include "ui/config_panel.h"
#include <imgui.h>

namespace occm {

void ConfigPanel::render(bool* is_open) {
    if (is_open && !*is_open) {
        return;
    }

    ImGui::SetNextWindowSizeConstraints(ImVec2(480, 320), ImVec2(FLT_MAX, FLT_MAX));

    if (!ImGui::Begin("Configuration", is_open)) {
        ImGui::End();
        return;
    }

    if (ImGui::BeginTabBar("ConfigTabs")) {
        if (ImGui::BeginTabItem("Providers")) {
            if (provider_panel_) {
                provider_panel_->render_content();
            }
            ImGui::EndTabItem();
        }

        if (ImGui::BeginTabItem("MCP")) {
            if (mcp_panel_) {
                mcp_panel_->render_content();
            }
            ImGui::EndTabItem();
        }

        if (ImGui::BeginTabItem("Agents")) {
            if (agent_panel_) {
                agent_panel_->render_content();
            }
            ImGui::EndTabItem();
        }

        if (ImGui::BeginTabItem("Permissions")) {
            if (permission_panel_) {
                permission_panel_->render_content();
            }
            ImGui::EndTabItem();
        }

        if (ImGui::BeginTabItem("Skills")) {
            if (skill_panel_) {
                skill_panel_->render_content();
            }
            ImGui::EndTabItem();
        }

        if (ImGui::BeginTabItem("Rules")) {
            if (rules_panel_) {
                rules_panel_->render_content();
            }
            ImGui::EndTabItem();
        }

        if (ImGui::BeginTabItem("Oh My OpenCode")) {
            if (ohmy_panel_) {
                ohmy_panel_->render_content();
            }
            ImGui::EndTabItem();
        }

        ImGui::EndTabBar();
    }

    ImGui::End();
}

}
