#pragma once

#include "ui/agent_panel.h"
#include "ui/mcp_panel.h"
#include "ui/ohmy_panel.h"
#include "ui/permission_panel.h"
#include "ui/provider_panel.h"
#include "ui/rules_panel.h"
#include "ui/skill_panel.h"

namespace occm {

// "Configuration" window: one tab per section of the two config files.
class ConfigPanel {
public:
    void render(bool* is_open);

    void set_provider_panel(ProviderPanel* panel) { provider_panel_ = panel; }
    void set_mcp_panel(McpPanel* panel) { mcp_panel_ = panel; }
    void set_agent_panel(AgentPanel* panel) { agent_panel_ = panel; }
    void set_permission_panel(PermissionPanel* panel) { permission_panel_ = panel; }
    void set_skill_panel(SkillPanel* panel) { skill_panel_ = panel; }
    void set_rules_panel(RulesPanel* panel) { rules_panel_ = panel; }
    void set_ohmy_panel(OhMyPanel* panel) { ohmy_panel_ = panel; }

private:
    ProviderPanel* provider_panel_ = nullptr;
    McpPanel* mcp_panel_ = nullptr;
    AgentPanel* agent_panel_ = nullptr;
    PermissionPanel* permission_panel_ = nullptr;
    SkillPanel* skill_panel_ = nullptr;
    RulesPanel* rules_panel_ = nullptr;
    OhMyPanel* ohmy_panel_ = nullptr;
};

}
