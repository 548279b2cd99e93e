#include "ui/native_provider_panel.h"
#include "auth/provider_options_manager.h"
#include "core/logging.h"
#include "core/string_utils.h"
#include "ui/theme.h"
#include <imgui.h>
#include <algorithm>

namespace occm {

NativeProviderPanel::NativeProviderPanel() = default;

void NativeProviderPanel::set_config_store(ConfigStore* store) {
    store_ = store;
    auth_.reset();
    if (store_) {
        auth_ = std::make_unique<AuthManager>(store_->paths().auth_file());
    }
}

void NativeProviderPanel::render(bool* open) {
    ImGui::SetNextWindowSizeConstraints(ImVec2(360, 240), ImVec2(FLT_MAX, FLT_MAX));
    if (!ImGui::Begin("Native Providers", open)) {
        ImGui::End();
        return;
    }
    render_content();
    ImGui::End();
}

void NativeProviderPanel::render_content() {
    if (!store_ || !auth_) {
        ImGui::TextColored(ImVec4(1, 0.4f, 0.4f, 1), "ConfigStore not initialized");
        return;
    }

    ImGui::TextDisabled("auth.json: %s", auth_->path().string().c_str());
    status_.render();

    ImGui::BeginChild("NativeProviderList", ImVec2(230, 0), true);
    render_provider_list();
    ImGui::EndChild();

    ImGui::SameLine();

    ImGui::BeginChild("NativeProviderDetails", ImVec2(0, 0), true);
    render_provider_details();
    ImGui::EndChild();

    if (show_remove_confirm_) {
        ImGui::OpenPopup("Remove Credentials?");
        show_remove_confirm_ = false;
    }

    if (ImGui::BeginPopupModal("Remove Credentials?", nullptr, ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::Text("Remove the stored credentials for \"%s\" from auth.json?", selected_.c_str());
        ImGui::Separator();

        if (ImGui::Button("Remove", ImVec2(100, 0))) {
            std::string error;
            if (auth_->remove(selected_, error)) {
                status_.set("Removed credentials for " + selected_);
                ui_log(spdlog::level::info, "Removed credentials for {}", selected_);
            } else {
                status_.error(error);
            }
            ImGui::CloseCurrentPopup();
        }
        ImGui::SameLine();
        if (ImGui::Button("Cancel", ImVec2(100, 0))) {
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    }
}

void NativeProviderPanel::render_provider_list() {
    input_text("##filter", filter_, "Filter", -1);
    ImGui::Separator();

    const auto& theme = get_current_theme();
    const auto auth_data = auth_->read();
    ProviderOptionsManager options(store_->opencode());

    for (const auto& provider : native_providers()) {
        if (!filter_.empty() && !contains_ci(provider.name, filter_) && !contains_ci(provider.id, filter_)) {
            continue;
        }
        ImGui::PushID(provider.id.c_str());

        bool has_auth = auth_data.contains(provider.id);
        bool has_env = !env_detector_.detect(provider.id).empty();
        bool configured = options.is_configured(provider.id);

        if (ImGui::Selectable(provider.name.c_str(), selected_ == provider.id, 0,
                              ImVec2(ImGui::GetContentRegionAvail().x - 50, 0))) {
            select_provider(provider.id);
        }
        ImGui::SameLine();
        if (has_auth) {
            ImGui::TextColored(ImGui::ColorConvertU32ToFloat4(theme.success), "key");
        } else if (has_env) {
            ImGui::TextColored(ImGui::ColorConvertU32ToFloat4(theme.info), "env");
        } else if (configured) {
            ImGui::TextDisabled("cfg");
        } else {
            ImGui::TextDisabled(" ");
        }
        ImGui::PopID();
    }
}

void NativeProviderPanel::select_provider(const std::string& id) {
    selected_ = id;
    key_input_.clear();
    show_key_ = false;
    if (const auto* provider = find_native_provider(id)) {
        load_option_buffers(*provider);
    }
}

void NativeProviderPanel::load_option_buffers(const NativeProvider& provider) {
    option_buffers_.clear();
    const auto options = ProviderOptionsManager(store_->opencode()).get_options(provider.id);
    for (const auto& field : provider.option_fields) {
        std::string text;
        if (options.contains(field.key)) {
            const auto& value = options[field.key];
            text = value.is_string() ? value.get<std::string>() : value.dump();
        }
        option_buffers_[field.key] = text;
    }
}

void NativeProviderPanel::render_provider_details() {
    const auto* provider = find_native_provider(selected_);
    if (!provider) {
        ImGui::TextDisabled("Select a provider");
        return;
    }

    ImGui::Text("%s", provider->name.c_str());
    ImGui::SameLine();
    ImGui::TextDisabled("(%s)", provider->id.c_str());
    ImGui::TextDisabled("SDK: %s", provider->sdk.c_str());
    if (!provider->base_url.empty()) {
        ImGui::TextDisabled("Default endpoint: %s", provider->base_url.c_str());
    }
    if (!provider->docs_url.empty()) {
        if (ImGui::SmallButton("Documentation")) {
            open_url(provider->docs_url);
        }
    }
    ImGui::Separator();

    render_auth_section(*provider);
    render_env_section(*provider);
    render_options_section(*provider);
}

void NativeProviderPanel::render_auth_section(const NativeProvider& provider) {
    if (!ImGui::CollapsingHeader("Credentials", ImGuiTreeNodeFlags_DefaultOpen)) return;
    ImGui::Indent();

    if (provider.auth_fields.empty()) {
        ImGui::TextDisabled("Authenticates through the environment or cloud credentials");
        ImGui::Unindent();
        return;
    }

    auto record = auth_->get(provider.id);
    if (record) {
        ImGui::Text("Stored (%s): %s", record->type.c_str(), mask_api_key(record->key).c_str());
        ImGui::SameLine();
        if (ImGui::SmallButton("Remove")) {
            show_remove_confirm_ = true;
        }
    } else {
        ImGui::TextDisabled("No credentials in auth.json");
    }

    for (const auto& field : provider.auth_fields) {
        ImGui::PushID(field.key.c_str());
        label_row((field.label + (field.required ? " *" : "") + ":").c_str());
        int flags = field.secret && !show_key_ ? ImGuiInputTextFlags_Password : 0;
        input_text("##key", key_input_, "paste key", 320, 512, flags);
        ImGui::SameLine();
        ImGui::Checkbox("Show", &show_key_);
        ImGui::PopID();
    }

    ImGui::BeginDisabled(trim(key_input_).empty());
    if (ImGui::Button("Save Key")) {
        std::string error;
        if (auth_->set(provider.id, trim(key_input_), error)) {
            status_.set("Saved credentials for " + provider.name);
            ui_log(spdlog::level::info, "Saved credentials for {}", provider.id);
            key_input_.clear();
        } else {
            status_.error(error);
        }
    }
    ImGui::EndDisabled();

    ImGui::Unindent();
}

void NativeProviderPanel::render_env_section(const NativeProvider& provider) {
    if (provider.env_vars.empty()) return;
    if (!ImGui::CollapsingHeader("Environment", ImGuiTreeNodeFlags_DefaultOpen)) return;
    ImGui::Indent();

    const auto& theme = get_current_theme();
    const auto detected = env_detector_.detect(provider.id);
    for (const auto& name : provider.env_vars) {
        auto it = std::find_if(detected.begin(), detected.end(),
                               [&name](const DetectedEnvVar& var) { return var.variable == name; });
        if (it != detected.end()) {
            ImGui::TextColored(ImGui::ColorConvertU32ToFloat4(theme.success), "%s", name.c_str());
            ImGui::SameLine();
            ImGui::TextDisabled("= %s", it->masked_value.c_str());
        } else {
            ImGui::TextDisabled("%s (not set)", name.c_str());
        }
    }

    bool has_key_field = !provider.auth_fields.empty();
    if (has_key_field && !detected.empty()) {
        if (ImGui::Button("Copy to auth.json")) {
            auto value = env_detector_.value_for(provider.id);
            std::string error;
            if (value && auth_->set(provider.id, *value, error)) {
                status_.set("Stored " + detected.front().variable + " for " + provider.name);
            } else {
                status_.error(error.empty() ? "Variable is empty" : error);
            }
        }
        ImGui::SameLine();
        if (ImGui::Button("Reference in opencode.json")) {
            ProviderOptionsManager options(store_->opencode());
            options.set_option(provider.id, "apiKey", "{env:" + detected.front().variable + "}");
            persist_options("apiKey -> {env:" + detected.front().variable + "}");
        }
    }

    ImGui::Unindent();
}

void NativeProviderPanel::render_options_section(const NativeProvider& provider) {
    if (!ImGui::CollapsingHeader("Options", ImGuiTreeNodeFlags_DefaultOpen)) return;
    ImGui::Indent();

    ProviderOptionsManager options(store_->opencode());
    if (!options.is_configured(provider.id)) {
        ImGui::TextDisabled("Not in opencode.json; defaults apply");
        if (ImGui::Button("Add to opencode.json")) {
            options.ensure_provider(provider.id);
            persist_options("Added provider " + provider.id);
        }
    }

    if (provider.option_fields.empty()) {
        ImGui::TextDisabled("No options for this provider");
    }

    for (const auto& field : provider.option_fields) {
        ImGui::PushID(field.key.c_str());
        label_row((field.label + ":").c_str());

        std::string& buffer = option_buffers_[field.key];
        if (field.kind == OptionKind::Bool) {
            bool value = to_lower(buffer) == "true";
            if (ImGui::Checkbox("##bool", &value)) {
                buffer = value ? "true" : "false";
            }
        } else {
            const char* hint = field.default_value.empty() ? field.hint.c_str() : field.default_value.c_str();
            input_text("##value", buffer, hint, 280);
        }
        if (ImGui::IsItemHovered() && !field.hint.empty()) {
            ImGui::SetTooltip("%s", field.hint.c_str());
        }

        ImGui::SameLine();
        if (ImGui::SmallButton("Set")) {
            if (trim(buffer).empty()) {
                if (options.remove_option(provider.id, field.key)) {
                    persist_options("Cleared " + field.key);
                }
            } else if (options.set_option(provider.id, field.key,
                                          ProviderOptionsManager::parse_option_value(field, buffer))) {
                persist_options("Set " + field.key);
            } else {
                status_.error("Invalid value for " + field.label);
            }
        }
        ImGui::SameLine();
        if (ImGui::SmallButton("X")) {
            buffer.clear();
            if (options.remove_option(provider.id, field.key)) {
                persist_options("Cleared " + field.key);
            }
        }
        ImGui::PopID();
    }

    ImGui::Unindent();
}

bool NativeProviderPanel::persist_options(const std::string& ok_message) {
    if (!store_->save_opencode()) {
        status_.error(store_->last_error());
        return false;
    }
    ui_log(spdlog::level::info, "{}: {}", selected_, ok_message);
    status_.set(ok_message);
    return true;
}

}
