#include "ui/provider_panel.h"
#include "adapters/presets.h"
#include "core/logging.h"
#include "core/string_utils.h"
#include "ui/theme.h"
#include <imgui.h>

namespace occm {

void ProviderPanel::render(bool* open) {
    ImGui::SetNextWindowSizeConstraints(ImVec2(320, 240), ImVec2(FLT_MAX, FLT_MAX));
    if (!ImGui::Begin("Providers", open)) {
        ImGui::End();
        return;
    }
    render_content();
    ImGui::End();
}

void ProviderPanel::render_content() {
    if (!store_) {
        ImGui::TextColored(ImVec4(1, 0.4f, 0.4f, 1), "ConfigStore not initialized");
        return;
    }

    status_.render();

    ImGui::BeginChild("ProviderList", ImVec2(200, 0), true);
    render_provider_list();
    ImGui::EndChild();

    ImGui::SameLine();

    ImGui::BeginChild("ProviderEditor", ImVec2(0, 0), true);
    render_provider_editor();
    ImGui::EndChild();

    if (show_delete_confirm_) {
        ImGui::OpenPopup("Delete Provider?");
        show_delete_confirm_ = false;
    }

    if (ImGui::BeginPopupModal("Delete Provider?", nullptr, ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::Text("Delete provider \"%s\" and its %zu models?", selected_provider_.c_str(),
                    editing_.models.size());
        ImGui::Text("A backup of opencode.json is taken before saving.");
        ImGui::Separator();

        if (ImGui::Button("Delete", ImVec2(100, 0))) {
            delete_provider();
            ImGui::CloseCurrentPopup();
        }
        ImGui::SameLine();
        if (ImGui::Button("Cancel", ImVec2(100, 0))) {
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    }
}

void ProviderPanel::render_provider_list() {
    if (ImGui::Button("+ New Provider", ImVec2(-1, 0))) {
        begin_new_provider();
    }
    ImGui::Separator();

    const auto& providers = store_->opencode().providers;
    if (providers.empty()) {
        ImGui::TextDisabled("(no providers)");
    }

    for (const auto& [id, provider] : providers) {
        ImGui::PushID(id.c_str());
        bool selected = !is_new_provider_ && selected_provider_ == id;
        std::string label = id + " (" + std::to_string(provider.models.size()) + ")";
        if (ImGui::Selectable(label.c_str(), selected)) {
            select_provider(id);
        }
        if (ImGui::IsItemHovered() && !provider.npm.empty()) {
            ImGui::SetTooltip("%s", provider.npm.c_str());
        }
        ImGui::PopID();
    }
}

void ProviderPanel::select_provider(const std::string& id) {
    auto& providers = store_->opencode().providers;
    auto it = providers.find(id);
    if (it == providers.end()) return;

    selected_provider_ = id;
    edit_id_ = id;
    editing_ = it->second;
    is_new_provider_ = false;
    timeout_text_.clear();
    if (editing_.options.contains("timeout") && editing_.options["timeout"].is_number()) {
        timeout_text_ = editing_.options["timeout"].dump();
    }

    selected_model_.clear();
    model_id_.clear();
    model_is_new_ = false;
}

void ProviderPanel::begin_new_provider() {
    selected_provider_.clear();
    edit_id_.clear();
    editing_ = ProviderConfig{};
    editing_.npm = "@ai-sdk/openai-compatible";
    timeout_text_.clear();
    is_new_provider_ = true;
    selected_model_.clear();
    model_is_new_ = false;
}

void ProviderPanel::render_provider_editor() {
    if (selected_provider_.empty() && !is_new_provider_) {
        ImGui::TextDisabled("Select a provider or create a new one");
        ImGui::Spacing();
        ImGui::TextDisabled("Native providers (anthropic, openai, ...) are set up in the Native Providers window.");
        return;
    }

    ImGui::Text("%s", is_new_provider_ ? "New provider" : selected_provider_.c_str());
    ImGui::Separator();

    label_row("ID:");
    ImGui::BeginDisabled(!is_new_provider_);
    input_text("##id", edit_id_, "my-provider", 220);
    ImGui::EndDisabled();

    label_row("Display Name:");
    input_text("##name", editing_.name, "My Provider", 220);

    label_row("SDK:");
    combo_string("##sdk", editing_.npm, sdk_presets(), 260);
    ImGui::SameLine();
    input_text("##sdk_custom", editing_.npm, "custom npm package", -1);

    label_row("Base URL:");
    input_text("##baseurl", editing_.base_url, "https://api.example.com/v1", -1);

    label_row("API Key:");
    input_text("##apikey", editing_.api_key, "{env:MY_PROVIDER_API_KEY}", -1);
    if (ImGui::IsItemHovered()) {
        ImGui::SetTooltip("Literal key or {env:VAR} reference");
    }

    label_row("Timeout (ms):");
    input_text("##timeout", timeout_text_, "optional", 120);

    ImGui::Spacing();
    if (ImGui::Button("Save Provider")) {
        save_provider();
    }
    if (!is_new_provider_) {
        ImGui::SameLine();
        if (ImGui::Button("Delete")) {
            show_delete_confirm_ = true;
        }
    }

    if (!is_new_provider_) {
        ImGui::Spacing();
        render_models_section();
        render_preset_section();
    }
}

void ProviderPanel::save_provider() {
    ProviderConfig provider = editing_;
    const std::string timeout = trim(timeout_text_);
    if (timeout.empty()) {
        provider.options.erase("timeout");
    } else {
        auto parsed = nlohmann::json::parse(timeout, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_number_integer() || parsed.get<int64_t>() <= 0) {
            status_.error("Timeout must be a positive number of milliseconds");
            return;
        }
        provider.options["timeout"] = parsed;
    }

    std::string error;
    const std::string id = trim(edit_id_);
    if (!store_->opencode().save_provider(id, provider, is_new_provider_, error)) {
        status_.error(error);
        return;
    }
    if (persist("Saved provider " + id)) {
        select_provider(id);
    }
}

void ProviderPanel::delete_provider() {
    const std::string id = selected_provider_;
    if (!store_->opencode().remove_provider(id)) return;
    persist("Deleted provider " + id);
    selected_provider_.clear();
    is_new_provider_ = false;
}

void ProviderPanel::render_models_section() {
    if (!ImGui::CollapsingHeader("Models", ImGuiTreeNodeFlags_DefaultOpen)) return;
    ImGui::Indent();

    auto it = store_->opencode().providers.find(selected_provider_);
    if (it == store_->opencode().providers.end()) {
        ImGui::Unindent();
        return;
    }

    std::string to_delete;
    for (const auto& [model_id, model] : it->second.models) {
        ImGui::PushID(model_id.c_str());
        bool selected = !model_is_new_ && selected_model_ == model_id;
        std::string label = model.name.empty() ? model_id : model_id + "  -  " + model.name;
        if (ImGui::Selectable(label.c_str(), selected, 0, ImVec2(ImGui::GetContentRegionAvail().x - 30, 0))) {
            select_model(model_id);
        }
        ImGui::SameLine();
        if (ImGui::SmallButton("X")) {
            to_delete = model_id;
        }
        ImGui::PopID();
    }
    if (it->second.models.empty()) {
        ImGui::TextDisabled("(no models)");
    }

    if (!to_delete.empty()) {
        store_->opencode().remove_model(selected_provider_, to_delete);
        if (selected_model_ == to_delete) selected_model_.clear();
        persist("Deleted model " + to_delete);
    }

    if (ImGui::Button("+ New Model")) {
        begin_new_model();
    }

    if (model_is_new_ || !selected_model_.empty()) {
        ImGui::Separator();
        render_model_editor();
    }

    ImGui::Unindent();
}

void ProviderPanel::select_model(const std::string& id) {
    auto& provider = store_->opencode().providers[selected_provider_];
    auto it = provider.models.find(id);
    if (it == provider.models.end()) return;

    selected_model_ = id;
    model_id_ = id;
    model_editing_ = it->second;
    model_is_new_ = false;
    model_has_limit_ = model_editing_.limit.has_value();
    model_options_text_ = model_editing_.options.empty() ? "" : model_editing_.options.dump(2);
    model_variants_text_ = model_editing_.variants.empty() ? "" : model_editing_.variants.dump(2);
}

void ProviderPanel::begin_new_model() {
    selected_model_.clear();
    model_id_.clear();
    model_editing_ = ModelConfig{};
    model_editing_.limit = ModelLimit{};
    model_has_limit_ = true;
    model_options_text_.clear();
    model_variants_text_.clear();
    model_is_new_ = true;
}

void ProviderPanel::render_model_editor() {
    ImGui::PushID("ModelEditor");

    label_row("Model ID:");
    ImGui::BeginDisabled(!model_is_new_);
    input_text("##modelid", model_id_, "claude-sonnet-4-5", 260);
    ImGui::EndDisabled();

    label_row("Display Name:");
    input_text("##modelname", model_editing_.name, "optional", 260);

    bool attachment = model_editing_.attachment.value_or(false);
    if (ImGui::Checkbox("Attachments", &attachment)) {
        model_editing_.attachment = attachment;
    }
    ImGui::SameLine();
    ImGui::Checkbox("Token limits", &model_has_limit_);

    if (model_has_limit_) {
        if (!model_editing_.limit) model_editing_.limit = ModelLimit{};
        label_row("Context:");
        ImGui::SetNextItemWidth(140);
        if (ImGui::InputScalar("##context", ImGuiDataType_S64, &model_editing_.limit->context)) {
            model_editing_.limit->has_context = true;
        }
        label_row("Output:");
        ImGui::SetNextItemWidth(140);
        if (ImGui::InputScalar("##output", ImGuiDataType_S64, &model_editing_.limit->output)) {
            model_editing_.limit->has_output = true;
        }
    }

    ImGui::TextDisabled("options (JSON object)");
    input_multiline("##options", model_options_text_, 80);
    ImGui::TextDisabled("variants (JSON object)");
    input_multiline("##variants", model_variants_text_, 80);

    if (ImGui::Button("Save Model")) {
        save_model();
    }
    ImGui::SameLine();
    if (ImGui::Button("Cancel")) {
        selected_model_.clear();
        model_is_new_ = false;
    }

    ImGui::PopID();
}

void ProviderPanel::save_model() {
    ModelConfig model = model_editing_;
    if (!model_has_limit_) {
        model.limit.reset();
    } else if (model.limit->context <= 0 || model.limit->output <= 0) {
        status_.error("Token limits must be positive");
        return;
    }

    auto parse_object = [this](const std::string& text, const char* what, nlohmann::json& out) {
        if (trim(text).empty()) {
            out = nlohmann::json::object();
            return true;
        }
        auto parsed = nlohmann::json::parse(text, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            status_.error(std::string(what) + " must be a JSON object");
            return false;
        }
        out = parsed;
        return true;
    };
    if (!parse_object(model_options_text_, "options", model.options)) return;
    if (!parse_object(model_variants_text_, "variants", model.variants)) return;

    std::string error;
    const std::string id = trim(model_id_);
    if (!store_->opencode().save_model(selected_provider_, id, model, model_is_new_, error)) {
        status_.error(error);
        return;
    }
    if (persist("Saved model " + selected_provider_ + "/" + id)) {
        select_model(id);
    }
}

void ProviderPanel::render_preset_section() {
    if (!ImGui::CollapsingHeader("Add From Presets")) return;
    ImGui::Indent();

    std::vector<std::string> series_names;
    for (const auto& series : model_series_presets()) {
        series_names.push_back(series.name);
    }
    if (combo_string("Series", preset_series_, series_names, 200, nullptr)) {
        preset_checked_.clear();
    }

    const auto* series = find_model_series(preset_series_);
    if (!series) {
        ImGui::TextDisabled("Pick a model series");
        ImGui::Unindent();
        return;
    }
    ImGui::TextDisabled("SDK: %s", series->sdk.c_str());

    const auto& existing = store_->opencode().providers[selected_provider_].models;
    for (const auto& preset : series->models) {
        ImGui::PushID(preset.id.c_str());
        bool present = existing.count(preset.id) > 0;
        ImGui::BeginDisabled(present);
        bool checked = present || preset_checked_[preset.id];
        if (ImGui::Checkbox(preset.id.c_str(), &checked)) {
            preset_checked_[preset.id] = checked;
        }
        ImGui::EndDisabled();
        if (ImGui::IsItemHovered(ImGuiHoveredFlags_AllowWhenDisabled) && !preset.description.empty()) {
            ImGui::SetTooltip("%s", preset.description.c_str());
        }
        ImGui::PopID();
    }

    if (ImGui::Button("Add Selected")) {
        std::vector<std::string> ids;
        for (const auto& [id, checked] : preset_checked_) {
            if (checked) ids.push_back(id);
        }
        int added = store_->opencode().add_preset_models(selected_provider_, series->name, ids);
        preset_checked_.clear();
        if (added == 0) {
            status_.set("No new models selected");
        } else {
            persist("Added " + std::to_string(added) + " preset models");
        }
    }

    ImGui::Unindent();
}

bool ProviderPanel::persist(const std::string& ok_message) {
    if (!store_->save_opencode()) {
        status_.error(store_->last_error());
        return false;
    }
    ui_log(spdlog::level::info, "{}", ok_message);
    status_.set(ok_message);
    return true;
}

}
