#include "adapters/presets.h"

namespace occm {

using nlohmann::json;

namespace {

const json kTextImage = {{"input", {"text", "image"}}, {"output", {"text"}}};
const json kTextOnly = {{"input", {"text"}}, {"output", {"text"}}};

ModelPreset make_preset(const std::string& id, const std::string& name, bool attachment,
                        int64_t context, int64_t output, const json& modalities,
                        const json& options, const json& variants, const std::string& description) {
    ModelPreset preset;
    preset.id = id;
    preset.description = description;
    preset.config.name = name;
    preset.config.attachment = attachment;
    preset.config.limit = ModelLimit{context, output};
    preset.config.modalities = modalities;
    preset.config.options = options;
    preset.config.variants = variants;
    return preset;
}

json claude_thinking(int budget) {
    return {{"thinking", {{"type", "enabled"}, {"budgetTokens", budget}}}};
}

json gemini_thinking(int budget) {
    return {{"thinkingConfig", {{"thinkingBudget", budget}}}};
}

json openai_effort(const std::string& effort) {
    return {{"reasoningEffort", effort}};
}

json gpt5_options(const std::string& effort) {
    return {{"reasoningEffort", effort}, {"textVerbosity", "low"}, {"reasoningSummary", "auto"}};
}

std::vector<ModelSeriesPreset> build_model_series() {
    std::vector<ModelSeriesPreset> series;

    ModelSeriesPreset claude{"Claude", "@ai-sdk/anthropic", {}};
    claude.models.push_back(make_preset(
        "claude-opus-4-5-20251101", "Claude Opus 4.5", true, 200000, 32000, kTextImage,
        claude_thinking(16000),
        {{"high", claude_thinking(32000)}, {"max", claude_thinking(64000)}},
        "Most capable Claude model with extended thinking; options.thinking.budgetTokens sets the budget"));
    claude.models.push_back(make_preset(
        "claude-sonnet-4-5-20250929", "Claude Sonnet 4.5", true, 200000, 16000, kTextImage,
        claude_thinking(8000),
        {{"high", claude_thinking(16000)}, {"max", claude_thinking(32000)}},
        "Balanced Claude model with thinking support"));
    claude.models.push_back(make_preset(
        "claude-sonnet-4-20250514", "Claude Sonnet 4", true, 200000, 8192, kTextImage,
        json::object(), json::object(), "Claude Sonnet 4 without thinking"));
    claude.models.push_back(make_preset(
        "claude-haiku-4-5-20250514", "Claude Haiku 4.5", true, 200000, 8192, kTextImage,
        json::object(), json::object(), "Fast lightweight Claude model"));
    series.push_back(std::move(claude));

    ModelSeriesPreset openai{"OpenAI/Codex", "@ai-sdk/openai", {}};
    openai.models.push_back(make_preset(
        "gpt-5", "GPT-5", true, 256000, 32768, kTextImage, gpt5_options("high"),
        {{"high", gpt5_options("high")}, {"medium", gpt5_options("medium")},
         {"low", gpt5_options("low")}, {"xhigh", gpt5_options("xhigh")}},
        "OpenAI flagship model; options.reasoningEffort: high/medium/low/xhigh"));
    openai.models.push_back(make_preset(
        "gpt-5.1-codex", "GPT-5.1 Codex", true, 256000, 65536, kTextImage,
        {{"reasoningEffort", "high"}, {"textVerbosity", "low"}},
        {{"high", openai_effort("high")}, {"medium", openai_effort("medium")}, {"low", openai_effort("low")}},
        "OpenAI model tuned for programming tasks"));
    openai.models.push_back(make_preset(
        "gpt-4o", "GPT-4o", true, 128000, 16384, kTextImage, json::object(), json::object(),
        "OpenAI multimodal model"));
    openai.models.push_back(make_preset(
        "o1-preview", "o1 Preview", false, 128000, 32768, kTextOnly, openai_effort("high"),
        {{"high", openai_effort("high")}, {"medium", openai_effort("medium")}, {"low", openai_effort("low")}},
        "OpenAI reasoning model with reasoningEffort"));
    openai.models.push_back(make_preset(
        "o3-mini", "o3 Mini", false, 200000, 100000, kTextOnly, openai_effort("high"),
        {{"high", openai_effort("high")}, {"medium", openai_effort("medium")}, {"low", openai_effort("low")}},
        "OpenAI compact reasoning model"));
    series.push_back(std::move(openai));

    ModelSeriesPreset gemini{"Gemini", "@ai-sdk/google", {}};
    gemini.models.push_back(make_preset(
        "gemini-3-pro", "Gemini 3 Pro", true, 2097152, 65536, kTextImage, gemini_thinking(8000),
        {{"low", gemini_thinking(4000)}, {"high", gemini_thinking(16000)}, {"max", gemini_thinking(32000)}},
        "Google Pro model with thinking support"));
    gemini.models.push_back(make_preset(
        "gemini-2.0-flash", "Gemini 2.0 Flash", true, 1048576, 8192, kTextImage, gemini_thinking(4000),
        {{"low", gemini_thinking(2000)}, {"high", gemini_thinking(8000)}},
        "Google Flash model with thinking support"));
    gemini.models.push_back(make_preset(
        "gemini-2.0-flash-thinking-exp", "Gemini 2.0 Flash Thinking", true, 1048576, 65536, kTextImage,
        gemini_thinking(10000), json::object(), "Experimental Gemini thinking model"));
    gemini.models.push_back(make_preset(
        "gemini-1.5-pro", "Gemini 1.5 Pro", true, 2097152, 8192,
        {{"input", {"text", "image", "audio", "video"}}, {"output", {"text"}}},
        json::object(), json::object(), "Long-context Gemini Pro model"));
    series.push_back(std::move(gemini));

    ModelSeriesPreset other{"Other", "@ai-sdk/openai-compatible", {}};
    other.models.push_back(make_preset(
        "minimax-m2.1", "Minimax M2.1", false, 128000, 16384, kTextOnly, json::object(), json::object(),
        "Minimax M2.1"));
    other.models.push_back(make_preset(
        "deepseek-chat", "DeepSeek Chat", false, 64000, 8192, kTextOnly, json::object(), json::object(),
        "DeepSeek chat model"));
    other.models.push_back(make_preset(
        "deepseek-reasoner", "DeepSeek Reasoner", false, 64000, 8192, kTextOnly, json::object(), json::object(),
        "DeepSeek reasoning model"));
    other.models.push_back(make_preset(
        "qwen-max", "Qwen Max", false, 32000, 8192, kTextOnly, json::object(), json::object(),
        "Alibaba Qwen Max"));
    series.push_back(std::move(other));

    return series;
}

}

const std::vector<ModelSeriesPreset>& model_series_presets() {
    static const std::vector<ModelSeriesPreset> series = build_model_series();
    return series;
}

const ModelSeriesPreset* find_model_series(const std::string& name) {
    for (const auto& series : model_series_presets()) {
        if (series.name == name) return &series;
    }
    return nullptr;
}

const ModelPreset* find_model_preset(const std::string& series_name, const std::string& model_id) {
    const auto* series = find_model_series(series_name);
    if (!series) return nullptr;
    for (const auto& model : series->models) {
        if (model.id == model_id) return &model;
    }
    return nullptr;
}

const std::vector<std::string>& sdk_presets() {
    static const std::vector<std::string> sdks = {
        "@ai-sdk/anthropic",
        "@ai-sdk/openai",
        "@ai-sdk/google",
        "@ai-sdk/azure",
        "@ai-sdk/openai-compatible",
    };
    return sdks;
}

const std::vector<OpenCodeAgentPreset>& opencode_agent_presets() {
    static const std::vector<OpenCodeAgentPreset> presets = {
        {"build", "primary", "Default primary agent with every tool enabled, for development work",
         {{"write", true}, {"edit", true}, {"bash", true}}, nullptr},
        {"plan", "primary", "Planning agent with restricted writes, for analysis and planning",
         {}, {{"edit", "ask"}, {"bash", "ask"}}},
        {"general", "subagent", "General subagent for research and multi-step tasks", {}, nullptr},
        {"explore", "subagent", "Fast exploration agent for codebase search and pattern discovery", {}, nullptr},
        {"code-reviewer", "subagent", "Read-only review agent focused on code quality",
         {{"write", false}, {"edit", false}}, nullptr},
        {"docs-writer", "subagent", "Documentation agent focused on technical writing",
         {{"bash", false}}, nullptr},
        {"security-auditor", "subagent", "Read-only agent focused on security vulnerabilities",
         {{"write", false}, {"edit", false}}, nullptr},
    };
    return presets;
}

const OpenCodeAgentPreset* find_opencode_agent_preset(const std::string& name) {
    for (const auto& preset : opencode_agent_presets()) {
        if (preset.name == name) return &preset;
    }
    return nullptr;
}

const std::vector<OhMyAgentPreset>& ohmy_agent_presets() {
    static const std::vector<OhMyAgentPreset> presets = {
        {"oracle", "Architecture, code review and strategy; for complex decisions and deep analysis"},
        {"librarian", "Multi-repository analysis, documentation lookup and implementation examples"},
        {"explore", "Fast codebase exploration and pattern matching"},
        {"frontend-ui-ux-engineer", "UI/UX design and frontend development"},
        {"document-writer", "Technical writing: READMEs, API docs"},
        {"multimodal-looker", "Visual content analysis: images, PDFs and other media"},
        {"code-reviewer", "Code quality and security review"},
        {"debugger", "Problem diagnosis and bug fixing"},
    };
    return presets;
}

const OhMyAgentPreset* find_ohmy_agent_preset(const std::string& name) {
    for (const auto& preset : ohmy_agent_presets()) {
        if (preset.name == name) return &preset;
    }
    return nullptr;
}

const std::vector<CategoryPreset>& category_presets() {
    static const std::vector<CategoryPreset> presets = {
        {"visual", 0.7, "Frontend, UI/UX and design tasks"},
        {"business-logic", 0.1, "Backend logic, architecture and strategic reasoning"},
        {"documentation", 0.3, "Documentation and technical writing"},
        {"code-analysis", 0.2, "Code review and refactoring analysis"},
    };
    return presets;
}

const CategoryPreset* find_category_preset(const std::string& name) {
    for (const auto& preset : category_presets()) {
        if (preset.name == name) return &preset;
    }
    return nullptr;
}

const std::vector<std::string>& common_permission_tools() {
    static const std::vector<std::string> tools = {
        "bash", "read", "write", "edit", "glob", "grep", "webfetch", "websearch", "task",
    };
    return tools;
}

}
