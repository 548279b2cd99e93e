#include "auth/native_providers.h"

namespace occm {

namespace {

AuthField api_key_field(const std::string& label = "API Key") {
    return {"key", label, true, true};
}

OptionField base_url_option(const std::string& hint = "Leave empty for the default endpoint") {
    return {"baseURL", "Base URL", OptionKind::Text, "", hint};
}

OptionField timeout_option() {
    return {"timeout", "Timeout (ms)", OptionKind::Number, "300000", "Request timeout in milliseconds"};
}

std::vector<NativeProvider> build_providers() {
    std::vector<NativeProvider> providers;

    providers.push_back({"anthropic", "Anthropic", "@ai-sdk/anthropic", "https://api.anthropic.com/v1",
                         {"ANTHROPIC_API_KEY"}, {api_key_field()},
                         {base_url_option(), timeout_option()},
                         "https://docs.anthropic.com"});
    providers.push_back({"openai", "OpenAI", "@ai-sdk/openai", "https://api.openai.com/v1",
                         {"OPENAI_API_KEY"}, {api_key_field()},
                         {base_url_option(), timeout_option(),
                          {"organization", "Organization", OptionKind::Text, "", "Optional organization ID"}},
                         "https://platform.openai.com/docs"});
    providers.push_back({"google", "Google Gemini", "@ai-sdk/google", "https://generativelanguage.googleapis.com/v1beta",
                         {"GOOGLE_GENERATIVE_AI_API_KEY", "GEMINI_API_KEY"}, {api_key_field()},
                         {base_url_option(), timeout_option()},
                         "https://ai.google.dev/gemini-api/docs"});
    providers.push_back({"google-vertex", "Google Vertex AI", "@ai-sdk/google-vertex", "",
                         {"GOOGLE_APPLICATION_CREDENTIALS", "GOOGLE_CLOUD_PROJECT"}, {},
                         {{"project", "Project ID", OptionKind::Text, "", "Google Cloud project"},
                          {"location", "Location", OptionKind::Text, "us-central1", "Vertex AI region"}},
                         "https://cloud.google.com/vertex-ai/docs"});
    providers.push_back({"amazon-bedrock", "Amazon Bedrock", "@ai-sdk/amazon-bedrock", "",
                         {"AWS_ACCESS_KEY_ID", "AWS_SECRET_ACCESS_KEY", "AWS_PROFILE", "AWS_REGION"}, {},
                         {{"region", "Region", OptionKind::Text, "us-east-1", "AWS region"},
                          {"profile", "Profile", OptionKind::Text, "", "Named AWS profile"}},
                         "https://docs.aws.amazon.com/bedrock"});
    providers.push_back({"azure", "Azure OpenAI", "@ai-sdk/azure", "",
                         {"AZURE_API_KEY", "AZURE_RESOURCE_NAME"}, {api_key_field()},
                         {{"resourceName", "Resource Name", OptionKind::Text, "", "Azure resource name"},
                          {"apiVersion", "API Version", OptionKind::Text, "", "Optional API version"}},
                         "https://learn.microsoft.com/azure/ai-services/openai"});
    providers.push_back({"github-copilot", "GitHub Copilot", "@ai-sdk/github-copilot", "",
                         {"GITHUB_TOKEN"}, {{"key", "OAuth Token", true, false}}, {},
                         "https://docs.github.com/copilot"});
    providers.push_back({"openrouter", "OpenRouter", "@openrouter/ai-sdk-provider", "https://openrouter.ai/api/v1",
                         {"OPENROUTER_API_KEY"}, {api_key_field()},
                         {base_url_option()},
                         "https://openrouter.ai/docs"});
    providers.push_back({"groq", "Groq", "@ai-sdk/groq", "https://api.groq.com/openai/v1",
                         {"GROQ_API_KEY"}, {api_key_field()}, {base_url_option()},
                         "https://console.groq.com/docs"});
    providers.push_back({"mistral", "Mistral", "@ai-sdk/mistral", "https://api.mistral.ai/v1",
                         {"MISTRAL_API_KEY"}, {api_key_field()}, {base_url_option()},
                         "https://docs.mistral.ai"});
    providers.push_back({"deepseek", "DeepSeek", "@ai-sdk/deepseek", "https://api.deepseek.com/v1",
                         {"DEEPSEEK_API_KEY"}, {api_key_field()}, {base_url_option()},
                         "https://api-docs.deepseek.com"});
    providers.push_back({"xai", "xAI", "@ai-sdk/xai", "https://api.x.ai/v1",
                         {"XAI_API_KEY"}, {api_key_field()}, {base_url_option()},
                         "https://docs.x.ai"});
    providers.push_back({"togetherai", "Together AI", "@ai-sdk/togetherai", "https://api.together.xyz/v1",
                         {"TOGETHER_AI_API_KEY", "TOGETHER_API_KEY"}, {api_key_field()}, {base_url_option()},
                         "https://docs.together.ai"});
    providers.push_back({"fireworks", "Fireworks AI", "@ai-sdk/fireworks", "https://api.fireworks.ai/inference/v1",
                         {"FIREWORKS_API_KEY"}, {api_key_field()}, {base_url_option()},
                         "https://docs.fireworks.ai"});
    providers.push_back({"cerebras", "Cerebras", "@ai-sdk/cerebras", "https://api.cerebras.ai/v1",
                         {"CEREBRAS_API_KEY"}, {api_key_field()}, {base_url_option()},
                         "https://inference-docs.cerebras.ai"});
    providers.push_back({"deepinfra", "DeepInfra", "@ai-sdk/deepinfra", "https://api.deepinfra.com/v1/openai",
                         {"DEEPINFRA_API_KEY"}, {api_key_field()}, {base_url_option()},
                         "https://deepinfra.com/docs"});
    providers.push_back({"perplexity", "Perplexity", "@ai-sdk/perplexity", "https://api.perplexity.ai",
                         {"PERPLEXITY_API_KEY"}, {api_key_field()}, {base_url_option()},
                         "https://docs.perplexity.ai"});
    providers.push_back({"cohere", "Cohere", "@ai-sdk/cohere", "https://api.cohere.com/v2",
                         {"COHERE_API_KEY"}, {api_key_field()}, {base_url_option()},
                         "https://docs.cohere.com"});
    providers.push_back({"zhipuai", "Zhipu AI", "@ai-sdk/openai-compatible", "https://open.bigmodel.cn/api/paas/v4",
                         {"ZHIPU_API_KEY"}, {api_key_field()}, {base_url_option()},
                         "https://open.bigmodel.cn/dev/api"});
    providers.push_back({"moonshotai", "Moonshot AI", "@ai-sdk/openai-compatible", "https://api.moonshot.cn/v1",
                         {"MOONSHOT_API_KEY"}, {api_key_field()}, {base_url_option()},
                         "https://platform.moonshot.cn/docs"});
    providers.push_back({"ollama", "Ollama (local)", "@ai-sdk/openai-compatible", "http://localhost:11434/v1",
                         {"OLLAMA_HOST"}, {},
                         {base_url_option("Local Ollama server, e.g. http://localhost:11434/v1")},
                         "https://github.com/ollama/ollama/blob/main/docs/openai.md"});
    providers.push_back({"lmstudio", "LM Studio (local)", "@ai-sdk/openai-compatible", "http://127.0.0.1:1234/v1",
                         {}, {},
                         {base_url_option("Local LM Studio server")},
                         "https://lmstudio.ai/docs"});

    return providers;
}

}

const std::vector<NativeProvider>& native_providers() {
    static const std::vector<NativeProvider> providers = build_providers();
    return providers;
}

const NativeProvider* find_native_provider(const std::string& id) {
    for (const auto& provider : native_providers()) {
        if (provider.id == id) return &provider;
    }
    return nullptr;
}

}
