#include "core/jsonc.h"

namespace occm {

std::string strip_jsonc_comments(const std::string& content) {
    std::string cleaned;
    cleaned.reserve(content.size());
    bool in_string = false;
    bool escaped = false;
    size_t i = 0;

    while (i < content.size()) {
        char c = content[i];

        if (escaped) {
            cleaned += c;
            escaped = false;
            ++i;
            continue;
        }

        if (in_string) {
            if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
            }
            cleaned += c;
            ++i;
            continue;
        }

        if (c == '"') {
            in_string = true;
            cleaned += c;
            ++i;
            continue;
        }

        if (c == '/' && i + 1 < content.size()) {
            if (content[i + 1] == '/') {
                while (i < content.size() && content[i] != '\n') ++i;
                continue;
            }
            if (content[i + 1] == '*') {
                i += 2;
                while (i + 1 < content.size() && !(content[i] == '*' && content[i + 1] == '/')) ++i;
                // Unterminated block comment swallows the rest of the input.
                i = (i + 1 < content.size()) ? i + 2 : content.size();
                continue;
            }
        }

        cleaned += c;
        ++i;
    }

    return cleaned;
}

std::optional<nlohmann::json> parse_jsonc(const std::string& content, std::string& error_out) {
    error_out.clear();

    auto direct = nlohmann::json::parse(content, nullptr, false);
    if (!direct.is_discarded()) {
        return direct;
    }

    try {
        return nlohmann::json::parse(strip_jsonc_comments(content));
    } catch (const nlohmann::json::parse_error& e) {
        error_out = e.what();
        return std::nullopt;
    }
}

}
