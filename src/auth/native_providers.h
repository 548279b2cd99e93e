#pragma once

#include <string>
#include <vector>

namespace occm {

struct AuthField {
    std::string key;
    std::string label;
    bool secret = true;
    bool required = true;
};

enum class OptionKind {
    Text,
    Number,
    Bool
};

struct OptionField {
    std::string key;
    std::string label;
    OptionKind kind = OptionKind::Text;
    std::string default_value;
    std::string hint;
};

struct NativeProvider {
    std::string id;
    std::string name;
    std::string sdk;
    std::string base_url;
    std::vector<std::string> env_vars;
    std::vector<AuthField> auth_fields;
    std::vector<OptionField> option_fields;
    std::string docs_url;
};

const std::vector<NativeProvider>& native_providers();
const NativeProvider* find_native_provider(const std::string& id);

}
