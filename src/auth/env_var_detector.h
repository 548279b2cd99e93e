#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace occm {

struct DetectedEnvVar {
    std::string provider_id;
    std::string variable;
    std::string masked_value;
};

// Looks up the environment variables named by the native provider table.
class EnvVarDetector {
public:
    using Lookup = std::function<std::optional<std::string>(const std::string&)>;

    EnvVarDetector();
    explicit EnvVarDetector(Lookup lookup);

    std::vector<DetectedEnvVar> detect_all() const;
    std::vector<DetectedEnvVar> detect(const std::string& provider_id) const;

    // Full value of the first variable set for provider_id.
    std::optional<std::string> value_for(const std::string& provider_id) const;

private:
    Lookup lookup_;
};

}
