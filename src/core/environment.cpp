#include <vsearch_deploy/core/environment.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <initializer_list>

namespace vsearch_deploy {

std::optional<std::string> ProcessEnvironment::Get(std::string_view name) const {
    const char* value = std::getenv(std::string(name).c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

std::optional<std::string> GetNonEmpty(const IEnvironment& env,
                                       std::string_view name) {
    auto value = env.Get(name);
    if (!value.has_value() || value->empty()) {
        return std::nullopt;
    }
    return value;
}

bool IsTruthy(std::string_view value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

std::optional<std::string> DetectNonInteractiveContext(const IEnvironment& env) {
    for (const char* signal : {"CLOUD_SHELL", "CI"}) {
        if (GetNonEmpty(env, signal).has_value()) {
            return std::string(signal);
        }
    }
    return std::nullopt;
}

} // namespace vsearch_deploy
