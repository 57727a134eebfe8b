#include <vsearch_deploy/core/result.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace vsearch_deploy {

namespace {

std::string Trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

// gcloud reports failures as "ERROR: (gcloud.group.command) message", possibly
// after several lines of progress output. Return the message part of the
// first such line.
std::optional<std::string> ExtractToolError(const std::string& diagnostic) {
    std::istringstream lines(diagnostic);
    std::string line;
    while (std::getline(lines, line)) {
        auto trimmed = Trim(line);
        if (trimmed.rfind("ERROR:", 0) != 0) continue;

        auto msg = Trim(trimmed.substr(6));
        if (!msg.empty() && msg[0] == '(') {
            auto close = msg.find(')');
            if (close != std::string::npos) {
                msg = Trim(msg.substr(close + 1));
            }
        }
        if (!msg.empty()) return msg;
    }
    return std::nullopt;
}

} // anonymous namespace

Error Error::FromCommandFailure(const std::string& operation,
                                const std::string& target,
                                ErrorCategory category,
                                int exit_code,
                                const std::string& diagnostic) {
    auto trimmed = Trim(diagnostic);
    auto tool_error = ExtractToolError(trimmed);

    std::string message;
    if (tool_error.has_value()) {
        message = *tool_error;
    } else if (exit_code == 127) {
        message = "command could not be executed";
    } else {
        message = "command exited with status " + std::to_string(exit_code);
    }

    std::optional<std::string> detail;
    if (!trimmed.empty()) {
        detail = trimmed;
    }
    return Error{operation, target, message, detail, category, std::nullopt};
}

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::Usage:                return "usage";
        case ErrorCategory::MissingConfig:        return "missing_config";
        case ErrorCategory::InvalidConfig:        return "invalid_config";
        case ErrorCategory::ToolMissing:          return "tool_missing";
        case ErrorCategory::ConfirmationDeclined: return "confirmation_declined";
        case ErrorCategory::PropagationTimeout:   return "propagation_timeout";
        case ErrorCategory::PermissionGrant:      return "permission_grant";
        case ErrorCategory::ResourceCreation:     return "resource_creation";
        case ErrorCategory::Build:                return "build";
        case ErrorCategory::Deploy:               return "deploy";
        case ErrorCategory::Internal:             return "internal";
    }
    return "internal";
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!target.empty()) {
        oss << " [" << target << "]";
    }
    oss << ": " << message;
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json j;
    j["category"] = CategoryName();
    j["operation"] = operation;
    if (!target.empty()) {
        j["target"] = target;
    }
    j["message"] = message;
    if (detail.has_value()) {
        j["detail"] = *detail;
    }
    if (hint.has_value()) {
        j["hint"] = *hint;
    }
    j["exit_code"] = ExitCode();
    return nlohmann::json{{"error", j}}.dump();
}

} // namespace vsearch_deploy
