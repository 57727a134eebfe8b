#include <vsearch_deploy/cloud/iam_policy.hpp>

#include <vsearch_deploy/core/log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <sstream>

namespace vsearch_deploy {

namespace {

Error MakePolicyError(const std::string& message) {
    return Error{"ParseIamPolicy", "", message, std::nullopt,
                 ErrorCategory::PermissionGrant, std::nullopt};
}

std::string_view Trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r");
    if (first == std::string_view::npos) return {};
    const auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

std::string_view StripQuotes(std::string_view s) {
    if (s.size() >= 2 && (s.front() == '\'' || s.front() == '"') &&
        s.back() == s.front()) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

struct TextLine {
    std::string_view key;
    std::string_view value;
};

// Split "bindings[0].role:   roles/x", "  role: roles/x" and "- user:a@b"
// into key and value. Member values contain ':' themselves, so the key ends
// at the first ": " rather than the first ':'.
TextLine SplitTextLine(std::string_view line) {
    auto t = Trim(line);
    if (t.size() >= 2 && t[0] == '-' && t[1] == ' ') {
        t = Trim(t.substr(2));
        auto sep = t.find(": ");
        if (sep == std::string_view::npos) {
            return {"-", StripQuotes(t)};
        }
    }
    auto sep = t.find(": ");
    if (sep == std::string_view::npos) {
        return {t, {}};
    }
    return {Trim(t.substr(0, sep)), StripQuotes(Trim(t.substr(sep + 2)))};
}

bool KeyEndsWith(std::string_view key, std::string_view suffix) {
    return key.size() >= suffix.size() &&
           key.substr(key.size() - suffix.size()) == suffix;
}

} // anonymous namespace

Result<IamPolicy, Error> ParseIamPolicy(std::string_view json) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(json);
    } catch (const nlohmann::json::exception& e) {
        return Result<IamPolicy, Error>::Err(
            MakePolicyError(std::string("Policy is not valid JSON: ") + e.what()));
    }
    if (!doc.is_object()) {
        return Result<IamPolicy, Error>::Err(
            MakePolicyError("Policy document is not a JSON object"));
    }

    IamPolicy policy;
    try {
        policy.version = doc.value("version", 1);
        policy.etag = doc.value("etag", "");

        if (doc.contains("bindings")) {
            const auto& bindings = doc.at("bindings");
            if (!bindings.is_array()) {
                return Result<IamPolicy, Error>::Err(
                    MakePolicyError("'bindings' is not an array"));
            }
            for (const auto& b : bindings) {
                PolicyBinding binding;
                binding.role = b.value("role", "");
                if (b.contains("members")) {
                    binding.members = b.at("members").get<std::vector<std::string>>();
                }
                if (b.contains("condition") && !b.at("condition").is_null()) {
                    binding.condition = b.at("condition").value("title", "untitled");
                }
                policy.bindings.push_back(std::move(binding));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return Result<IamPolicy, Error>::Err(
            MakePolicyError(std::string("Unexpected policy structure: ") + e.what()));
    }

    return Result<IamPolicy, Error>::Ok(std::move(policy));
}

bool HasBinding(const IamPolicy& policy, std::string_view role,
                std::string_view member) {
    return std::any_of(
        policy.bindings.begin(), policy.bindings.end(),
        [&](const PolicyBinding& b) {
            return b.role == role && !b.condition.has_value() &&
                   std::find(b.members.begin(), b.members.end(), member) !=
                       b.members.end();
        });
}

bool HasBindingText(std::string_view text, std::string_view role,
                    std::string_view member) {
    bool role_seen = false;
    bool member_seen = false;

    std::istringstream lines{std::string(text)};
    std::string line;
    while (std::getline(lines, line)) {
        auto parts = SplitTextLine(line);
        if (KeyEndsWith(parts.key, "role") && parts.value == role) {
            role_seen = true;
        }
        if (parts.value == member) {
            member_seen = true;
        }
    }
    return role_seen && member_seen;
}

BindingCheck CheckBinding(const PolicyDocument& document, std::string_view role,
                          std::string_view member) {
    if (document.format == PolicyFormat::Json) {
        auto policy = ParseIamPolicy(document.raw);
        if (policy.IsOk()) {
            return {HasBinding(policy.Value(), role, member),
                    PolicyCheckPath::Structured};
        }
        LogWarn("policy", "Could not parse policy as JSON (" +
                              policy.Error().message +
                              "); falling back to text matching");
    } else {
        LogWarn("policy", "Policy only available as text; binding check is best-effort");
    }
    return {HasBindingText(document.raw, role, member),
            PolicyCheckPath::TextFallback};
}

} // namespace vsearch_deploy
