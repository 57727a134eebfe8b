#pragma once

#include <vsearch_deploy/cloud/i_cloud_provider.hpp>
#include <vsearch_deploy/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vsearch_deploy {

// ---------------------------------------------------------------------------
// Typed view of a project access policy.
// ---------------------------------------------------------------------------
struct PolicyBinding {
    std::string role;
    std::vector<std::string> members;
    // Title of the binding's condition, if the binding is conditional.
    std::optional<std::string> condition;
};

struct IamPolicy {
    int version = 1;
    std::string etag;
    std::vector<PolicyBinding> bindings;
};

// Parse the provider's JSON policy representation.
Result<IamPolicy, Error> ParseIamPolicy(std::string_view json);

// True if an unconditional binding grants `role` to exactly `member`.
// A binding of the same role to other members does not count.
bool HasBinding(const IamPolicy& policy, std::string_view role,
                std::string_view member);

// Degraded check for policies that are only available as text. Looks for the
// role and the member independently, so it reports a binding when the role is
// bound to someone else and the member appears in another binding. Never used
// when a structured document is available.
bool HasBindingText(std::string_view text, std::string_view role,
                    std::string_view member);

enum class PolicyCheckPath {
    Structured,
    TextFallback,
};

struct BindingCheck {
    bool present = false;
    PolicyCheckPath path = PolicyCheckPath::Structured;
};

// Decide whether `member` already holds `role`. JSON documents that parse go
// through HasBinding; only text documents, or JSON that fails to parse, fall
// back to HasBindingText.
BindingCheck CheckBinding(const PolicyDocument& document, std::string_view role,
                          std::string_view member);

} // namespace vsearch_deploy
