#include <catch2/catch_test_macros.hpp>

#include <vsearch_deploy/cloud/iam_policy.hpp>

#include <string>

using namespace vsearch_deploy;

namespace {

const char* kMember = "serviceAccount:vertex-search-app-sa@p1.iam.gserviceaccount.com";
const char* kRole = "roles/discoveryengine.admin";

const char* kPolicyWithOtherMember = R"({
  "bindings": [
    {
      "role": "roles/discoveryengine.admin",
      "members": ["user:owner@example.com"]
    },
    {
      "role": "roles/viewer",
      "members": ["serviceAccount:vertex-search-app-sa@p1.iam.gserviceaccount.com"]
    }
  ],
  "etag": "BwXabc=",
  "version": 1
})";

const char* kPolicyWithBinding = R"({
  "bindings": [
    {
      "role": "roles/discoveryengine.admin",
      "members": [
        "user:owner@example.com",
        "serviceAccount:vertex-search-app-sa@p1.iam.gserviceaccount.com"
      ]
    }
  ],
  "etag": "BwXdef=",
  "version": 1
})";

const char* kPolicyConditional = R"json({
  "bindings": [
    {
      "role": "roles/discoveryengine.admin",
      "members": ["serviceAccount:vertex-search-app-sa@p1.iam.gserviceaccount.com"],
      "condition": {"title": "until-2025", "expression": "request.time < timestamp('2025-01-01T00:00:00Z')"}
    }
  ],
  "etag": "BwXghi=",
  "version": 3
})json";

} // anonymous namespace

// ===========================================================================
// ParseIamPolicy
// ===========================================================================

TEST_CASE("ParseIamPolicy: bindings, etag and version", "[cloud][policy]") {
    auto result = ParseIamPolicy(kPolicyWithOtherMember);
    REQUIRE(result.IsOk());
    const auto& policy = result.Value();
    CHECK(policy.version == 1);
    CHECK(policy.etag == "BwXabc=");
    REQUIRE(policy.bindings.size() == 2);
    CHECK(policy.bindings[0].role == kRole);
    CHECK(policy.bindings[0].members.size() == 1);
    CHECK_FALSE(policy.bindings[0].condition.has_value());
}

TEST_CASE("ParseIamPolicy: condition title", "[cloud][policy]") {
    auto result = ParseIamPolicy(kPolicyConditional);
    REQUIRE(result.IsOk());
    REQUIRE(result.Value().bindings.size() == 1);
    CHECK(result.Value().bindings[0].condition == std::optional<std::string>("until-2025"));
}

TEST_CASE("ParseIamPolicy: empty policy has no bindings", "[cloud][policy]") {
    auto result = ParseIamPolicy(R"({"etag": "ACAB", "version": 1})");
    REQUIRE(result.IsOk());
    CHECK(result.Value().bindings.empty());
}

TEST_CASE("ParseIamPolicy: malformed documents", "[cloud][policy]") {
    CHECK(ParseIamPolicy("bindings:\n- role: x\n").IsErr());
    CHECK(ParseIamPolicy("[1, 2]").IsErr());
    CHECK(ParseIamPolicy(R"({"bindings": "nope"})").IsErr());
    CHECK(ParseIamPolicy(R"({"bindings": [{"role": "r", "members": "m"}]})").IsErr());
}

// ===========================================================================
// HasBinding
// ===========================================================================

TEST_CASE("HasBinding: role bound to another member is not a match", "[cloud][policy]") {
    auto policy = ParseIamPolicy(kPolicyWithOtherMember).Value();
    CHECK_FALSE(HasBinding(policy, kRole, kMember));
    CHECK(HasBinding(policy, "roles/viewer", kMember));
}

TEST_CASE("HasBinding: exact role and member pair", "[cloud][policy]") {
    auto policy = ParseIamPolicy(kPolicyWithBinding).Value();
    CHECK(HasBinding(policy, kRole, kMember));
    CHECK(HasBinding(policy, kRole, "user:owner@example.com"));
    CHECK_FALSE(HasBinding(policy, "roles/discoveryengine.viewer", kMember));
}

TEST_CASE("HasBinding: member comparison is exact", "[cloud][policy]") {
    auto policy = ParseIamPolicy(kPolicyWithBinding).Value();
    CHECK_FALSE(HasBinding(policy, kRole,
                           "vertex-search-app-sa@p1.iam.gserviceaccount.com"));
    CHECK_FALSE(HasBinding(policy, kRole,
                           "serviceAccount:search-app-sa@p1.iam.gserviceaccount.com"));
}

TEST_CASE("HasBinding: conditional bindings do not count", "[cloud][policy]") {
    auto policy = ParseIamPolicy(kPolicyConditional).Value();
    CHECK_FALSE(HasBinding(policy, kRole, kMember));
}

// ===========================================================================
// HasBindingText
// ===========================================================================

TEST_CASE("HasBindingText: YAML rendering", "[cloud][policy]") {
    const std::string text =
        "bindings:\n"
        "- members:\n"
        "  - serviceAccount:vertex-search-app-sa@p1.iam.gserviceaccount.com\n"
        "  role: roles/discoveryengine.admin\n"
        "etag: BwXabc=\n"
        "version: 1\n";
    CHECK(HasBindingText(text, kRole, kMember));
    CHECK_FALSE(HasBindingText(text, "roles/owner", kMember));
    CHECK_FALSE(HasBindingText(text, kRole, "user:someone@example.com"));
}

TEST_CASE("HasBindingText: flattened rendering", "[cloud][policy]") {
    const std::string text =
        "bindings[0].members[0]:  serviceAccount:vertex-search-app-sa@p1.iam.gserviceaccount.com\n"
        "bindings[0].role:        roles/discoveryengine.admin\n";
    CHECK(HasBindingText(text, kRole, kMember));
}

TEST_CASE("HasBindingText: reports a match across unrelated bindings", "[cloud][policy]") {
    // The member holds roles/viewer and someone else holds the admin role.
    const std::string text =
        "bindings:\n"
        "- members:\n"
        "  - user:owner@example.com\n"
        "  role: roles/discoveryengine.admin\n"
        "- members:\n"
        "  - serviceAccount:vertex-search-app-sa@p1.iam.gserviceaccount.com\n"
        "  role: roles/viewer\n";
    CHECK(HasBindingText(text, kRole, kMember));
}

// ===========================================================================
// CheckBinding
// ===========================================================================

TEST_CASE("CheckBinding: JSON takes the structured path", "[cloud][policy]") {
    PolicyDocument doc{PolicyFormat::Json, kPolicyWithOtherMember};
    auto check = CheckBinding(doc, kRole, kMember);
    CHECK(check.path == PolicyCheckPath::Structured);
    CHECK_FALSE(check.present);

    doc.raw = kPolicyWithBinding;
    check = CheckBinding(doc, kRole, kMember);
    CHECK(check.path == PolicyCheckPath::Structured);
    CHECK(check.present);
}

TEST_CASE("CheckBinding: text documents use the fallback", "[cloud][policy]") {
    PolicyDocument doc{PolicyFormat::Text,
                       "bindings:\n- members:\n  - " + std::string(kMember) +
                           "\n  role: " + kRole + "\n"};
    auto check = CheckBinding(doc, kRole, kMember);
    CHECK(check.path == PolicyCheckPath::TextFallback);
    CHECK(check.present);
}

TEST_CASE("CheckBinding: unparseable JSON falls back to text", "[cloud][policy]") {
    PolicyDocument doc{PolicyFormat::Json, "{ truncated " + std::string(kRole)};
    auto check = CheckBinding(doc, kRole, kMember);
    CHECK(check.path == PolicyCheckPath::TextFallback);
    CHECK_FALSE(check.present);
}
