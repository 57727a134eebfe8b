#include <catch2/catch_test_macros.hpp>

#include <vsearch_deploy/core/retry.hpp>

#include <chrono>
#include <vector>

using namespace vsearch_deploy;
using std::chrono::milliseconds;

TEST_CASE("RetryPolicy: fixed delay", "[retry]") {
    auto policy = RetryPolicy::Fixed(3, milliseconds{10000});
    CHECK(policy.DelayBefore(1) == milliseconds{0});
    CHECK(policy.DelayBefore(2) == milliseconds{10000});
    CHECK(policy.DelayBefore(3) == milliseconds{10000});
}

TEST_CASE("RetryPolicy: backoff is capped", "[retry]") {
    RetryPolicy policy;
    policy.max_attempts = 6;
    policy.delay = milliseconds{1000};
    policy.backoff_multiplier = 2.0;
    policy.max_delay = milliseconds{5000};

    CHECK(policy.DelayBefore(2) == milliseconds{1000});
    CHECK(policy.DelayBefore(3) == milliseconds{2000});
    CHECK(policy.DelayBefore(4) == milliseconds{4000});
    CHECK(policy.DelayBefore(5) == milliseconds{5000});
    CHECK(policy.DelayBefore(6) == milliseconds{5000});
}

TEST_CASE("RetryUntil: stops at the first success", "[retry]") {
    std::vector<milliseconds> sleeps;
    int calls = 0;
    auto outcome = RetryUntil(
        RetryPolicy::Fixed(5, milliseconds{100}),
        [&](milliseconds d) { sleeps.push_back(d); },
        [&](int) {
            ++calls;
            return Result<bool, Error>::Ok(calls == 2);
        });

    REQUIRE(outcome.IsOk());
    CHECK(outcome.Value().satisfied);
    CHECK(outcome.Value().attempts == 2);
    CHECK(calls == 2);
    REQUIRE(sleeps.size() == 1);
    CHECK(sleeps[0] == milliseconds{100});
}

TEST_CASE("RetryUntil: exhausts the budget without sleeping after the last attempt",
          "[retry]") {
    std::vector<milliseconds> sleeps;
    std::vector<int> attempts_seen;
    auto outcome = RetryUntil(
        RetryPolicy::Fixed(3, milliseconds{10000}),
        [&](milliseconds d) { sleeps.push_back(d); },
        [&](int attempt) {
            attempts_seen.push_back(attempt);
            return Result<bool, Error>::Ok(false);
        });

    REQUIRE(outcome.IsOk());
    CHECK_FALSE(outcome.Value().satisfied);
    CHECK(outcome.Value().attempts == 3);
    CHECK(attempts_seen == std::vector<int>{1, 2, 3});
    CHECK(sleeps == std::vector<milliseconds>{milliseconds{10000}, milliseconds{10000}});
}

TEST_CASE("RetryUntil: an error ends the loop at once", "[retry]") {
    int calls = 0;
    auto outcome = RetryUntil(
        RetryPolicy::Fixed(3, milliseconds{1}),
        [](milliseconds) {},
        [&](int) {
            ++calls;
            return Result<bool, Error>::Err(Error{
                "DescribeServiceAccount", "sa", "permission denied", std::nullopt,
                ErrorCategory::ResourceCreation, std::nullopt});
        });

    REQUIRE(outcome.IsErr());
    CHECK(outcome.Error().message == "permission denied");
    CHECK(calls == 1);
}
