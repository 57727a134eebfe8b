#pragma once

#include <vsearch_deploy/core/result.hpp>

#include <chrono>
#include <functional>

namespace vsearch_deploy {

// ---------------------------------------------------------------------------
// RetryPolicy — bounded retry for remote effects that propagate
// asynchronously. A multiplier of 1.0 gives a fixed delay.
// ---------------------------------------------------------------------------
struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds delay{10000};
    double backoff_multiplier = 1.0;
    std::chrono::milliseconds max_delay{60000};

    static RetryPolicy Fixed(int attempts, std::chrono::milliseconds delay);

    // Wait inserted before `attempt` (1-based). Zero before the first attempt.
    [[nodiscard]] std::chrono::milliseconds DelayBefore(int attempt) const;
};

using SleepFn = std::function<void(std::chrono::milliseconds)>;

// Blocks the calling thread.
SleepFn ThreadSleep();

struct RetryOutcome {
    bool satisfied = false;
    int attempts = 0;
};

// Call `probe` until it returns true or policy.max_attempts calls were made,
// sleeping DelayBefore(n) before call n. An Err from the probe ends the loop
// at once and is returned unchanged.
Result<RetryOutcome, Error> RetryUntil(
    const RetryPolicy& policy,
    const SleepFn& sleep,
    const std::function<Result<bool, Error>(int attempt)>& probe);

} // namespace vsearch_deploy
