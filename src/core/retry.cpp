#include <vsearch_deploy/core/retry.hpp>

#include <algorithm>
#include <cmath>
#include <thread>

namespace vsearch_deploy {

RetryPolicy RetryPolicy::Fixed(int attempts, std::chrono::milliseconds delay) {
    RetryPolicy policy;
    policy.max_attempts = attempts;
    policy.delay = delay;
    policy.backoff_multiplier = 1.0;
    policy.max_delay = std::max(delay, policy.max_delay);
    return policy;
}

std::chrono::milliseconds RetryPolicy::DelayBefore(int attempt) const {
    if (attempt <= 1) {
        return std::chrono::milliseconds{0};
    }
    const double factor = std::pow(std::max(backoff_multiplier, 1.0), attempt - 2);
    const auto scaled = static_cast<double>(delay.count()) * factor;
    const auto capped = std::min(scaled, static_cast<double>(max_delay.count()));
    return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(capped)};
}

SleepFn ThreadSleep() {
    return [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

Result<RetryOutcome, Error> RetryUntil(
    const RetryPolicy& policy,
    const SleepFn& sleep,
    const std::function<Result<bool, Error>(int attempt)>& probe) {
    RetryOutcome outcome;
    for (int attempt = 1; attempt <= policy.max_attempts; ++attempt) {
        auto wait = policy.DelayBefore(attempt);
        if (wait.count() > 0) {
            sleep(wait);
        }

        outcome.attempts = attempt;
        auto result = probe(attempt);
        if (result.IsErr()) {
            return Result<RetryOutcome, Error>::Err(std::move(result).Error());
        }
        if (result.Value()) {
            outcome.satisfied = true;
            return Result<RetryOutcome, Error>::Ok(outcome);
        }
    }
    return Result<RetryOutcome, Error>::Ok(outcome);
}

} // namespace vsearch_deploy
