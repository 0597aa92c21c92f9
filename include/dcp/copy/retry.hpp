#pragma once

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <thread>
#include <utility>

namespace dcp::copy {

/**
 * @brief Attempt budget and exponential backoff between attempts
 */
struct RetryPolicy {
    std::uint32_t max_attempts = 3;
    std::chrono::milliseconds initial_delay{100};
    double backoff_multiplier = 2.0;
    std::chrono::milliseconds max_delay{10000};

    /// Delay after the given number of failed attempts (1-based), capped at max_delay
    std::chrono::milliseconds delay_for(std::uint32_t failed_attempts) const;

    /// max_attempts, with 0 treated as a single attempt
    std::uint32_t attempt_budget() const noexcept { return max_attempts == 0 ? 1 : max_attempts; }
};

/**
 * @brief Runs @p attempt until it succeeds or retrying is pointless
 *
 * @p attempt is a no-argument callable returning a Result. After a failure
 * @p is_retriable decides from the error whether another attempt makes
 * sense; @p sleep is called with the backoff delay in between. Returns the
 * first success, the first non-retriable error, or the last error once the
 * budget is used up.
 */
template<typename Attempt, typename Classifier, typename Sleeper>
auto retry(Attempt&& attempt, Classifier&& is_retriable, const RetryPolicy& policy, Sleeper&& sleep)
    -> decltype(attempt()) {
    const std::uint32_t budget = policy.attempt_budget();
    std::uint32_t failed = 0;
    while (true) {
        auto result = attempt();
        if (result.is_ok()) {
            return result;
        }
        ++failed;
        if (!is_retriable(result.error())) {
            spdlog::debug("Attempt {} failed with a non-retriable error", failed);
            return result;
        }
        if (failed >= budget) {
            spdlog::warn("Giving up after {} attempt(s)", failed);
            return result;
        }
        const auto delay = policy.delay_for(failed);
        spdlog::warn("Attempt {}/{} failed, retrying in {}ms", failed, budget, delay.count());
        sleep(delay);
    }
}

template<typename Attempt, typename Classifier>
auto retry(Attempt&& attempt, Classifier&& is_retriable, const RetryPolicy& policy)
    -> decltype(attempt()) {
    return retry(std::forward<Attempt>(attempt), std::forward<Classifier>(is_retriable), policy,
                 [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); });
}

} // namespace dcp::copy
