#pragma once

#include <algorithm>
#include <chrono>
#include <string>
#include <thread>
#include <type_traits>

#include <Errors.hpp>
#include <Logging.hpp>

struct RetryPolicy {
    unsigned attempts = 3;
    std::chrono::milliseconds initial_backoff{ 500 };
    double multiplier = 2.0;
    std::chrono::milliseconds max_backoff{ 8000 };
};

// statuses worth another attempt: server errors, request timeout, rate limiting
inline bool is_transient_status(unsigned status) {
    return status >= 500 || status == 408 || status == 429;
}

inline std::chrono::milliseconds next_backoff(const RetryPolicy& policy, std::chrono::milliseconds current) {
    auto scaled = std::chrono::milliseconds(static_cast<long long>(static_cast<double>(current.count()) * policy.multiplier));
    return std::min(scaled, policy.max_backoff);
}

// Runs fn until it returns or throws something other than TransientNetworkError.
// The last TransientNetworkError escapes once the attempts are used up.
template <typename Fn>
auto with_retry(const RetryPolicy& policy, Logger& log, const std::string& what, Fn&& fn) -> std::invoke_result_t<Fn&> {
    const unsigned attempts = std::max(policy.attempts, 1u);
    auto delay = policy.initial_backoff;

    for (unsigned attempt = 1;; ++attempt) {
        try {
            return fn();
        } catch (const TransientNetworkError& e) {
            if (attempt >= attempts) {
                SEEDTOOLS_LOG(log, warning) << what << " failed after " << attempt << " attempts: " << e.what();
                throw;
            }
            SEEDTOOLS_LOG(log, debug) << what << " failed (attempt " << attempt << '/' << attempts << "): "
                                      << e.what() << ", retrying in " << delay.count() << " ms";
            std::this_thread::sleep_for(delay);
            delay = next_backoff(policy, delay);
        }
    }
}
