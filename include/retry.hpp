#pragma once

#include "deadline.hpp"
#include "errors.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <utility>

namespace roto {

struct RetryPolicy {
    int max_attempts = 4;
    std::chrono::milliseconds base_delay{500};
    std::chrono::milliseconds max_delay{8000};

    std::chrono::milliseconds delay_for(int attempt) const {
        // attempt is 1-based; 1 -> base, 2 -> 2*base, ...
        auto delay = base_delay * (1LL << std::min(attempt - 1, 16));
        return std::min<std::chrono::milliseconds>(delay, max_delay);
    }
};

// Runs fn, retrying only on TransientError. Any other exception propagates
// immediately; the last TransientError propagates once attempts run out.
// The deadline is checked before every attempt and caps the backoff sleep.
template <typename Fn>
auto with_retry(const RetryPolicy& policy, const std::string& what, const Deadline& deadline, Fn&& fn)
    -> decltype(fn()) {
    for (int attempt = 1;; ++attempt) {
        deadline.check(what);
        try {
            return fn();
        } catch (const TransientError& e) {
            if (attempt >= policy.max_attempts) {
                std::cerr << what << " failed after " << attempt << " attempts: " << e.what() << std::endl;
                throw;
            }
            auto delay = policy.delay_for(attempt);
            if (deadline.bounded()) {
                delay = std::min<std::chrono::milliseconds>(delay, deadline.remaining());
            }
            std::cout << what << " failed (attempt " << attempt << "/" << policy.max_attempts
                      << "): " << e.what() << ", retrying in " << delay.count() << "ms" << std::endl;
            std::this_thread::sleep_for(delay);
        }
    }
}

template <typename Fn>
auto with_retry(const RetryPolicy& policy, const std::string& what, Fn&& fn) -> decltype(fn()) {
    return with_retry(policy, what, Deadline(), std::forward<Fn>(fn));
}

} // namespace roto
