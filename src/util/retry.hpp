/**
 * Bounded retry with backoff
 *
 * retry_call() invokes an operation up to policy.max_attempts times. Between
 * attempts it sleeps on the supplied Clock: exactly the current delay, or a
 * value drawn uniformly from [0, 2*delay) when jitter is on. The delay is
 * multiplied by backoff_multiplier after every failed attempt. When the last
 * attempt fails its exception is rethrown as-is.
 */
#pragma once
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "util/clock.hpp"

namespace rock::util {

struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds initial_delay{1000};
    double backoff_multiplier = 1.0;
    bool jitter = false;

    // Throws InvalidParameterError on max_attempts < 1, negative delay or
    // non-positive multiplier
    void validate() const;

    // Sleeps between attempts without jitter: d, d*b, d*b^2, ... (max_attempts - 1 entries)
    std::vector<std::chrono::milliseconds> delay_schedule() const;
};

// Sleep duration for one retry given the current (unjittered) delay
std::chrono::milliseconds retry_sleep_duration(double delay_ms, bool jitter);

template <typename Fn>
auto retry_call(const RetryPolicy& policy, Clock& clock, Fn&& fn,
                const std::shared_ptr<spdlog::logger>& logger = nullptr) -> decltype(fn()) {
    policy.validate();

    double delay_ms = static_cast<double>(policy.initial_delay.count());
    for (int attempt = 1;; ++attempt) {
        try {
            return fn();
        } catch (const std::exception& e) {
            if (attempt >= policy.max_attempts) {
                if (logger) {
                    logger->error("All {} attempts failed, last error: {}", policy.max_attempts, e.what());
                }
                throw;
            }

            auto sleep = retry_sleep_duration(delay_ms, policy.jitter);
            if (logger) {
                logger->warn("Attempt {}/{} failed: {}, retrying in {}ms",
                    attempt, policy.max_attempts, e.what(), sleep.count());
            }
            clock.sleep_for(sleep);
            delay_ms *= policy.backoff_multiplier;
        }
    }
}

} // namespace rock::util
