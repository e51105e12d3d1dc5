#include "util/retry.hpp"
#include "common/errors.hpp"
#include <cmath>
#include <random>
#include <fmt/core.h>

namespace rock::util {

void RetryPolicy::validate() const {
    if (max_attempts < 1) {
        throw InvalidParameterError(fmt::format("max_attempts must be >= 1, got {}", max_attempts));
    }
    if (initial_delay.count() < 0) {
        throw InvalidParameterError(fmt::format("initial_delay must be >= 0, got {}ms", initial_delay.count()));
    }
    if (!(backoff_multiplier > 0.0)) {
        throw InvalidParameterError(fmt::format("backoff_multiplier must be > 0, got {}", backoff_multiplier));
    }
}

std::vector<std::chrono::milliseconds> RetryPolicy::delay_schedule() const {
    validate();

    std::vector<std::chrono::milliseconds> schedule;
    double delay_ms = static_cast<double>(initial_delay.count());
    for (int i = 1; i < max_attempts; ++i) {
        schedule.push_back(retry_sleep_duration(delay_ms, false));
        delay_ms *= backoff_multiplier;
    }
    return schedule;
}

std::chrono::milliseconds retry_sleep_duration(double delay_ms, bool jitter) {
    if (!jitter || delay_ms <= 0.0) {
        return std::chrono::milliseconds(static_cast<int64_t>(std::llround(delay_ms)));
    }

    thread_local std::mt19937 mt19937{std::random_device{}()};
    std::uniform_real_distribution<double> dist(0.0, 2.0 * delay_ms);
    return std::chrono::milliseconds(static_cast<int64_t>(dist(mt19937)));
}

} // namespace rock::util
