#pragma once
#include <chrono>
#include <cstdint>
#include <memory>

namespace rock::util {

// Time source and sleeper used by every polling and retry loop.
// Tests substitute a clock that advances without waiting.
class Clock {
public:
    using Duration = std::chrono::milliseconds;
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    // Monotonic time, for deadlines
    virtual TimePoint now() const = 0;

    // Wall clock in milliseconds since the epoch, for naming temp files and sessions
    virtual int64_t epoch_millis() const = 0;

    virtual void sleep_for(Duration duration) = 0;

    // Milliseconds elapsed since start
    Duration elapsed_since(TimePoint start) const {
        return std::chrono::duration_cast<Duration>(now() - start);
    }
};

class SteadyClock : public Clock {
public:
    TimePoint now() const override;
    int64_t epoch_millis() const override;
    void sleep_for(Duration duration) override;
};

// Shared default instance
std::shared_ptr<Clock> default_clock();

inline std::chrono::milliseconds seconds_to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
}

} // namespace rock::util
