#include "util/clock.hpp"
#include <thread>

namespace rock::util {

Clock::TimePoint SteadyClock::now() const {
    return std::chrono::steady_clock::now();
}

int64_t SteadyClock::epoch_millis() const {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
}

void SteadyClock::sleep_for(Duration duration) {
    if (duration.count() <= 0) return;
    std::this_thread::sleep_for(duration);
}

std::shared_ptr<Clock> default_clock() {
    static std::shared_ptr<Clock> clock = std::make_shared<SteadyClock>();
    return clock;
}

} // namespace rock::util
