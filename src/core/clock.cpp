/**
 * @file clock.cpp
 * @brief Clock implementations
 */

#include "tessera/core/time.h"

namespace tessera::core {

TimePoint SteadyClock::now() const {
    return SteadyClockType::now();
}

TimePoint ManualClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

void ManualClock::advance(Duration delta) {
    if (delta.count() <= 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    now_ += delta;
}

void ManualClock::set(TimePoint time_point) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (time_point > now_) {
        now_ = time_point;
    }
}

std::shared_ptr<IClock> create_steady_clock() {
    return std::make_shared<SteadyClock>();
}

} // namespace tessera::core
