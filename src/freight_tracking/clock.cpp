#include "freight_tracking/clock.hpp"

namespace freight_tracking {

TimePoint WallClock::now() const {
    return std::chrono::time_point_cast<Milliseconds>(SystemClock::now());
}

ManualClock::ManualClock(TimePoint initial)
    : now_(initial) {}

TimePoint ManualClock::now() const {
    std::scoped_lock lock(mutex_);
    return now_;
}

void ManualClock::set(TimePoint instant) {
    std::scoped_lock lock(mutex_);
    now_ = instant;
}

void ManualClock::advance(Milliseconds delta) {
    std::scoped_lock lock(mutex_);
    now_ += delta;
}

ClockPtr default_clock() {
    static const ClockPtr shared_clock = std::make_shared<WallClock>();
    return shared_clock;
}

}  // namespace freight_tracking
