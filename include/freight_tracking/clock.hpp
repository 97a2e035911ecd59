// === Clock ===================================================================
//
// Time source abstraction. Production code reads the wall clock; tests drive
// a manual clock so TTL expiry and partition rollover can be exercised
// deterministically.

#pragma once

#include <memory>
#include <mutex>

#include "freight_tracking/types.hpp"

namespace freight_tracking {

/** @brief Source of the current instant. */
class Clock {
  public:
    virtual ~Clock() = default;

    /** @brief Current instant at millisecond resolution. */
    [[nodiscard]] virtual TimePoint now() const = 0;
};

/** @brief Clock backed by `std::chrono::system_clock`. */
class WallClock final : public Clock {
  public:
    [[nodiscard]] TimePoint now() const override;
};

/** @brief Clock that only moves when told to. */
class ManualClock final : public Clock {
  public:
    explicit ManualClock(TimePoint initial);

    [[nodiscard]] TimePoint now() const override;

    void set(TimePoint instant);
    void advance(Milliseconds delta);

  private:
    mutable std::mutex mutex_;
    TimePoint now_;
};

using ClockPtr = std::shared_ptr<const Clock>;

/** @brief Shared wall-clock instance used when no clock is injected. */
[[nodiscard]] ClockPtr default_clock();

}  // namespace freight_tracking
