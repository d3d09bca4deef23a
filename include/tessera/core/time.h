#pragma once
/**
 * @file time.h
 * @brief Clock abstraction for protocol timers
 *
 * Every state machine in Tessera evaluates its timeouts against an injected
 * clock instead of reading the system time directly. Production code uses
 * SteadyClock; tests drive a ManualClock so that retries, passivation and
 * handoff timeouts happen at exactly the instant the test chooses.
 */

#include "tessera/core/types.h"
#include <memory>
#include <mutex>

namespace tessera::core {

/**
 * @brief Source of the current time
 */
class IClock {
public:
    virtual ~IClock() = default;

    /**
     * @brief Get the current time
     */
    virtual TimePoint now() const = 0;
};

/**
 * @brief Clock backed by std::chrono::steady_clock
 */
class SteadyClock : public IClock {
public:
    TimePoint now() const override;
};

/**
 * @brief Clock that only moves when told to
 *
 * Starts at the epoch of the steady clock. Thread-safe.
 */
class ManualClock : public IClock {
public:
    ManualClock() = default;
    explicit ManualClock(TimePoint start) : now_(start) {}

    TimePoint now() const override;

    /**
     * @brief Move time forward
     * @param delta Amount to advance (negative values are ignored)
     */
    void advance(Duration delta);

    /**
     * @brief Set the absolute time (never moves backwards)
     */
    void set(TimePoint time_point);

private:
    TimePoint now_{};
    mutable std::mutex mutex_;
};

/**
 * @brief Create the default production clock
 */
std::shared_ptr<IClock> create_steady_clock();

/**
 * @brief Milliseconds between two time points (0 if end precedes start)
 */
inline Duration elapsed_between(TimePoint start, TimePoint end) {
    if (end <= start) {
        return Duration{0};
    }
    return std::chrono::duration_cast<Duration>(end - start);
}

} // namespace tessera::core
