#pragma once

/// @file clock.hpp
/// @brief Time source abstraction for timed admission waits.
///
/// Every temporal suspension in the governor is a single sleepUntil()
/// call against a Clock. Production code uses SteadyClock; tests and
/// simulations drive a ManualClock explicitly.

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <set>

namespace sgov::foundation {

/// Abstract monotonic clock with a blocking sleep primitive.
class Clock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Duration = std::chrono::steady_clock::duration;

    virtual ~Clock() = default;

    /// Current instant.
    [[nodiscard]] virtual TimePoint now() const = 0;

    /// Block the calling thread until @p deadline has been reached.
    /// Returns immediately if the deadline is already in the past.
    virtual void sleepUntil(TimePoint deadline) = 0;
};

/// Wall-time implementation backed by std::chrono::steady_clock.
class SteadyClock final : public Clock {
public:
    [[nodiscard]] TimePoint now() const override;
    void sleepUntil(TimePoint deadline) override;
};

/// Virtual clock that only moves when advance() is called.
///
/// Sleepers block until an advance moves the clock to or past their
/// deadline; each sleeper resumes exactly once per sleepUntil() call.
///
/// Example:
/// @code
///   auto clock = std::make_shared<ManualClock>();
///   std::thread worker([&] { clock->sleepUntil(clock->now() + 1s); });
///   clock->waitForSleepers(1, 1s);
///   clock->advance(1s);  // worker resumes
///   worker.join();
/// @endcode
class ManualClock final : public Clock {
public:
    /// Starts at an arbitrary non-zero epoch so that a default-constructed
    /// time_point always compares as "in the past".
    ManualClock();

    [[nodiscard]] TimePoint now() const override;
    void sleepUntil(TimePoint deadline) override;

    /// Move the clock forward and wake every sleeper whose deadline elapsed.
    void advance(Duration delta);

    /// Number of threads blocked in sleepUntil() whose deadline is still ahead.
    [[nodiscard]] std::size_t sleeperCount() const;

    /// Block (in real time) until at least @p count threads are sleeping.
    /// @return false if @p timeout elapsed first.
    bool waitForSleepers(std::size_t count, std::chrono::milliseconds timeout) const;

private:
    [[nodiscard]] std::size_t pendingLocked() const;

    mutable std::mutex mutex_;
    mutable std::condition_variable timeAdvanced_;
    mutable std::condition_variable sleepersChanged_;
    TimePoint now_;
    std::multiset<TimePoint> deadlines_;
};

} // namespace sgov::foundation
