/// @file clock.cpp
/// @brief SteadyClock and ManualClock implementations.

#include "sgov/foundation/clock.hpp"

#include <iterator>
#include <thread>

namespace sgov::foundation {

// -- SteadyClock --------------------------------------------------------------

Clock::TimePoint SteadyClock::now() const {
    return std::chrono::steady_clock::now();
}

void SteadyClock::sleepUntil(TimePoint deadline) {
    std::this_thread::sleep_until(deadline);
}

// -- ManualClock --------------------------------------------------------------

ManualClock::ManualClock()
    : now_(TimePoint{} + std::chrono::hours(1)) {}

Clock::TimePoint ManualClock::now() const {
    std::lock_guard lock(mutex_);
    return now_;
}

void ManualClock::sleepUntil(TimePoint deadline) {
    std::unique_lock lock(mutex_);
    if (now_ >= deadline) {
        return;
    }

    auto entry = deadlines_.insert(deadline);
    sleepersChanged_.notify_all();
    timeAdvanced_.wait(lock, [&] { return now_ >= deadline; });
    deadlines_.erase(entry);
    sleepersChanged_.notify_all();
}

void ManualClock::advance(Duration delta) {
    {
        std::lock_guard lock(mutex_);
        now_ += delta;
    }
    timeAdvanced_.notify_all();
    sleepersChanged_.notify_all();
}

std::size_t ManualClock::sleeperCount() const {
    std::lock_guard lock(mutex_);
    return pendingLocked();
}

std::size_t ManualClock::pendingLocked() const {
    // Sleepers whose deadline already passed are merely waiting to be scheduled.
    return static_cast<std::size_t>(
        std::distance(deadlines_.upper_bound(now_), deadlines_.end()));
}

bool ManualClock::waitForSleepers(std::size_t count,
                                  std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    return sleepersChanged_.wait_for(lock, timeout,
                                     [&] { return pendingLocked() >= count; });
}

} // namespace sgov::foundation
