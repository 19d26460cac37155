#pragma once

/// @file sliding_window.hpp
/// @brief Chronological record of admissions within a trailing window.

#include <chrono>
#include <cstddef>
#include <deque>

#include "sgov/foundation/clock.hpp"

namespace sgov::governor {

/// Ordered admission timestamps, pruned lazily.
///
/// Not thread-safe; owned by a SourceState and guarded by its mutex.
///
/// Example:
/// @code
///   SlidingWindow window;
///   window.prune(now - config.windowDuration);
///   if (window.size() >= config.maxRequestsPerWindow) {
///       clock.sleepUntil(window.nextAvailable(config.windowDuration, margin));
///   }
///   window.record(clock.now());
/// @endcode
class SlidingWindow {
public:
    using TimePoint = foundation::Clock::TimePoint;

    /// Drop every entry at or before @p cutoff.
    void prune(TimePoint cutoff);

    /// Append an admission. Instants must be non-decreasing.
    void record(TimePoint at);

    [[nodiscard]] std::size_t size() const noexcept { return timestamps_.size(); }
    [[nodiscard]] bool empty() const noexcept { return timestamps_.empty(); }

    /// Entries strictly after @p cutoff, without pruning.
    [[nodiscard]] std::size_t countAfter(TimePoint cutoff) const;

    /// Earliest admission still in the window (undefined if empty).
    [[nodiscard]] TimePoint oldest() const { return timestamps_.front(); }

    /// Instant at which the oldest entry has left a window of @p window,
    /// plus @p margin.
    [[nodiscard]] TimePoint nextAvailable(std::chrono::milliseconds window,
                                          std::chrono::milliseconds margin) const;

private:
    std::deque<TimePoint> timestamps_;
};

} // namespace sgov::governor
