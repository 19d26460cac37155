/// @file sliding_window.cpp
/// @brief SlidingWindow implementation.

#include "sgov/governor/sliding_window.hpp"

#include <algorithm>
#include <iterator>

namespace sgov::governor {

void SlidingWindow::prune(TimePoint cutoff) {
    while (!timestamps_.empty() && timestamps_.front() <= cutoff) {
        timestamps_.pop_front();
    }
}

void SlidingWindow::record(TimePoint at) {
    timestamps_.push_back(at);
}

std::size_t SlidingWindow::countAfter(TimePoint cutoff) const {
    auto first = std::upper_bound(timestamps_.begin(), timestamps_.end(), cutoff);
    return static_cast<std::size_t>(std::distance(first, timestamps_.end()));
}

SlidingWindow::TimePoint SlidingWindow::nextAvailable(
    std::chrono::milliseconds window, std::chrono::milliseconds margin) const {
    return oldest() + window + margin;
}

} // namespace sgov::governor
