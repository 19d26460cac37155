#pragma once

/// @file waiter_queue.hpp
/// @brief FIFO queue of callers suspended awaiting a concurrency slot.

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string_view>

namespace sgov::governor {

/// Suspended admission requests, resumed strictly in arrival order.
///
/// Each waiter blocks on its own condition variable, so a wake-up resumes
/// exactly the thread it was meant for. The queue itself is not locked:
/// every call must be made while holding the owning source's mutex, which
/// is the same mutex passed to wait().
class WaiterQueue {
public:
    /// Why a suspended caller was resumed.
    enum class WakeReason : uint8_t {
        Pending,      ///< Not yet resumed.
        SlotGranted,  ///< A released slot was handed to this waiter.
        Drained       ///< Queue flushed; no slot was granted.
    };

    WaiterQueue() = default;
    WaiterQueue(const WaiterQueue&) = delete;
    WaiterQueue& operator=(const WaiterQueue&) = delete;

    /// Enqueue the caller at the tail and block until it is resumed.
    ///
    /// @p lock must own the source mutex; it is released while blocked and
    /// reacquired before returning.
    WakeReason wait(std::unique_lock<std::mutex>& lock);

    /// Resume the head waiter with a transferred slot.
    /// @return false if the queue was empty.
    bool wakeOne();

    /// Resume every waiter without a slot.
    /// @return Number of waiters resumed.
    std::size_t wakeAll();

    [[nodiscard]] std::size_t size() const noexcept { return waiters_.size(); }
    [[nodiscard]] bool empty() const noexcept { return waiters_.empty(); }

private:
    struct Waiter {
        std::condition_variable cv;
        WakeReason reason{WakeReason::Pending};
    };

    // Waiters live on their callers' stacks; a waiter is always popped
    // before it is notified, and cannot return before the lock is released.
    std::deque<Waiter*> waiters_;
};

/// Convert a wake reason to string.
[[nodiscard]] constexpr std::string_view toString(WaiterQueue::WakeReason r) {
    switch (r) {
        case WaiterQueue::WakeReason::Pending:
            return "pending";
        case WaiterQueue::WakeReason::SlotGranted:
            return "slot_granted";
        case WaiterQueue::WakeReason::Drained:
            return "drained";
    }
    return "unknown";
}

} // namespace sgov::governor
