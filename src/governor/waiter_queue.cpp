/// @file waiter_queue.cpp
/// @brief WaiterQueue implementation.

#include "sgov/governor/waiter_queue.hpp"

namespace sgov::governor {

WaiterQueue::WakeReason WaiterQueue::wait(std::unique_lock<std::mutex>& lock) {
    Waiter self;
    waiters_.push_back(&self);
    self.cv.wait(lock, [&self] { return self.reason != WakeReason::Pending; });
    return self.reason;
}

bool WaiterQueue::wakeOne() {
    if (waiters_.empty()) {
        return false;
    }
    auto* head = waiters_.front();
    waiters_.pop_front();
    head->reason = WakeReason::SlotGranted;
    head->cv.notify_one();
    return true;
}

std::size_t WaiterQueue::wakeAll() {
    std::size_t woken = 0;
    while (!waiters_.empty()) {
        auto* head = waiters_.front();
        waiters_.pop_front();
        head->reason = WakeReason::Drained;
        head->cv.notify_one();
        ++woken;
    }
    return woken;
}

} // namespace sgov::governor
