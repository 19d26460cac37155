#pragma once

/// @file source_governor.hpp
/// @brief Per-source adaptive request governor.
///
/// Mediates access to named, unreliable upstream sources. Each source has
/// its own concurrency semaphore with a FIFO waiter queue, sliding-window
/// quota, minimum request spacing, exponential backoff and a
/// consecutive-failure circuit breaker.

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sgov/foundation/clock.hpp"
#include "sgov/foundation/governor_result.hpp"
#include "sgov/governor/source_config.hpp"

namespace sgov::governor {

class AdmissionTicket;

/// Breaker position for one source.
enum class BreakerState : uint8_t {
    Closed,  ///< Normal operation; admissions proceed.
    Open     ///< Source deemed unavailable; admissions fail fast.
};

/// Convert breaker state to string.
[[nodiscard]] constexpr std::string_view toString(BreakerState s) {
    switch (s) {
        case BreakerState::Closed:
            return "closed";
        case BreakerState::Open:
            return "open";
    }
    return "unknown";
}

/// Point-in-time copy of one source's state.
struct SourceSnapshot {
    std::string name;
    SourceConfig config;
    uint32_t inFlight = 0;
    std::size_t queuedWaiters = 0;
    std::size_t admissionsInWindow = 0;
    uint32_t consecutiveFailures = 0;
    std::chrono::milliseconds backoffRemaining{0};
    BreakerState breaker = BreakerState::Closed;

    uint64_t totalAdmitted = 0;
    uint64_t totalRejected = 0;
    uint64_t totalFailures = 0;
    uint64_t breakerTrips = 0;
};

/// Admission control for a fixed table of named sources.
///
/// Usage:
/// @code
///   SourceGovernor governor(defaultSourceTable());
///   auto admitted = governor.acquire("dexscreener");
///   if (!admitted) {
///       return neutralScore;  // SourceUnavailable: breaker open
///   }
///   auto response = fetchTrending();
///   if (response.ok) {
///       governor.reportSuccess("dexscreener");
///   } else {
///       governor.reportFailure("dexscreener", response.status);
///   }
/// @endcode
///
/// Caller contract: every successful acquire() must be followed by exactly
/// one reportSuccess() or reportFailure() for the same source. A missing
/// report leaks the concurrency slot for the life of the process; an extra
/// report is logged and ignored for slot accounting. admit() returns an
/// AdmissionTicket that enforces the contract by RAII. A success observed
/// without an admission (a recovery probe while the breaker is open) goes
/// to reportRecovery() instead.
///
/// Names absent from the source table are not governed: acquire() returns
/// immediately and reports are no-ops.
///
/// Thread-safe. Each source is guarded by its own mutex, so contention on
/// one source never blocks another. There is no internal timeout: an
/// acquire() returns only once admitted or once the breaker opens.
class SourceGovernor {
public:
    /// @param sources Static source table; names outside it run unthrottled.
    /// @param policy  Backoff and breaker policy shared by all sources.
    /// @param clock   Time source; defaults to SteadyClock.
    explicit SourceGovernor(SourceTable sources, GovernorPolicy policy = {},
                            std::shared_ptr<foundation::Clock> clock = nullptr);
    ~SourceGovernor();

    SourceGovernor(const SourceGovernor&) = delete;
    SourceGovernor& operator=(const SourceGovernor&) = delete;
    SourceGovernor(SourceGovernor&&) = delete;
    SourceGovernor& operator=(SourceGovernor&&) = delete;

    /// Block until issuing one request against @p source is safe.
    ///
    /// Order: breaker check, concurrency slot (FIFO), backoff, minimum
    /// spacing, sliding window. Temporal conditions are re-evaluated after
    /// every wait.
    ///
    /// @return ok once admitted (the caller now owns one slot), or
    ///         SourceUnavailable if the breaker is open on entry or opens
    ///         during any wait (a held slot is given back).
    [[nodiscard]] foundation::GovernorResult<void> acquire(std::string_view source);

    /// acquire() wrapped in a ticket that reports exactly once.
    [[nodiscard]] foundation::GovernorResult<AdmissionTicket> admit(std::string_view source);

    /// Record a successful call: clears failures, backoff and the breaker,
    /// and releases the caller's slot.
    void reportSuccess(std::string_view source);

    /// Close the breaker after a call made outside any admission succeeded.
    ///
    /// Clears failures, backoff and the breaker like reportSuccess() but
    /// holds and releases no slot, so it cannot free a slot another caller
    /// still owns. Use it for recovery probes issued while the breaker is
    /// open.
    void reportRecovery(std::string_view source);

    /// Record a failed call and release the caller's slot.
    ///
    /// Extends backoff (tripled when @p statusCode is the throttling code)
    /// and opens the breaker at the trip threshold, draining every queued
    /// waiter. While the breaker is already open only the slot is released.
    void reportFailure(std::string_view source,
                       std::optional<int> statusCode = std::nullopt);

    /// Non-blocking advisory check of the breaker.
    [[nodiscard]] bool isUnavailable(std::string_view source) const;

    [[nodiscard]] BreakerState breakerState(std::string_view source) const;

    [[nodiscard]] bool isConfigured(std::string_view source) const;

    /// Configured source names, sorted.
    [[nodiscard]] std::vector<std::string> sourceNames() const;

    /// Copy of a source's current state.
    /// @return SourceNotConfigured for names outside the table.
    [[nodiscard]] foundation::GovernorResult<SourceSnapshot>
    snapshot(std::string_view source) const;

    [[nodiscard]] const GovernorPolicy& policy() const noexcept { return policy_; }

private:
    using TimePoint = foundation::Clock::TimePoint;

    struct SourceState;

    /// Existing state for a configured name, created on first use.
    SourceState& stateFor(std::string_view name);

    /// Existing state or nullptr; never creates.
    [[nodiscard]] SourceState* findState(std::string_view name) const;

    [[nodiscard]] const SourceConfig* configFor(std::string_view name) const;

    /// Hand the caller's slot to the head waiter, or return it to the pool.
    void releaseSlotLocked(SourceState& state);

    /// Reset failures and backoff and close the breaker.
    void clearFailuresLocked(SourceState& state);

    /// Release the source lock, sleep until @p deadline, reacquire.
    void sleepLocked(std::unique_lock<std::mutex>& lock, TimePoint deadline);

    foundation::GovernorResult<void> rejectLocked(SourceState& state);

    SourceTable sources_;
    GovernorPolicy policy_;
    std::shared_ptr<foundation::Clock> clock_;

    mutable std::mutex registryMutex_;
    std::map<std::string, std::unique_ptr<SourceState>, std::less<>> states_;
};

} // namespace sgov::governor
