/// @file source_governor.cpp
/// @brief SourceGovernor admission, outcome reporting and breaker logic.

#include "sgov/governor/source_governor.hpp"

#include <algorithm>
#include <atomic>
#include <initializer_list>
#include <utility>

#include "sgov/foundation/governor_logger.hpp"
#include "sgov/governor/admission_ticket.hpp"
#include "sgov/governor/backoff.hpp"
#include "sgov/governor/sliding_window.hpp"
#include "sgov/governor/waiter_queue.hpp"

namespace sgov::governor {

using foundation::Clock;
using foundation::ErrorCode;
using foundation::GovernorError;
using foundation::GovernorLogger;
using foundation::GovernorResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

using Extra = std::initializer_list<std::pair<std::string_view, std::string>>;

void logSource(LogLevel level, LogCategory cat, std::string_view msg,
               std::string_view source, std::optional<int> statusCode = std::nullopt,
               Extra extra = {}) {
    auto& logger = GovernorLogger::instance();
    if (!logger.isEnabled(level, cat)) {
        return;
    }
    LogContext ctx;
    ctx.source = std::string(source);
    ctx.statusCode = statusCode;
    for (const auto& [key, value] : extra) {
        ctx.extra.emplace(std::string(key), value);
    }
    logger.logWithContext(level, cat, msg, ctx);
}

std::string millis(Clock::Duration d) {
    return std::to_string(
        std::chrono::duration_cast<std::chrono::milliseconds>(d).count());
}

/// Clamp budgets that would otherwise block callers forever.
SourceTable sanitize(SourceTable sources) {
    for (auto& [name, config] : sources) {
        auto valid = config.validate();
        if (valid) {
            continue;
        }
        logSource(LogLevel::Error, LogCategory::Config,
                  "Invalid source budget clamped", name, std::nullopt,
                  {{"reason", std::string(valid.error().message())}});
        config.maxRequestsPerWindow = std::max<uint32_t>(config.maxRequestsPerWindow, 1);
        config.maxConcurrent = std::max<uint32_t>(config.maxConcurrent, 1);
        config.windowDuration =
            std::max(config.windowDuration, std::chrono::milliseconds(1));
        config.minInterRequestDelay =
            std::max(config.minInterRequestDelay, std::chrono::milliseconds::zero());
    }
    return sources;
}

GovernorPolicy sanitize(GovernorPolicy policy) {
    auto valid = policy.validate();
    if (valid) {
        return policy;
    }
    SGOV_LOG_ERROR(LogCategory::Config,
                   "Invalid governor policy clamped: " +
                       std::string(valid.error().message()));
    policy.baseDelay = std::max(policy.baseDelay, std::chrono::milliseconds::zero());
    policy.maxDelay = std::max(policy.maxDelay, policy.baseDelay);
    policy.throttleMultiplier = std::max<uint32_t>(policy.throttleMultiplier, 1);
    policy.tripThreshold = std::max<uint32_t>(policy.tripThreshold, 1);
    policy.windowSafetyMargin =
        std::max(policy.windowSafetyMargin, std::chrono::milliseconds::zero());
    return policy;
}

} // namespace

// ---------------------------------------------------------------------------
// SourceState
// ---------------------------------------------------------------------------

/// Mutable per-source state. Every field except `unavailable` is guarded by
/// `mutex`; `unavailable` is only written under it but may be read without.
struct SourceGovernor::SourceState {
    explicit SourceState(std::string sourceName) : name(std::move(sourceName)) {}

    const std::string name;

    std::mutex mutex;
    SlidingWindow window;
    TimePoint backoffUntil{};
    uint32_t consecutiveFailures{0};
    uint32_t inFlight{0};
    WaiterQueue waiters;
    std::optional<TimePoint> lastRequestTime;
    std::atomic<bool> unavailable{false};

    uint64_t totalAdmitted{0};
    uint64_t totalRejected{0};
    uint64_t totalFailures{0};
    uint64_t breakerTrips{0};
};

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

SourceGovernor::SourceGovernor(SourceTable sources, GovernorPolicy policy,
                               std::shared_ptr<Clock> clock)
    : sources_(sanitize(std::move(sources))),
      policy_(sanitize(policy)),
      clock_(clock ? std::move(clock) : std::make_shared<foundation::SteadyClock>()) {}

SourceGovernor::~SourceGovernor() = default;

// ---------------------------------------------------------------------------
// Registry
// ---------------------------------------------------------------------------

const SourceConfig* SourceGovernor::configFor(std::string_view name) const {
    auto it = sources_.find(name);
    return it == sources_.end() ? nullptr : &it->second;
}

SourceGovernor::SourceState& SourceGovernor::stateFor(std::string_view name) {
    std::lock_guard lock(registryMutex_);
    auto it = states_.find(name);
    if (it == states_.end()) {
        it = states_.emplace(std::string(name),
                             std::make_unique<SourceState>(std::string(name)))
                 .first;
    }
    return *it->second;
}

SourceGovernor::SourceState* SourceGovernor::findState(std::string_view name) const {
    std::lock_guard lock(registryMutex_);
    auto it = states_.find(name);
    return it == states_.end() ? nullptr : it->second.get();
}

bool SourceGovernor::isConfigured(std::string_view source) const {
    return configFor(source) != nullptr;
}

std::vector<std::string> SourceGovernor::sourceNames() const {
    std::vector<std::string> names;
    names.reserve(sources_.size());
    for (const auto& [name, config] : sources_) {
        names.push_back(name);
    }
    return names;
}

// ---------------------------------------------------------------------------
// Admission
// ---------------------------------------------------------------------------

GovernorResult<void> SourceGovernor::acquire(std::string_view source) {
    const auto* config = configFor(source);
    if (config == nullptr) {
        return GovernorResult<void>::ok();
    }

    auto& state = stateFor(source);
    std::unique_lock lock(state.mutex);

    // A drained waiter loops back to the breaker check: the breaker may have
    // closed again before it reacquired the lock.
    for (;;) {
        if (state.unavailable.load(std::memory_order_relaxed)) {
            return rejectLocked(state);
        }
        if (state.inFlight < config->maxConcurrent) {
            ++state.inFlight;
            break;
        }
        if (state.waiters.wait(lock) == WaiterQueue::WakeReason::SlotGranted) {
            // The releasing caller transferred its slot; inFlight already
            // counts it. A trip since then is caught by the loop below.
            break;
        }
    }

    // Temporal constraints are source-global and may change while this
    // caller sleeps, so all three are re-evaluated after every wait. A trip
    // during a wait gives the slot back and fails fast.
    TimePoint now;
    for (;;) {
        if (state.unavailable.load(std::memory_order_relaxed)) {
            releaseSlotLocked(state);
            return rejectLocked(state);
        }
        now = clock_->now();

        if (state.backoffUntil > now) {
            logSource(LogLevel::Warning, LogCategory::Backoff,
                      "Backing off before admission", source, std::nullopt,
                      {{"wait_ms", millis(state.backoffUntil - now)}});
            sleepLocked(lock, state.backoffUntil);
            continue;
        }

        if (config->minInterRequestDelay > std::chrono::milliseconds::zero() &&
            state.lastRequestTime) {
            auto readyAt = *state.lastRequestTime + config->minInterRequestDelay;
            if (readyAt > now) {
                sleepLocked(lock, readyAt);
                continue;
            }
        }

        state.window.prune(now - config->windowDuration);
        if (state.window.size() >= config->maxRequestsPerWindow) {
            auto readyAt = state.window.nextAvailable(config->windowDuration,
                                                      policy_.windowSafetyMargin);
            logSource(LogLevel::Debug, LogCategory::Admission,
                      "Window quota reached; waiting", source, std::nullopt,
                      {{"wait_ms", millis(readyAt - now)}});
            sleepLocked(lock, readyAt);
            continue;
        }
        break;
    }

    state.window.record(now);
    state.lastRequestTime = now;
    ++state.totalAdmitted;
    return GovernorResult<void>::ok();
}

GovernorResult<AdmissionTicket> SourceGovernor::admit(std::string_view source) {
    auto admitted = acquire(source);
    if (!admitted) {
        return GovernorResult<AdmissionTicket>::err(admitted.error());
    }
    return GovernorResult<AdmissionTicket>::ok(AdmissionTicket(*this, source));
}

void SourceGovernor::sleepLocked(std::unique_lock<std::mutex>& lock, TimePoint deadline) {
    lock.unlock();
    clock_->sleepUntil(deadline);
    lock.lock();
}

GovernorResult<void> SourceGovernor::rejectLocked(SourceState& state) {
    ++state.totalRejected;
    logSource(LogLevel::Debug, LogCategory::Breaker,
              "Source unavailable; admission rejected", state.name);
    return GovernorResult<void>::err(GovernorError(
        ErrorCode::SourceUnavailable, state.name + " is unavailable; skipping request"));
}

// ---------------------------------------------------------------------------
// Outcome reporting
// ---------------------------------------------------------------------------

void SourceGovernor::reportSuccess(std::string_view source) {
    const auto* config = configFor(source);
    if (config == nullptr) {
        return;
    }

    auto& state = stateFor(source);
    std::lock_guard lock(state.mutex);

    clearFailuresLocked(state);
    releaseSlotLocked(state);
}

void SourceGovernor::reportRecovery(std::string_view source) {
    const auto* config = configFor(source);
    if (config == nullptr) {
        return;
    }

    auto& state = stateFor(source);
    std::lock_guard lock(state.mutex);
    clearFailuresLocked(state);
}

void SourceGovernor::clearFailuresLocked(SourceState& state) {
    state.consecutiveFailures = 0;
    state.backoffUntil = TimePoint{};
    if (state.unavailable.exchange(false, std::memory_order_relaxed)) {
        logSource(LogLevel::Info, LogCategory::Breaker,
                  "Source recovered; breaker closed", state.name);
    }
}

void SourceGovernor::reportFailure(std::string_view source,
                                   std::optional<int> statusCode) {
    const auto* config = configFor(source);
    if (config == nullptr) {
        return;
    }

    auto& state = stateFor(source);
    std::lock_guard lock(state.mutex);

    // The call never reached the upstream; it must not extend backoff.
    if (state.unavailable.load(std::memory_order_relaxed)) {
        releaseSlotLocked(state);
        return;
    }

    ++state.consecutiveFailures;
    ++state.totalFailures;
    auto delay = computeBackoff(policy_, state.consecutiveFailures, statusCode);
    state.backoffUntil = clock_->now() + delay;

    logSource(LogLevel::Warning, LogCategory::Backoff, "Upstream failure reported",
              source, statusCode,
              {{"failures", std::to_string(state.consecutiveFailures)},
               {"backoff_ms", millis(delay)}});

    if (state.consecutiveFailures >= policy_.tripThreshold) {
        state.unavailable.store(true, std::memory_order_relaxed);
        ++state.breakerTrips;
        auto drained = state.waiters.wakeAll();
        logSource(LogLevel::Error, LogCategory::Breaker,
                  "Source appears unavailable; breaker opened", source, statusCode,
                  {{"failures", std::to_string(state.consecutiveFailures)},
                   {"drained_waiters", std::to_string(drained)}});
    }

    releaseSlotLocked(state);
}

void SourceGovernor::releaseSlotLocked(SourceState& state) {
    if (state.inFlight == 0) {
        logSource(LogLevel::Warning, LogCategory::Core,
                  "Outcome reported without an outstanding admission", state.name);
        return;
    }
    if (!state.unavailable.load(std::memory_order_relaxed) && state.waiters.wakeOne()) {
        return;  // slot transferred to the head waiter
    }
    --state.inFlight;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

bool SourceGovernor::isUnavailable(std::string_view source) const {
    const auto* state = findState(source);
    return state != nullptr && state->unavailable.load(std::memory_order_relaxed);
}

BreakerState SourceGovernor::breakerState(std::string_view source) const {
    return isUnavailable(source) ? BreakerState::Open : BreakerState::Closed;
}

GovernorResult<SourceSnapshot> SourceGovernor::snapshot(std::string_view source) const {
    const auto* config = configFor(source);
    if (config == nullptr) {
        return GovernorResult<SourceSnapshot>::err(GovernorError(
            ErrorCode::SourceNotConfigured,
            "source not configured: " + std::string(source)));
    }

    SourceSnapshot snap;
    snap.name = std::string(source);
    snap.config = *config;

    auto* state = findState(source);
    if (state == nullptr) {
        return GovernorResult<SourceSnapshot>::ok(std::move(snap));
    }

    std::lock_guard lock(state->mutex);
    auto now = clock_->now();
    snap.inFlight = state->inFlight;
    snap.queuedWaiters = state->waiters.size();
    snap.admissionsInWindow = state->window.countAfter(now - config->windowDuration);
    snap.consecutiveFailures = state->consecutiveFailures;
    if (state->backoffUntil > now) {
        snap.backoffRemaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            state->backoffUntil - now);
    }
    snap.breaker = state->unavailable.load(std::memory_order_relaxed)
                       ? BreakerState::Open
                       : BreakerState::Closed;
    snap.totalAdmitted = state->totalAdmitted;
    snap.totalRejected = state->totalRejected;
    snap.totalFailures = state->totalFailures;
    snap.breakerTrips = state->breakerTrips;
    return GovernorResult<SourceSnapshot>::ok(std::move(snap));
}

} // namespace sgov::governor
