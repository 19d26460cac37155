/// @file probe_runner.cpp
/// @brief ProbeRunner, SimulatedEndpoint and snapshot formatting.

#include "sgov/service/probe_runner.hpp"

#include <sstream>
#include <type_traits>

#include "sgov/foundation/governor_logger.hpp"
#include "sgov/governor/admission_ticket.hpp"

namespace sgov::service {

using foundation::ErrorCode;
using foundation::GovernorError;
using foundation::GovernorResult;
using foundation::LogCategory;

namespace {

constexpr int kStatusOk = 200;
constexpr int kStatusThrottled = 429;
constexpr int kStatusServerError = 503;

bool isProbability(double p) {
    return p >= 0.0 && p <= 1.0;
}

} // namespace

// -- ProbeConfig ------------------------------------------------------------

GovernorResult<void> ProbeConfig::validate() const {
    if (workersPerSource == 0) {
        return GovernorResult<void>::err(GovernorError(
            ErrorCode::InvalidArgument, "probe.workers_per_source must be at least 1"));
    }
    if (!isProbability(failureRate) || !isProbability(throttleRate) ||
        failureRate + throttleRate > 1.0) {
        return GovernorResult<void>::err(GovernorError(
            ErrorCode::InvalidArgument,
            "probe failure and throttle rates must be probabilities summing to <= 1"));
    }
    if (callLatency.count() < 0 || recoveryProbeInterval.count() <= 0 ||
        reportInterval.count() <= 0) {
        return GovernorResult<void>::err(GovernorError(
            ErrorCode::InvalidArgument, "probe intervals must be positive"));
    }
    return GovernorResult<void>::ok();
}

GovernorResult<ProbeConfig> loadProbeConfig(const foundation::ConfigManager& config) {
    ProbeConfig probe;

    // Absent keys keep the default; a present key of the wrong type fails.
    auto read = [&config](std::string_view key, auto& target) -> GovernorResult<void> {
        if (!config.hasKey(key)) {
            return GovernorResult<void>::ok();
        }
        auto value = config.get<std::decay_t<decltype(target)>>(key);
        if (!value) {
            return GovernorResult<void>::err(value.error());
        }
        target = value.value();
        return GovernorResult<void>::ok();
    };

    int64_t latencyMs = probe.callLatency.count();
    int64_t recoveryMs = probe.recoveryProbeInterval.count();
    int64_t reportMs = probe.reportInterval.count();

    auto steps = {
        read("probe.workers_per_source", probe.workersPerSource),
        read("probe.failure_rate", probe.failureRate),
        read("probe.throttle_rate", probe.throttleRate),
        read("probe.seed", probe.seed),
        read("probe.call_latency_ms", latencyMs),
        read("probe.recovery_probe_ms", recoveryMs),
        read("probe.report_interval_ms", reportMs),
    };
    for (const auto& step : steps) {
        if (!step) {
            return GovernorResult<ProbeConfig>::err(step.error());
        }
    }
    probe.callLatency = std::chrono::milliseconds(latencyMs);
    probe.recoveryProbeInterval = std::chrono::milliseconds(recoveryMs);
    probe.reportInterval = std::chrono::milliseconds(reportMs);

    auto valid = probe.validate();
    if (!valid) {
        return GovernorResult<ProbeConfig>::err(valid.error());
    }
    return GovernorResult<ProbeConfig>::ok(probe);
}

// -- SimulatedEndpoint ------------------------------------------------------

SimulatedEndpoint::SimulatedEndpoint(double failureRate, double throttleRate,
                                     std::chrono::milliseconds latency, uint64_t seed)
    : rng_(seed), failureRate_(failureRate), throttleRate_(throttleRate),
      latency_(latency) {}

GovernorResult<int> SimulatedEndpoint::call() {
    double roll = 0.0;
    double failureRate = 0.0;
    double throttleRate = 0.0;
    std::chrono::milliseconds latency{};
    {
        std::lock_guard lock(mutex_);
        roll = std::uniform_real_distribution<double>(0.0, 1.0)(rng_);
        failureRate = failureRate_;
        throttleRate = throttleRate_;
        latency = latency_;
    }

    std::this_thread::sleep_for(latency);

    if (roll < throttleRate) {
        return GovernorResult<int>::err(GovernorError(
            ErrorCode::UpstreamThrottled, "upstream throttled", kStatusThrottled));
    }
    if (roll < throttleRate + failureRate) {
        return GovernorResult<int>::err(GovernorError(
            ErrorCode::UpstreamFailure, "upstream unavailable", kStatusServerError));
    }
    return GovernorResult<int>::ok(kStatusOk);
}

void SimulatedEndpoint::setFailureRate(double rate) {
    std::lock_guard lock(mutex_);
    failureRate_ = rate;
}

// -- ProbeRunner ------------------------------------------------------------

ProbeRunner::ProbeRunner(governor::SourceGovernor& governor, ProbeConfig config)
    : governor_(governor), config_(config) {
    uint64_t stream = 0;
    for (const auto& name : governor_.sourceNames()) {
        endpoints_.emplace(name, std::make_unique<SimulatedEndpoint>(
                                     config_.failureRate, config_.throttleRate,
                                     config_.callLatency, config_.seed + stream++));
        counters_.emplace(name, std::make_unique<Counters>());
    }
}

ProbeRunner::~ProbeRunner() {
    stop();
}

void ProbeRunner::start() {
    if (running_.exchange(true)) {
        return;
    }
    for (const auto& [name, endpoint] : endpoints_) {
        for (uint32_t i = 0; i < config_.workersPerSource; ++i) {
            workers_.emplace_back([this, source = name] { workerLoop(source); });
        }
    }
    SGOV_LOG_INFO(LogCategory::Core,
                  "Probe started with " + std::to_string(workers_.size()) + " workers");
}

void ProbeRunner::stop() {
    {
        std::lock_guard lock(stopMutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    stopCv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    SGOV_LOG_INFO(LogCategory::Core, "Probe stopped");
}

bool ProbeRunner::isRunning() const noexcept {
    return running_.load();
}

ProbeStats ProbeRunner::stats(std::string_view source) const {
    auto it = counters_.find(source);
    if (it == counters_.end()) {
        return {};
    }
    const auto& c = *it->second;
    return ProbeStats{c.calls.load(), c.successes.load(), c.fallbacks.load(),
                      c.recoveryProbes.load()};
}

SimulatedEndpoint* ProbeRunner::endpoint(std::string_view source) {
    auto it = endpoints_.find(source);
    return it == endpoints_.end() ? nullptr : it->second.get();
}

void ProbeRunner::pause(std::chrono::milliseconds period) {
    std::unique_lock lock(stopMutex_);
    stopCv_.wait_for(lock, period, [this] { return !running_.load(); });
}

void ProbeRunner::workerLoop(const std::string& source) {
    auto& endpoint = *endpoints_.at(source);
    auto& counters = *counters_.at(source);

    while (running_.load()) {
        if (governor_.isUnavailable(source)) {
            // Recovery is caller-driven: retry the upstream directly after a
            // cool-down and close the breaker only on a real success.
            pause(config_.recoveryProbeInterval);
            if (!running_.load()) {
                break;
            }
            counters.recoveryProbes.fetch_add(1);
            auto probe = endpoint.call();
            if (probe) {
                governor_.reportRecovery(source);
            }
            continue;
        }

        counters.calls.fetch_add(1);
        int status = governor::callOrFallback(
            governor_, source, [&endpoint] { return endpoint.call(); }, 0);
        if (status == kStatusOk) {
            counters.successes.fetch_add(1);
        } else {
            counters.fallbacks.fetch_add(1);
        }
    }
}

// -- Formatting -------------------------------------------------------------

std::string formatSnapshot(const governor::SourceSnapshot& snapshot) {
    std::ostringstream oss;
    oss << snapshot.name
        << " breaker=" << governor::toString(snapshot.breaker)
        << " in_flight=" << snapshot.inFlight << '/' << snapshot.config.maxConcurrent
        << " queued=" << snapshot.queuedWaiters
        << " window=" << snapshot.admissionsInWindow << '/'
        << snapshot.config.maxRequestsPerWindow
        << " failures=" << snapshot.consecutiveFailures
        << " backoff_ms=" << snapshot.backoffRemaining.count()
        << " admitted=" << snapshot.totalAdmitted
        << " rejected=" << snapshot.totalRejected
        << " trips=" << snapshot.breakerTrips;
    return oss.str();
}

} // namespace sgov::service
