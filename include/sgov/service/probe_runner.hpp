#pragma once

/// @file probe_runner.hpp
/// @brief Simulated collaborators driving a SourceGovernor.
///
/// The probe runs worker threads per configured source against a simulated
/// flaky upstream, exercising admission, backoff and the breaker exactly as
/// real scanners do: admit, call, report, fall back on SourceUnavailable.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "sgov/foundation/config_manager.hpp"
#include "sgov/foundation/governor_result.hpp"
#include "sgov/governor/source_governor.hpp"

namespace sgov::service {

/// Simulation parameters (`probe.*` keys).
struct ProbeConfig {
    /// Concurrent callers per source.
    uint32_t workersPerSource = 2;

    /// Probability that a call fails with a server error.
    double failureRate = 0.1;

    /// Probability that a call is throttled (status 429).
    double throttleRate = 0.05;

    /// Simulated upstream latency per call.
    std::chrono::milliseconds callLatency{50};

    /// How long a worker waits before retrying a source whose breaker is open.
    std::chrono::milliseconds recoveryProbeInterval{10'000};

    /// Period between snapshot reports in the probe executable.
    std::chrono::milliseconds reportInterval{5'000};

    /// RNG seed; each source derives its own stream from it.
    uint64_t seed = 42;

    [[nodiscard]] foundation::GovernorResult<void> validate() const;
};

/// Read `probe.*` keys; absent keys keep the defaults.
[[nodiscard]] foundation::GovernorResult<ProbeConfig>
loadProbeConfig(const foundation::ConfigManager& config);

/// Upstream stand-in that fails at configured rates.
///
/// Thread-safe. Failures carry the HTTP status as `int` context.
class SimulatedEndpoint {
public:
    SimulatedEndpoint(double failureRate, double throttleRate,
                      std::chrono::milliseconds latency, uint64_t seed);

    /// Perform one call; returns the status code 200 on success.
    [[nodiscard]] foundation::GovernorResult<int> call();

    /// Change the failure rate at runtime (e.g. simulate an outage).
    void setFailureRate(double rate);

private:
    std::mutex mutex_;
    std::mt19937_64 rng_;
    double failureRate_;
    double throttleRate_;
    std::chrono::milliseconds latency_;
};

/// Per-source call counters.
struct ProbeStats {
    uint64_t calls = 0;
    uint64_t successes = 0;
    uint64_t fallbacks = 0;
    uint64_t recoveryProbes = 0;
};

/// Runs simulated collaborators against every configured source.
class ProbeRunner {
public:
    ProbeRunner(governor::SourceGovernor& governor, ProbeConfig config);
    ~ProbeRunner();

    ProbeRunner(const ProbeRunner&) = delete;
    ProbeRunner& operator=(const ProbeRunner&) = delete;

    /// Spawn the workers. No-op if already running.
    void start();

    /// Ask workers to stop and join them.
    ///
    /// A worker blocked inside an admission wait finishes that admission
    /// (and its call) before exiting; the governor has no cancellation.
    void stop();

    [[nodiscard]] bool isRunning() const noexcept;

    [[nodiscard]] ProbeStats stats(std::string_view source) const;

    /// Endpoint simulated for @p source, or nullptr.
    [[nodiscard]] SimulatedEndpoint* endpoint(std::string_view source);

private:
    struct Counters {
        std::atomic<uint64_t> calls{0};
        std::atomic<uint64_t> successes{0};
        std::atomic<uint64_t> fallbacks{0};
        std::atomic<uint64_t> recoveryProbes{0};
    };

    void workerLoop(const std::string& source);

    /// Sleep up to @p period unless stop() is called first.
    void pause(std::chrono::milliseconds period);

    governor::SourceGovernor& governor_;
    ProbeConfig config_;
    std::map<std::string, std::unique_ptr<SimulatedEndpoint>, std::less<>> endpoints_;
    std::map<std::string, std::unique_ptr<Counters>, std::less<>> counters_;

    std::atomic<bool> running_{false};
    std::mutex stopMutex_;
    std::condition_variable stopCv_;
    std::vector<std::thread> workers_;
};

/// One-line human-readable rendering of a snapshot.
[[nodiscard]] std::string formatSnapshot(const governor::SourceSnapshot& snapshot);

} // namespace sgov::service
