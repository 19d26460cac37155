/// @file main.cpp
/// @brief Governor probe entry point.
///
/// Loads the source table and policy, drives every configured source with
/// simulated collaborators, and prints per-source snapshots until SIGINT
/// or SIGTERM.

#include <cstdlib>
#include <iostream>
#include <memory>

#include "sgov/foundation/config_manager.hpp"
#include "sgov/governor/source_config.hpp"
#include "sgov/governor/source_governor.hpp"
#include "sgov/service/probe_runner.hpp"
#include "sgov/service/service_runner.hpp"

namespace {

void printSnapshots(const sgov::governor::SourceGovernor& governor,
                    const sgov::service::ProbeRunner& probe) {
    for (const auto& name : governor.sourceNames()) {
        auto snap = governor.snapshot(name);
        if (!snap) {
            continue;
        }
        auto stats = probe.stats(name);
        std::cout << sgov::service::formatSnapshot(snap.value())
                  << " calls=" << stats.calls
                  << " fallbacks=" << stats.fallbacks << "\n";
    }
    std::cout << std::flush;
}

} // namespace

int main(int argc, char* argv[]) {
    sgov::service::SignalHandler signals;

    auto configPath = sgov::service::parseConfigArg(argc, argv);
    if (configPath.empty()) {
        configPath = "/etc/sgov/governor.yaml";
    }

    sgov::foundation::ConfigManager config;
    auto loadResult = sgov::service::loadConfig(config, configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: "
                  << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto sources = sgov::governor::loadSourceTable(config);
    if (!sources) {
        std::cerr << "Invalid source table: " << sources.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto policy = sgov::governor::loadGovernorPolicy(config);
    if (!policy) {
        std::cerr << "Invalid governor policy: " << policy.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto probeConfig = sgov::service::loadProbeConfig(config);
    if (!probeConfig) {
        std::cerr << "Invalid probe config: " << probeConfig.error().message() << "\n";
        return EXIT_FAILURE;
    }

    sgov::governor::SourceGovernor governor(std::move(sources).value(), policy.value());
    sgov::service::ProbeRunner probe(governor, probeConfig.value());
    probe.start();

    std::cout << "Governor probe started (" << governor.sourceNames().size()
              << " sources)\n";

    while (!signals.waitForShutdown(probeConfig.value().reportInterval)) {
        printSnapshots(governor, probe);
    }

    std::cout << "Shutting down probe...\n";
    probe.stop();
    printSnapshots(governor, probe);
    std::cout << "Governor probe stopped\n";
    return EXIT_SUCCESS;
}
