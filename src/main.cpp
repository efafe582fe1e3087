#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <vector>

#include <pthread.h>

#include "config/ServerConfig.hpp"
#include "core/SchedulingEngine.hpp"
#include "core/SimulationClock.hpp"
#include "core/SimulationHost.hpp"
#include "log/Log.hpp"
#include "net/SessionBroker.hpp"

int main(int argc, char** argv) {
    schedview::ServerConfig config;
    std::vector<std::string> args(argv + 1, argv + argc);
    bool showHelp = false;
    std::string error;
    if (!schedview::parseServerArgs(args, config, showHelp, error) ||
        (!showHelp && !schedview::validateConfig(config, error))) {
        std::cerr << "schedview_server: " << error << std::endl;
        std::cerr << schedview::serverUsage(argv[0]);
        return 2;
    }
    if (showHelp) {
        std::cout << schedview::serverUsage(argv[0]);
        return 0;
    }
    schedview::log::setLevel(config.log_level);

    // Block the shutdown signals before any thread starts so only sigwait sees them.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0) {
        schedview::log::error("[!] cannot block shutdown signals");
        return 1;
    }

    schedview::SimulationHost host(
        schedview::SchedulingEngine(schedview::policyFromConfig(config), config.max_processes));
    schedview::SimulationClock clock(host, std::chrono::milliseconds(config.tick_interval_ms),
                                     config.start_paused);

    schedview::SessionBroker::Options options;
    options.host = config.host;
    options.port = config.port;
    options.max_clients = config.max_clients;
    options.send_timeout = std::chrono::milliseconds(config.send_timeout_ms);
    options.handshake_timeout = std::chrono::milliseconds(config.handshake_timeout_ms);
    options.queue_depth = config.outbound_queue_depth;
    options.default_quantum = config.quantum;
    schedview::SessionBroker broker(host, clock, options);

    host.setSnapshotListener([&broker](const schedview::Snapshot& snap) {
        broker.broadcast(snap);
    });

    if (!host.start()) {
        schedview::log::error("[!] failed to start simulation host");
        return 1;
    }
    if (!broker.start(error)) {
        schedview::log::error("[!] " + error);
        host.stop();
        return 1;
    }
    if (!clock.start()) {
        schedview::log::error("[!] failed to start simulation clock");
        broker.stop();
        host.stop();
        return 1;
    }

    schedview::log::info(std::string("[*] policy ") + config.policy + ", tick every " +
                         std::to_string(config.tick_interval_ms) + " ms" +
                         (config.start_paused ? ", paused" : ""));

    int received = 0;
    if (sigwait(&signals, &received) != 0) {
        schedview::log::error("[!] sigwait failed, shutting down");
    } else {
        schedview::log::info("[*] shutting down (signal " + std::to_string(received) + ")");
    }

    broker.stop();
    clock.stop();
    host.stop();
    return 0;
}
