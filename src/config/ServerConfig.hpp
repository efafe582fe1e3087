#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "core/SchedulingPolicy.hpp"
#include "log/Log.hpp"

namespace schedview {

struct ServerConfig {
    std::string host = "127.0.0.1";
    std::uint16_t port = 5555;
    std::string policy = "FCFS";           // FCFS, SJF, SRTF, RR or PRIORITY
    int quantum = 2;                       // RR only
    std::uint32_t tick_interval_ms = 1000;
    std::size_t max_clients = 10;
    std::size_t max_processes = 0;         // 0 = unlimited
    std::uint32_t send_timeout_ms = 2000;  // renderer write bound
    std::uint32_t handshake_timeout_ms = 5000;
    std::size_t outbound_queue_depth = 64; // snapshots buffered per renderer
    bool start_paused = false;
    log::Level log_level = log::Level::INFO;
};

/**
 * Apply one `key = value` setting. Keys use the field names above, with
 * `-` accepted in place of `_`.
 * @return false with `error` filled for an unknown key or bad value
 */
bool applyConfigValue(ServerConfig& config, const std::string& key,
                      const std::string& value, std::string& error);

/**
 * Read a config file of `key = value` lines. Blank lines and lines starting
 * with `#` are ignored.
 */
bool loadConfigFile(const std::string& path, ServerConfig& config, std::string& error);

/**
 * Parse command line arguments (without argv[0]). `--config <path>` is
 * applied first, then every `--key value` override in order. `--help`
 * sets `showHelp`.
 */
bool parseServerArgs(const std::vector<std::string>& args, ServerConfig& config,
                     bool& showHelp, std::string& error);

/** Check cross-field constraints, e.g. that the policy name is known. */
bool validateConfig(const ServerConfig& config, std::string& error);

/** Build the engine policy described by the config. Call after validateConfig. */
SchedulingPolicy policyFromConfig(const ServerConfig& config);

/** Usage text for the server binary. */
std::string serverUsage(const std::string& program);

} // namespace schedview
