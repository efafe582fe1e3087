#include "ServerConfig.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace schedview {

namespace {

std::string trim(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(text.rbegin(), text.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

bool parseUnsigned(const std::string& text, unsigned long long max, unsigned long long& out) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    try {
        out = std::stoull(text);
    } catch (const std::exception&) {
        return false;
    }
    return out <= max;
}

bool parseBool(const std::string& text, bool& out) {
    if (text == "true" || text == "1" || text == "yes" || text == "on") {
        out = true;
        return true;
    }
    if (text == "false" || text == "0" || text == "no" || text == "off") {
        out = false;
        return true;
    }
    return false;
}

} // namespace

bool applyConfigValue(ServerConfig& config, const std::string& rawKey,
                      const std::string& value, std::string& error) {
    std::string key(rawKey);
    std::replace(key.begin(), key.end(), '-', '_');
    unsigned long long number = 0;
    auto badValue = [&]() {
        error = "invalid value '" + value + "' for " + rawKey;
        return false;
    };

    if (key == "host") {
        if (value.empty()) {
            return badValue();
        }
        config.host = value;
    } else if (key == "port") {
        if (!parseUnsigned(value, std::numeric_limits<std::uint16_t>::max(), number)) {
            return badValue();
        }
        config.port = static_cast<std::uint16_t>(number);
    } else if (key == "policy") {
        config.policy = value;
    } else if (key == "quantum") {
        if (!parseUnsigned(value, std::numeric_limits<int>::max(), number) || number == 0) {
            return badValue();
        }
        config.quantum = static_cast<int>(number);
    } else if (key == "tick_interval_ms") {
        if (!parseUnsigned(value, std::numeric_limits<std::uint32_t>::max(), number) || number == 0) {
            return badValue();
        }
        config.tick_interval_ms = static_cast<std::uint32_t>(number);
    } else if (key == "max_clients") {
        if (!parseUnsigned(value, 4096, number) || number == 0) {
            return badValue();
        }
        config.max_clients = static_cast<std::size_t>(number);
    } else if (key == "max_processes") {
        if (!parseUnsigned(value, std::numeric_limits<int>::max(), number)) {
            return badValue();
        }
        config.max_processes = static_cast<std::size_t>(number);
    } else if (key == "send_timeout_ms") {
        if (!parseUnsigned(value, std::numeric_limits<std::uint32_t>::max(), number) || number == 0) {
            return badValue();
        }
        config.send_timeout_ms = static_cast<std::uint32_t>(number);
    } else if (key == "handshake_timeout_ms") {
        if (!parseUnsigned(value, std::numeric_limits<std::uint32_t>::max(), number) || number == 0) {
            return badValue();
        }
        config.handshake_timeout_ms = static_cast<std::uint32_t>(number);
    } else if (key == "outbound_queue_depth") {
        if (!parseUnsigned(value, 1 << 20, number) || number == 0) {
            return badValue();
        }
        config.outbound_queue_depth = static_cast<std::size_t>(number);
    } else if (key == "start_paused") {
        if (!parseBool(value, config.start_paused)) {
            return badValue();
        }
    } else if (key == "log_level") {
        auto lvl = log::parseLevel(value);
        if (!lvl) {
            return badValue();
        }
        config.log_level = *lvl;
    } else {
        error = "unknown setting '" + rawKey + "'";
        return false;
    }
    return true;
}

bool loadConfigFile(const std::string& path, ServerConfig& config, std::string& error) {
    std::ifstream in(path);
    if (!in) {
        error = "cannot open config file " + path;
        return false;
    }
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        std::string text = trim(line);
        if (text.empty() || text[0] == '#') {
            continue;
        }
        auto eq = text.find('=');
        if (eq == std::string::npos) {
            error = path + ":" + std::to_string(lineNo) + ": expected key = value";
            return false;
        }
        std::string setting;
        if (!applyConfigValue(config, trim(text.substr(0, eq)), trim(text.substr(eq + 1)), setting)) {
            error = path + ":" + std::to_string(lineNo) + ": " + setting;
            return false;
        }
    }
    return true;
}

bool parseServerArgs(const std::vector<std::string>& args, ServerConfig& config,
                     bool& showHelp, std::string& error) {
    showHelp = false;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) {
                error = "--config needs a path";
                return false;
            }
            if (!loadConfigFile(args[i + 1], config, error)) {
                return false;
            }
        }
    }
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            showHelp = true;
            return true;
        }
        if (arg == "--config") {
            ++i;
            continue;
        }
        if (arg == "--start-paused") {
            config.start_paused = true;
            continue;
        }
        if (arg.rfind("--", 0) != 0 || arg.size() == 2) {
            error = "unexpected argument '" + arg + "'";
            return false;
        }
        if (i + 1 >= args.size()) {
            error = arg + " needs a value";
            return false;
        }
        if (!applyConfigValue(config, arg.substr(2), args[++i], error)) {
            return false;
        }
    }
    return true;
}

bool validateConfig(const ServerConfig& config, std::string& error) {
    if (!parsePolicy(config.policy, config.quantum)) {
        error = "unknown policy '" + config.policy + "' (expected FCFS, SJF, SRTF, RR or PRIORITY)";
        return false;
    }
    if (config.quantum <= 0) {
        error = "quantum must be positive";
        return false;
    }
    return true;
}

SchedulingPolicy policyFromConfig(const ServerConfig& config) {
    return parsePolicy(config.policy, config.quantum).value_or(SchedulingPolicy{Fcfs{}});
}

std::string serverUsage(const std::string& program) {
    std::ostringstream oss;
    oss << "usage: " << program << " [options]\n"
        << "  --config <path>               key = value settings file\n"
        << "  --host <addr>                 listen address (127.0.0.1)\n"
        << "  --port <n>                    listen port, 0 picks one (5555)\n"
        << "  --policy <name>               FCFS, SJF, SRTF, RR, PRIORITY (FCFS)\n"
        << "  --quantum <n>                 round robin time slice (2)\n"
        << "  --tick-interval-ms <n>        time between ticks (1000)\n"
        << "  --max-clients <n>             concurrent connections (10)\n"
        << "  --max-processes <n>           process table size, 0 = unlimited (0)\n"
        << "  --send-timeout-ms <n>         renderer write timeout (2000)\n"
        << "  --handshake-timeout-ms <n>    time allowed for the handshake (5000)\n"
        << "  --outbound-queue-depth <n>    snapshots buffered per renderer (64)\n"
        << "  --start-paused                wait for a resume command\n"
        << "  --log-level <level>           debug, info, warn, error (info)\n";
    return oss.str();
}

} // namespace schedview
