#include "Log.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace schedview {
namespace log {

namespace {
    std::atomic<int> minLevel{static_cast<int>(Level::INFO)};
    std::mutex outputMutex;

    const char* levelTag(Level level) {
        switch (level) {
        case Level::DEBUG: return "DEBUG";
        case Level::INFO:  return "INFO ";
        case Level::WARN:  return "WARN ";
        case Level::ERROR: return "ERROR";
        }
        return "?    ";
    }

    std::string timestamp() {
        auto now = std::chrono::system_clock::now();
        std::time_t secs = std::chrono::system_clock::to_time_t(now);
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          now.time_since_epoch()).count() % 1000;
        std::tm local{};
        localtime_r(&secs, &local);
        std::ostringstream oss;
        oss << std::put_time(&local, "%H:%M:%S") << '.'
            << std::setw(3) << std::setfill('0') << millis;
        return oss.str();
    }
}

void setLevel(Level level) {
    minLevel = static_cast<int>(level);
}

Level level() {
    return static_cast<Level>(minLevel.load());
}

std::optional<Level> parseLevel(const std::string& text) {
    if (text == "debug") return Level::DEBUG;
    if (text == "info")  return Level::INFO;
    if (text == "warn")  return Level::WARN;
    if (text == "error") return Level::ERROR;
    return std::nullopt;
}

void write(Level lvl, const std::string& message) {
    if (static_cast<int>(lvl) < minLevel.load()) {
        return;
    }
    std::string line = timestamp() + " " + levelTag(lvl) + " " + message;
    std::lock_guard<std::mutex> lock(outputMutex);
    if (lvl >= Level::WARN) {
        std::cerr << line << std::endl;
    } else {
        std::cout << line << std::endl;
    }
}

} // namespace log
} // namespace schedview
