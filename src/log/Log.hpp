#pragma once

#include <optional>
#include <string>

namespace schedview {
namespace log {

enum class Level {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
};

/** Messages below this level are dropped. Defaults to INFO. */
void setLevel(Level level);
Level level();

/** Parse "debug", "info", "warn" or "error". */
std::optional<Level> parseLevel(const std::string& text);

/**
 * Write one line. INFO and DEBUG go to stdout, WARN and ERROR to stderr.
 * Lines from concurrent threads are never interleaved.
 */
void write(Level level, const std::string& message);

inline void debug(const std::string& message) { write(Level::DEBUG, message); }
inline void info(const std::string& message) { write(Level::INFO, message); }
inline void warn(const std::string& message) { write(Level::WARN, message); }
inline void error(const std::string& message) { write(Level::ERROR, message); }

} // namespace log
} // namespace schedview
