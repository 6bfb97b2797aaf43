#pragma once

#include <atomic>
#include <iosfwd>
#include <mutex>
#include <string>

namespace gitminer {

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

/**
 * @brief Process-wide diagnostic logger
 *
 * Level comes from GITMINER_LOG (debug|info|warn|error or 3..0) and
 * defaults to Info. Errors and warnings go to stderr, the rest to stdout.
 * Safe to call from parse workers: each message is written whole.
 */
class Logger {
public:
    static Logger& instance();
    void setLevel(LogLevel level);
    LogLevel level() const;
    void error(const std::string& msg) const;
    void warn(const std::string& msg) const;
    void info(const std::string& msg) const;
    void debug(const std::string& msg) const;

    /// Parse a level name or digit; returns fallback for anything else
    static LogLevel parseLevel(const std::string& text, LogLevel fallback);

private:
    Logger();
    void write(std::ostream& out, const char* prefix, const std::string& msg) const;

    std::atomic<LogLevel> currentLevel;
    mutable std::mutex writeMutex;
};

}
