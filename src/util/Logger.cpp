#include "util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace gitminer {

LogLevel Logger::parseLevel(const std::string& v, LogLevel fallback) {
    if (v == "debug" || v == "3") return LogLevel::Debug;
    if (v == "info" || v == "2") return LogLevel::Info;
    if (v == "warn" || v == "1") return LogLevel::Warn;
    if (v == "error" || v == "0") return LogLevel::Error;
    return fallback;
}

static LogLevel parseEnvLogLevel() {
    const char* env = std::getenv("GITMINER_LOG");
    if (!env) return LogLevel::Info;
    return Logger::parseLevel(env, LogLevel::Info);
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::Logger() : currentLevel(parseEnvLogLevel()) {}

void Logger::setLevel(LogLevel level) { currentLevel.store(level); }
LogLevel Logger::level() const { return currentLevel.load(); }

void Logger::write(std::ostream& out, const char* prefix, const std::string& msg) const {
    std::string line = prefix + msg + "\n";
    std::lock_guard<std::mutex> lock(writeMutex);
    out << line;
}

void Logger::error(const std::string& msg) const { if (level() >= LogLevel::Error) write(std::cerr, "[error] ", msg); }
void Logger::warn(const std::string& msg) const { if (level() >= LogLevel::Warn) write(std::cerr, "[warn ] ", msg); }
void Logger::info(const std::string& msg) const { if (level() >= LogLevel::Info) write(std::cout, "[info ] ", msg); }
void Logger::debug(const std::string& msg) const { if (level() >= LogLevel::Debug) write(std::cout, "[debug] ", msg); }

}
