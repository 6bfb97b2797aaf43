#include "cli/LogInput.hpp"

#include <charconv>

#include "core/LogSource.hpp"
#include "util/Logger.hpp"

namespace gitminer {

Expected<size_t> parseCount(const std::string& text, const std::string& flag) {
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, 10);
    if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
        return Error{ErrorCode::InvalidArgs, flag + " expects a non-negative number, got '" + text + "'", text};
    }
    return value;
}

Expected<bool> applyParseFlag(const std::vector<std::string>& args, size_t& i, ParseOptions& options) {
    const std::string& arg = args[i];
    if (arg == "--strict") {
        options.rejectAmbiguousBlocks = true;
        return true;
    }
    if (arg == "--jobs" || arg == "--marker") {
        if (i + 1 >= args.size()) {
            return Error{ErrorCode::InvalidArgs, arg + " requires a value", arg};
        }
        const std::string& value = args[++i];
        if (arg == "--marker") {
            if (value.empty()) return Error{ErrorCode::InvalidArgs, "--marker must not be empty", value};
            options.headerMarker = value;
            return true;
        }
        auto jobs = parseCount(value, "--jobs");
        if (!jobs) return jobs.error();
        if (jobs.value() == 0) return Error{ErrorCode::InvalidArgs, "--jobs must be at least 1", value};
        options.jobs = jobs.value();
        return true;
    }
    return false;
}

Expected<std::vector<LogEntry>> loadEntries(const std::string& logPath, const ParseOptions& options) {
    auto text = LogSource::readLogText(logPath);
    if (!text) return text.error();
    Logger::instance().debug("Read " + std::to_string(text.value().size()) + " bytes from " + logPath);

    auto entries = parse(text.value(), options);
    if (!entries) {
        const Error& err = entries.error();
        return Error{err.code, std::string(errorCodeName(err.code)) + " in " + logPath + ", " + err.message, err.input};
    }
    return entries;
}

}
