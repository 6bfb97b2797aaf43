#pragma once

#include <string>
#include <vector>

#include "core/LogEntry.hpp"
#include "core/LogParser.hpp"
#include "util/Expected.hpp"

namespace gitminer {

/**
 * @brief Parse a non-negative count argument
 * @param text Argument value
 * @param flag Flag name used in the error message
 * @return Count, or InvalidArgs
 */
Expected<size_t> parseCount(const std::string& text, const std::string& flag);

/**
 * @brief Try to consume one of the parse flags shared by log commands
 *
 * Recognised at args[i]:
 *   --strict          reject ambiguous blocks
 *   --jobs <n>        parse with n workers
 *   --marker <text>   header line prefix
 *
 * On a match, options are updated and i is left on the last consumed
 * argument (the flag's value, if any).
 *
 * @return true when args[i] was a parse flag, false when it was not,
 *         InvalidArgs when the flag's value is missing or invalid
 */
Expected<bool> applyParseFlag(const std::vector<std::string>& args, size_t& i, ParseOptions& options);

/**
 * @brief Read a log export (file, "-" or gzip) and parse it
 */
Expected<std::vector<LogEntry>> loadEntries(const std::string& logPath, const ParseOptions& options);

}
