#pragma once

#include <string>

#include "core/LogEntry.hpp"
#include "util/Expected.hpp"

namespace gitminer {

/**
 * @brief Parse one commit header line
 *
 * Format: '<id>--<date>--<author>', usually with a leading delimiter
 * ('--<id>--<date>--<author>'). Every single quote is removed, the rest is
 * split on "--" and empty fragments are dropped. Exactly three fragments
 * must remain.
 *
 * @return Header, or
 *   - MalformedHeader when the line does not hold exactly three fields
 *   - InvalidTimestamp when the date field is not a recognised date
 *   In both cases Error::input is the raw line.
 */
Expected<LogHeader> parseHeader(const std::string& rawLine);

}
