#pragma once

#include <string>

#include "core/LogEntry.hpp"
#include "util/Expected.hpp"

namespace gitminer {

/**
 * @brief Parse one numstat change line
 *
 * Splits on TAB into exactly three fields: added count, removed count and
 * path. Counts go through LineDelta::parse, so "-" (binary files) is
 * accepted as "not applicable". The path is taken verbatim.
 *
 * @return Change record, or MalformedChange (Error::input = raw line) when
 *         the line does not hold exactly three fields
 */
Expected<ChangeRecord> parseChange(const std::string& rawLine);

}
