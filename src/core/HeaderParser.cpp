#include "core/HeaderParser.hpp"

#include <algorithm>
#include <vector>

#include "core/Constants.hpp"
#include "util/StringUtils.hpp"

namespace gitminer {

Expected<LogHeader> parseHeader(const std::string& rawLine) {
    std::string unquoted = StringUtils::removeAll(rawLine, Constants::HEADER_QUOTE);
    std::vector<std::string> fields = StringUtils::split(unquoted, Constants::HEADER_FIELD_DELIMITER);
    fields.erase(std::remove_if(fields.begin(), fields.end(),
                                [](const std::string& f) { return f.empty(); }),
                 fields.end());

    if (fields.size() != Constants::HEADER_FIELD_COUNT) {
        return Error{ErrorCode::MalformedHeader,
                     "Wrong format of log entry header (expected id--date--author, got " +
                         std::to_string(fields.size()) +
                         " fields). Check the --pretty=format argument of git log. Raw header: " + rawLine,
                     rawLine};
    }

    auto id = CommitId::from(fields[0]);
    if (!id) {
        return Error{ErrorCode::MalformedHeader, id.error().message + ". Raw header: " + rawLine, rawLine};
    }

    auto timestamp = CommitTimestamp::parse(fields[1]);
    if (!timestamp) {
        return Error{ErrorCode::InvalidTimestamp,
                     "Error while parsing the commit date of " + rawLine + ": " + timestamp.error().message,
                     rawLine};
    }

    return LogHeader{id.value(), timestamp.value(), Author::from(fields[2])};
}

}
