#include "core/ChangeParser.hpp"

#include <vector>

#include "core/Constants.hpp"
#include "util/StringUtils.hpp"

namespace gitminer {

Expected<ChangeRecord> parseChange(const std::string& rawLine) {
    std::vector<std::string> fields = StringUtils::split(rawLine, Constants::CHANGE_FIELD_DELIMITER);
    if (fields.size() != Constants::CHANGE_FIELD_COUNT) {
        return Error{ErrorCode::MalformedChange,
                     "Error parsing file change (expected added<TAB>removed<TAB>path, got " +
                         std::to_string(fields.size()) + " fields): " + rawLine,
                     rawLine};
    }
    return ChangeRecord{LineDelta::parse(fields[0]), LineDelta::parse(fields[1]), FilePath::from(fields[2])};
}

}
