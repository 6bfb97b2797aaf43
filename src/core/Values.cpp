#include "core/Values.hpp"

#include <charconv>
#include <cstdint>

#include "util/StringUtils.hpp"

namespace gitminer {

Expected<CommitId> CommitId::from(const std::string& raw) {
    std::string id = StringUtils::trim(raw);
    if (id.empty()) {
        return Error{ErrorCode::MalformedHeader, "Commit id is empty", raw};
    }
    return CommitId(std::move(id));
}

LineDelta LineDelta::parse(const std::string& raw) {
    std::string text = StringUtils::trim(raw);
    if (text.empty()) return notApplicable();

    // from_chars takes a '-' but not a '+'
    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (*first == '+') {
        ++first;
        if (first == last || *first == '-') return notApplicable();
    }

    // Counts above the int16_t range are treated as non-numeric
    int16_t value = 0;
    auto [ptr, ec] = std::from_chars(first, last, value, 10);
    if (ec != std::errc() || ptr != last) return notApplicable();
    if (value < 0) return notApplicable();
    return of(static_cast<uint32_t>(value));
}

std::string LineDelta::toString() const {
    return applicable ? std::to_string(count) : std::string("-");
}

}
