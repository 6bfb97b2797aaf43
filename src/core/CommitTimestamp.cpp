#include "core/CommitTimestamp.hpp"

#include <array>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iterator>
#include <locale>
#include <sstream>

#include "util/StringUtils.hpp"

namespace gitminer {

namespace {

// Index 0 is Sunday
constexpr std::array<const char*, 7> WEEKDAY_NAMES = {
    "Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"
};

/**
 * @brief One date layout git can emit
 *
 * The pattern covers the calendar fields; the fraction and the UTC offset
 * that may follow are read by readSuffix().
 */
struct DateFormat {
    const char* pattern;
    bool leadingYear;   // text must open with "YYYY-"
    bool fraction;      // ".fff" may follow the seconds
    bool weekday;       // pattern opens with %a
};

// Longest layouts first so a shorter one never claims a prefix
constexpr std::array<DateFormat, 7> DATE_FORMATS = {{
    {"%Y-%m-%dT%H:%M:%S", true, true, false},       // --date=iso-strict
    {"%Y-%m-%dT%H:%M", true, false, false},
    {"%Y-%m-%d %H:%M:%S", true, false, false},      // --date=iso
    {"%Y-%m-%d %H:%M", true, false, false},
    {"%Y-%m-%d", true, false, false},               // --date=short
    {"%a, %d %b %Y %H:%M:%S", false, false, true},  // --date=rfc
    {"%a %b %d %H:%M:%S %Y", false, false, true},   // git default
}};

/**
 * @brief Days since 1970-01-01 for a proleptic Gregorian date
 *
 * Howard Hinnant's days_from_civil; valid for negative years too.
 */
int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civilFromDays(int64_t z, int& year, int& month, int& day) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    year = static_cast<int>(y + (month <= 2));
}

int64_t floorDiv(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

bool isLeapYear(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int daysInMonth(int y, int m) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && isLeapYear(y)) return 29;
    return days[m - 1];
}

bool isDigitAt(const std::string& s, size_t i) {
    return i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]));
}

bool hasLeadingYear(const std::string& text) {
    return isDigitAt(text, 0) && isDigitAt(text, 1) && isDigitAt(text, 2) && isDigitAt(text, 3) &&
           text.size() > 4 && text[4] == '-';
}

int weekdayIndex(const std::string& text) {
    std::string name = text.substr(0, 3);
    for (size_t i = 0; i < WEEKDAY_NAMES.size(); ++i) {
        if (name == WEEKDAY_NAMES[i]) return static_cast<int>(i);
    }
    return -1;
}

/// Read the calendar fields with the classic locale; rest gets what follows
bool readFields(const std::string& text, const DateFormat& fmt, std::tm& tm, std::string& rest) {
    std::istringstream in(text);
    in.imbue(std::locale::classic());
    tm = std::tm{};
    in >> std::get_time(&tm, fmt.pattern);
    if (in.fail()) return false;
    rest.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
}

// [.fff][ ][Z|(+|-)HH[:]MM]
bool readSuffix(const std::string& rest, bool fraction, int& millis, int& offsetMinutes, std::string& why) {
    size_t pos = 0;
    if (fraction && pos < rest.size() && rest[pos] == '.') {
        ++pos;
        // Keep milliseconds, drop finer digits
        int digits = 0;
        int value = 0;
        for (; isDigitAt(rest, pos); ++pos, ++digits) {
            if (digits < 3) value = value * 10 + (rest[pos] - '0');
        }
        if (digits == 0) { why = "expected fractional seconds"; return false; }
        for (int i = digits; i < 3; ++i) value *= 10;
        millis = value;
    }
    while (pos < rest.size() && rest[pos] == ' ') ++pos;

    if (pos < rest.size() && rest[pos] == 'Z') {
        ++pos;
    } else if (pos < rest.size() && (rest[pos] == '+' || rest[pos] == '-')) {
        int sign = rest[pos] == '-' ? -1 : 1;
        ++pos;
        if (!isDigitAt(rest, pos) || !isDigitAt(rest, pos + 1)) { why = "expected two-digit offset hours"; return false; }
        int hh = (rest[pos] - '0') * 10 + (rest[pos + 1] - '0');
        pos += 2;
        if (pos < rest.size() && rest[pos] == ':') ++pos;
        if (!isDigitAt(rest, pos) || !isDigitAt(rest, pos + 1)) { why = "expected two-digit offset minutes"; return false; }
        int mm = (rest[pos] - '0') * 10 + (rest[pos + 1] - '0');
        pos += 2;
        if (hh > 23 || mm > 59) { why = "UTC offset out of range"; return false; }
        offsetMinutes = sign * (hh * 60 + mm);
    }

    if (pos != rest.size()) {
        why = "unexpected trailing text '" + rest.substr(pos) + "'";
        return false;
    }
    return true;
}

}

Expected<CommitTimestamp> CommitTimestamp::parse(const std::string& raw) {
    auto reject = [&raw](const std::string& why) -> Expected<CommitTimestamp> {
        return Error{ErrorCode::InvalidTimestamp, "Cannot parse date '" + raw + "': " + why, raw};
    };

    std::string text = StringUtils::trim(raw);
    if (text.empty()) return reject("date is empty");

    // Reason from the first layout whose fields matched, if any did
    std::string why;
    for (const auto& fmt : DATE_FORMATS) {
        if (fmt.leadingYear && !hasLeadingYear(text)) continue;

        std::tm tm{};
        std::string rest;
        if (!readFields(text, fmt, tm, rest)) continue;

        int millis = 0;
        int offsetMinutes = 0;
        std::string suffixWhy;
        if (!readSuffix(rest, fmt.fraction, millis, offsetMinutes, suffixWhy)) {
            if (why.empty()) why = suffixWhy;
            continue;
        }

        int year = tm.tm_year + 1900;
        int month = tm.tm_mon + 1;
        if (tm.tm_mday < 1 || tm.tm_mday > daysInMonth(year, month)) return reject("day out of range");
        if (tm.tm_sec > 59) return reject("second out of range");

        int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(tm.tm_mday));
        // 1970-01-01 was a Thursday
        if (fmt.weekday && weekdayIndex(text) != static_cast<int>(((days % 7) + 7 + 4) % 7)) {
            return reject("day of week does not match the date");
        }

        int64_t seconds = days * 86400 + tm.tm_hour * 3600 + tm.tm_min * 60 + tm.tm_sec
                          - static_cast<int64_t>(offsetMinutes) * 60;
        return CommitTimestamp(seconds * 1000 + millis, offsetMinutes);
    }
    return reject(why.empty() ? "unrecognized date/time format" : why);
}

CommitTimestamp::TimePoint CommitTimestamp::instant() const {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(millis)));
}

std::string CommitTimestamp::toIso8601() const {
    int64_t localSeconds = floorDiv(millis, 1000) + static_cast<int64_t>(offsetMinutes) * 60;
    int64_t days = floorDiv(localSeconds, 86400);
    int64_t secOfDay = localSeconds - days * 86400;

    int year = 0;
    int month = 0;
    int day = 0;
    civilFromDays(days, year, month, day);

    int absOffset = offsetMinutes < 0 ? -offsetMinutes : offsetMinutes;
    char buffer[40];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d%c%02d:%02d",
                  year, month, day,
                  static_cast<int>(secOfDay / 3600), static_cast<int>((secOfDay % 3600) / 60),
                  static_cast<int>(secOfDay % 60),
                  offsetMinutes < 0 ? '-' : '+', absOffset / 60, absOffset % 60);
    return buffer;
}

}
