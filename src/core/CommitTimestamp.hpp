#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "util/Expected.hpp"

namespace gitminer {

/**
 * @brief Point in time a commit was authored, as written in the log
 *
 * Keeps the UTC instant together with the offset the log used, so a
 * timestamp can be printed back in its original zone.
 *
 * Accepted forms (locale independent):
 *   2023-01-02                          git --date=short (midnight UTC)
 *   2023-01-02 10:00:00 +0100           git --date=iso
 *   2023-01-02T10:00:00+01:00           git --date=iso-strict (also Z, .fff)
 *   Mon, 2 Jan 2023 10:00:00 +0100      git --date=rfc
 *   Mon Jan 2 10:00:00 2023 +0100       git default
 */
class CommitTimestamp {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    /**
     * @brief Parse a date field from a log header
     * @return Timestamp, or InvalidTimestamp whose message names the text
     *         and the reason it was rejected (e.g. "day out of range")
     */
    static Expected<CommitTimestamp> parse(const std::string& raw);

    TimePoint instant() const;

    /// Milliseconds since the Unix epoch (UTC)
    int64_t epochMillis() const { return millis; }

    /// Offset from UTC the log wrote the time in, in minutes
    int utcOffsetMinutes() const { return offsetMinutes; }

    /// "YYYY-MM-DDTHH:MM:SS+HH:MM" in the original offset
    std::string toIso8601() const;

    /// Equal when both denote the same instant
    bool operator==(const CommitTimestamp& other) const { return millis == other.millis; }
    bool operator!=(const CommitTimestamp& other) const { return millis != other.millis; }
    bool operator<(const CommitTimestamp& other) const { return millis < other.millis; }

private:
    CommitTimestamp(int64_t epochMs, int offsetMin) : millis(epochMs), offsetMinutes(offsetMin) {}
    int64_t millis{0};
    int offsetMinutes{0};
};

}
