#pragma once

#include <vector>

#include "core/CommitTimestamp.hpp"
#include "core/Values.hpp"

namespace gitminer {

/**
 * @brief One file touched by a commit (a numstat row)
 *
 * Log format:
 *   <added><TAB><removed><TAB><path>
 *   12      3       src/main.cpp
 *   -       -       assets/logo.png     (binary: counts not applicable)
 */
struct ChangeRecord {
    LineDelta addedLines;
    LineDelta removedLines;
    FilePath path;
};

/**
 * @brief Parsed header line of a commit block
 *
 * Log format:
 *   '--<id>--<date>--<author>'
 */
struct LogHeader {
    CommitId id;
    CommitTimestamp timestamp;
    Author author;
};

/**
 * @brief A fully parsed commit: header fields plus every file it touched
 *
 * A commit may touch no files at all (e.g. a merge without a diff).
 */
struct LogEntry {
    CommitId id;
    CommitTimestamp timestamp;
    Author author;
    std::vector<ChangeRecord> changes;

    /// Number of change records whose line counts are known
    size_t countedChanges() const {
        size_t n = 0;
        for (const auto& c : changes) {
            if (c.addedLines.isApplicable() && c.removedLines.isApplicable()) ++n;
        }
        return n;
    }
};

}
