#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "core/LogEntry.hpp"

namespace gitminer {

/**
 * @brief Aggregate figures over a parsed log
 *
 * authorsCount            distinct authors (exact name match)
 * commitsCount            entries
 * distinctFilesCount      distinct paths over all change records
 * totalChangedFilesCount  change records (a file touched twice counts twice)
 */
struct Summary {
    size_t authorsCount{0};
    size_t commitsCount{0};
    size_t distinctFilesCount{0};
    size_t totalChangedFilesCount{0};

    bool operator==(const Summary& other) const {
        return authorsCount == other.authorsCount && commitsCount == other.commitsCount &&
               distinctFilesCount == other.distinctFilesCount &&
               totalChangedFilesCount == other.totalChangedFilesCount;
    }
    bool operator!=(const Summary& other) const { return !(*this == other); }
};

/// How many change records touch one path
struct FileRevisions {
    FilePath path;
    size_t revisions{0};
};

/// Compute the summary; pure and independent of entry order
Summary summarize(const std::vector<LogEntry>& entries);

/**
 * @brief Revision count of every touched path
 *
 * Sorted by revisions (most first), ties by path ascending.
 */
std::vector<FileRevisions> revisions(const std::vector<LogEntry>& entries);

}
