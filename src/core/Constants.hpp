#pragma once

#include <cstddef>

/**
 * @brief Log format constants used throughout the codebase
 *
 * The header convention matches an export produced with:
 *   git log --numstat --date=short --pretty=format:"'--%h--%ad--%aN'"
 */
namespace gitminer {

namespace Constants {
    // Block structure
    constexpr const char* BLOCK_DELIMITER = "\n\n";   // Blank line separates commits
    constexpr char LINE_DELIMITER = '\n';

    // Header line: '--<id>--<date>--<author>'
    constexpr const char* HEADER_MARKER = "'--";      // Prefix that flags a header line
    constexpr const char* HEADER_FIELD_DELIMITER = "--";
    constexpr char HEADER_QUOTE = '\'';                // Stripped before splitting
    constexpr size_t HEADER_FIELD_COUNT = 3;           // id, date, author

    // Change line: <added>\t<removed>\t<path>
    constexpr char CHANGE_FIELD_DELIMITER = '\t';
    constexpr size_t CHANGE_FIELD_COUNT = 3;

    // CLI defaults
    constexpr size_t DEFAULT_TOP_REVISIONS = 10;       // Rows shown by 'revisions'
    constexpr size_t DEFAULT_MAX_ENTRIES = 10;         // Entries shown by 'entries'
    constexpr size_t MAX_JOBS = 64;
}
}
