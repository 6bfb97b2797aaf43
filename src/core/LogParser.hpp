#pragma once

#include <string>
#include <vector>

#include "core/BlockSegmenter.hpp"
#include "core/Constants.hpp"
#include "core/LogEntry.hpp"
#include "util/Expected.hpp"

namespace gitminer {

/**
 * @brief Knobs for turning log text into entries
 *
 * The defaults match an export made with
 *   git log --numstat --pretty=format:"'--%h--%ad--%aN'"
 */
struct ParseOptions {
    /// Prefix identifying header lines; must agree with the --pretty format
    std::string headerMarker{Constants::HEADER_MARKER};

    /**
     * Reject blocks with more than one header line, or with change lines but
     * no header (AmbiguousBlock). When false, every header of a block shares
     * the block's change list and headerless blocks are dropped with a warning.
     */
    bool rejectAmbiguousBlocks{false};

    /// Worker count for block assembly; 1 parses on the calling thread
    size_t jobs{1};
};

/**
 * @brief Turn one block into its entries
 *
 * Header lines and change lines are parsed independently; the block fails
 * with the first header error, otherwise with the first change error.
 * On success every header is paired with the same change list, so a
 * block normally yields exactly one entry.
 */
Expected<std::vector<LogEntry>> assembleBlock(const RawBlock& block, const ParseOptions& options = {});

/**
 * @brief Parse a whole exported log
 *
 * All-or-nothing: the first failing block (in log order) fails the parse
 * and no entries are returned. Its message is prefixed with the line the
 * block starts on. Entries keep log order, then header order within a
 * block. The result does not depend on options.jobs.
 */
Expected<std::vector<LogEntry>> parse(const std::string& logText, const ParseOptions& options = {});

}
