#pragma once

#include <string>
#include <vector>

namespace gitminer {

/**
 * @brief Lines of one blank-line-delimited chunk of the log
 *
 * Normally one commit: a header line followed by its change lines.
 */
struct RawBlock {
    std::vector<std::string> lines;
    size_t firstLine{1};     // 1-based line number of lines[0] in the whole log
};

/// A block's lines split into the leading header run and everything after it
struct PartitionedBlock {
    std::vector<std::string> headerLines;
    std::vector<std::string> changeLines;
};

/**
 * @brief Split the full log text into blocks
 *
 * Blocks are separated by "\n\n" and split into lines on "\n". Line breaks
 * that terminate the whole text are ignored and blocks without any
 * character are dropped, so an empty log yields no blocks.
 *
 * A blank line inside one commit's change list is read as a block
 * boundary; the export format never produces one.
 */
std::vector<RawBlock> splitBlocks(const std::string& logText);

/// True when line starts with the header marker (default "'--")
bool isHeaderLine(const std::string& line, const std::string& marker);

/**
 * @brief Separate header lines from change lines
 *
 * Takes the leading run of header lines; every later line is a change
 * line regardless of its content.
 */
PartitionedBlock partitionBlock(const RawBlock& block, const std::string& marker);

}
