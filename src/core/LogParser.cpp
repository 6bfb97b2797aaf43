#include "core/LogParser.hpp"

#include <algorithm>
#include <exception>
#include <functional>
#include <future>
#include <iterator>
#include <utility>

#include "core/ChangeParser.hpp"
#include "core/HeaderParser.hpp"
#include "util/Logger.hpp"

namespace gitminer {

namespace {

/**
 * @brief Prefix an error with the line it came from
 *
 * The failing line is the first one in the block equal to Error::input
 * (parsing stops at the first bad line, so an earlier duplicate would have
 * failed first). Falls back to the block's first line.
 */
Error locate(Error err, const RawBlock& block) {
    size_t lineNo = block.firstLine;
    auto it = std::find(block.lines.begin(), block.lines.end(), err.input);
    if (it != block.lines.end()) {
        lineNo += static_cast<size_t>(std::distance(block.lines.begin(), it));
    }
    err.message = "line " + std::to_string(lineNo) + ": " + err.message;
    return err;
}

/// Assemble blocks [begin, end) in order; stops at the first failing block
Expected<std::vector<LogEntry>> assembleRange(const std::vector<RawBlock>& blocks, size_t begin, size_t end,
                                              const ParseOptions& options) {
    std::vector<LogEntry> entries;
    for (size_t i = begin; i < end; ++i) {
        auto res = assembleBlock(blocks[i], options);
        if (!res) return locate(res.error(), blocks[i]);
        auto& blockEntries = res.value();
        entries.insert(entries.end(), std::make_move_iterator(blockEntries.begin()),
                       std::make_move_iterator(blockEntries.end()));
    }
    return Expected<std::vector<LogEntry>>(std::move(entries));
}

/**
 * @brief Assemble contiguous chunks of blocks on worker threads
 *
 * Chunks are joined in order, so both the entry order and the reported
 * error match a sequential run.
 */
Expected<std::vector<LogEntry>> assembleParallel(const std::vector<RawBlock>& blocks, size_t jobs,
                                                 const ParseOptions& options) {
    const size_t n = blocks.size();
    const size_t chunk = (n + jobs - 1) / jobs;

    std::vector<std::future<Expected<std::vector<LogEntry>>>> futures;
    for (size_t begin = 0; begin < n; begin += chunk) {
        size_t end = std::min(begin + chunk, n);
        futures.push_back(std::async(std::launch::async, assembleRange, std::cref(blocks), begin, end,
                                     std::cref(options)));
    }

    std::vector<LogEntry> entries;
    bool failed = false;
    Error firstError;
    // Every future is drained so no worker outlives the blocks it reads
    for (auto& f : futures) {
        try {
            auto part = f.get();
            if (failed) continue;
            if (!part) {
                failed = true;
                firstError = part.error();
                continue;
            }
            auto& values = part.value();
            entries.insert(entries.end(), std::make_move_iterator(values.begin()),
                           std::make_move_iterator(values.end()));
        } catch (const std::exception& e) {
            if (!failed) {
                failed = true;
                firstError = Error{ErrorCode::InternalError, std::string("Parse worker failed: ") + e.what(), ""};
            }
        }
    }
    if (failed) return firstError;
    return Expected<std::vector<LogEntry>>(std::move(entries));
}

}

Expected<std::vector<LogEntry>> assembleBlock(const RawBlock& block, const ParseOptions& options) {
    PartitionedBlock parts = partitionBlock(block, options.headerMarker);

    if (options.rejectAmbiguousBlocks) {
        if (parts.headerLines.size() > 1) {
            return Error{ErrorCode::AmbiguousBlock,
                         "Block holds " + std::to_string(parts.headerLines.size()) +
                             " header lines; each would share the same file changes",
                         parts.headerLines[1]};
        }
        if (parts.headerLines.empty() && !parts.changeLines.empty()) {
            return Error{ErrorCode::AmbiguousBlock, "Block has file changes but no header line",
                         parts.changeLines.front()};
        }
    }

    auto headers = traverse(parts.headerLines, parseHeader);
    auto changes = traverse(parts.changeLines, parseChange);
    if (!headers) return headers.error();
    if (!changes) return changes.error();

    std::vector<LogEntry> entries;
    if (headers.value().empty()) {
        if (!changes.value().empty()) {
            Logger::instance().warn("Ignoring " + std::to_string(changes.value().size()) +
                                    " file change(s) at line " + std::to_string(block.firstLine) +
                                    ": no header line precedes them");
        }
        return Expected<std::vector<LogEntry>>(std::move(entries));
    }

    entries.reserve(headers.value().size());
    for (const auto& header : headers.value()) {
        entries.push_back(LogEntry{header.id, header.timestamp, header.author, changes.value()});
    }
    return Expected<std::vector<LogEntry>>(std::move(entries));
}

Expected<std::vector<LogEntry>> parse(const std::string& logText, const ParseOptions& options) {
    if (options.headerMarker.empty()) {
        return Error{ErrorCode::InvalidArgs, "Header marker must not be empty", ""};
    }

    std::vector<RawBlock> blocks = splitBlocks(logText);
    size_t jobs = std::min({std::max<size_t>(options.jobs, 1), blocks.size(), Constants::MAX_JOBS});
    Logger::instance().debug("Parsing " + std::to_string(blocks.size()) + " block(s) with " +
                             std::to_string(std::max<size_t>(jobs, 1)) + " job(s)");

    auto result = jobs > 1 ? assembleParallel(blocks, jobs, options)
                           : assembleRange(blocks, 0, blocks.size(), options);
    if (result) {
        Logger::instance().debug("Parsed " + std::to_string(result.value().size()) + " log entries");
    }
    return result;
}

}
