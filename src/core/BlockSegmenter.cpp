#include "core/BlockSegmenter.hpp"

#include <algorithm>
#include <utility>

#include "core/Constants.hpp"
#include "util/StringUtils.hpp"

namespace gitminer {

std::vector<RawBlock> splitBlocks(const std::string& logText) {
    std::vector<RawBlock> blocks;

    size_t end = logText.find_last_not_of(Constants::LINE_DELIMITER);
    if (end == std::string::npos) return blocks;
    std::string body = logText.substr(0, end + 1);

    size_t lineNo = 1;
    for (auto& chunk : StringUtils::split(body, Constants::BLOCK_DELIMITER)) {
        RawBlock block;
        block.firstLine = lineNo;
        block.lines = StringUtils::split(chunk, Constants::LINE_DELIMITER);
        // The delimiter itself spans one line break plus one blank line
        lineNo += block.lines.size() + 1;
        if (!chunk.empty()) blocks.push_back(std::move(block));
    }
    return blocks;
}

bool isHeaderLine(const std::string& line, const std::string& marker) {
    return StringUtils::startsWith(line, marker);
}

PartitionedBlock partitionBlock(const RawBlock& block, const std::string& marker) {
    auto firstChange = std::find_if(block.lines.begin(), block.lines.end(),
                                    [&marker](const std::string& l) { return !isHeaderLine(l, marker); });
    PartitionedBlock out;
    out.headerLines.assign(block.lines.begin(), firstChange);
    out.changeLines.assign(firstChange, block.lines.end());
    return out;
}

}
