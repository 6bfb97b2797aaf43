#pragma once

#include <filesystem>
#include <istream>
#include <string>

#include "util/Expected.hpp"

namespace gitminer {

/**
 * @brief Loads exported log text for the parser
 *
 * Exports may be plain text or gzip-compressed (e.g. `git log ... | gzip`).
 * Compression is detected from the gzip magic bytes, not the file name.
 */
namespace LogSource {

/**
 * @brief Read a log export
 * @param path File to read, or "-" for standard input
 * @return Decoded log text, or IoError when the file cannot be read or
 *         its gzip stream is corrupt
 */
Expected<std::string> readLogText(const std::filesystem::path& path);

/// Read everything from a stream and decode it (see decode())
Expected<std::string> readLogText(std::istream& in);

/// True when bytes start with the gzip magic number 1f 8b
bool isGzip(const std::string& bytes);

/**
 * @brief Inflate gzip data, or return plain text unchanged
 *
 * Concatenated gzip members are inflated back to back, as gunzip does.
 */
Expected<std::string> decode(const std::string& bytes);

}

}
