#include "core/LogSource.hpp"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>

#include <zlib.h>

namespace fs = std::filesystem;

namespace gitminer {

namespace LogSource {

namespace {
    /**
     * @brief Inflate a gzip stream (possibly several members)
     *
     * windowBits 16 + MAX_WBITS tells zlib to expect the gzip wrapper.
     */
    Expected<std::string> gzipDecompress(const std::string& compressed) {
        z_stream stream{};
        stream.zalloc = Z_NULL;
        stream.zfree = Z_NULL;
        stream.opaque = Z_NULL;

        if (inflateInit2(&stream, 16 + MAX_WBITS) != Z_OK) {
            return Error{ErrorCode::IoError, "zlib inflateInit2 failed", ""};
        }

        stream.avail_in = static_cast<uInt>(compressed.size());
        stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed.data()));

        std::string decompressed;
        std::vector<uint8_t> buffer(16384);

        while (true) {
            stream.avail_out = static_cast<uInt>(buffer.size());
            stream.next_out = buffer.data();

            int ret = inflate(&stream, Z_NO_FLUSH);
            if (ret != Z_OK && ret != Z_STREAM_END) {
                std::string reason = stream.msg ? stream.msg : (ret == Z_BUF_ERROR ? "truncated input" : "inflate failed");
                inflateEnd(&stream);
                return Error{ErrorCode::IoError, "Corrupt gzip log: " + reason, ""};
            }

            size_t have = buffer.size() - stream.avail_out;
            decompressed.append(reinterpret_cast<char*>(buffer.data()), have);

            if (ret == Z_STREAM_END) {
                // Another gzip member may follow
                if (stream.avail_in == 0) break;
                if (inflateReset(&stream) != Z_OK) {
                    inflateEnd(&stream);
                    return Error{ErrorCode::IoError, "zlib inflateReset failed", ""};
                }
            }
        }

        inflateEnd(&stream);
        return decompressed;
    }
}

bool isGzip(const std::string& bytes) {
    return bytes.size() >= 2 &&
           static_cast<unsigned char>(bytes[0]) == 0x1f &&
           static_cast<unsigned char>(bytes[1]) == 0x8b;
}

Expected<std::string> decode(const std::string& bytes) {
    if (!isGzip(bytes)) return bytes;
    return gzipDecompress(bytes);
}

Expected<std::string> readLogText(std::istream& in) {
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return Error{ErrorCode::IoError, "Failed to read log input", ""};
    }
    return decode(buffer.str());
}

Expected<std::string> readLogText(const fs::path& path) {
    if (path == "-") {
        return readLogText(std::cin);
    }

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Error{ErrorCode::IoError, "Log file not found: " + path.string(), ""};
    }
    if (fs::is_directory(path, ec)) {
        return Error{ErrorCode::IoError, "Log path is a directory: " + path.string(), ""};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error{ErrorCode::IoError, "Failed to open log file: " + path.string(), ""};
    }
    auto text = readLogText(file);
    if (!text) {
        return Error{text.error().code, path.string() + ": " + text.error().message, ""};
    }
    return text;
}

}

}
