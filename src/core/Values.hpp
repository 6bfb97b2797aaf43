#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <utility>

#include "util/Expected.hpp"

namespace gitminer {

/**
 * @brief Opaque commit identifier (abbreviated or full hash)
 *
 * Only constructible through from(), which rejects identifiers that are
 * empty once surrounding whitespace is removed.
 */
class CommitId {
public:
    static Expected<CommitId> from(const std::string& raw);

    const std::string& str() const { return id; }

    bool operator==(const CommitId& other) const { return id == other.id; }
    bool operator!=(const CommitId& other) const { return id != other.id; }

private:
    explicit CommitId(std::string value) : id(std::move(value)) {}
    std::string id;
};

/// Author name exactly as it appears in the log
class Author {
public:
    static Author from(const std::string& raw) { return Author(raw); }

    const std::string& str() const { return name; }

    bool operator==(const Author& other) const { return name == other.name; }
    bool operator!=(const Author& other) const { return name != other.name; }
    bool operator<(const Author& other) const { return name < other.name; }

private:
    explicit Author(std::string value) : name(std::move(value)) {}
    std::string name;
};

/// Repository-relative path of a changed file (not normalized)
class FilePath {
public:
    static FilePath from(const std::string& raw) { return FilePath(raw); }

    const std::string& str() const { return path; }

    bool operator==(const FilePath& other) const { return path == other.path; }
    bool operator!=(const FilePath& other) const { return path != other.path; }
    bool operator<(const FilePath& other) const { return path < other.path; }

private:
    explicit FilePath(std::string value) : path(std::move(value)) {}
    std::string path;
};

/**
 * @brief Added or removed line count of one change
 *
 * Either a concrete non-negative count or "not applicable", which git
 * reports as "-" for binary files.
 */
class LineDelta {
public:
    /**
     * @brief Interpret a numstat count field
     *
     * A base-10 integer (optional sign, surrounding whitespace allowed) that
     * fits in int16_t and is not negative becomes a count. Anything else
     * becomes notApplicable(). Never fails.
     */
    static LineDelta parse(const std::string& raw);

    static LineDelta of(uint32_t lines) { return LineDelta(true, lines); }
    static LineDelta notApplicable() { return LineDelta(false, 0); }

    bool isApplicable() const { return applicable; }

    /// Line count; 0 when not applicable
    uint32_t lines() const { return count; }

    /// "12" or "-" (git's own spelling)
    std::string toString() const;

    bool operator==(const LineDelta& other) const {
        return applicable == other.applicable && count == other.count;
    }
    bool operator!=(const LineDelta& other) const { return !(*this == other); }

private:
    LineDelta(bool isCount, uint32_t lines) : applicable(isCount), count(lines) {}
    bool applicable{false};
    uint32_t count{0};
};

}

namespace std {

template <>
struct hash<gitminer::Author> {
    size_t operator()(const gitminer::Author& a) const { return hash<string>()(a.str()); }
};

template <>
struct hash<gitminer::FilePath> {
    size_t operator()(const gitminer::FilePath& p) const { return hash<string>()(p.str()); }
};

}
