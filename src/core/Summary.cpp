#include "core/Summary.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace gitminer {

Summary summarize(const std::vector<LogEntry>& entries) {
    std::unordered_set<Author> authors;
    std::unordered_set<FilePath> files;
    Summary s;
    for (const auto& e : entries) {
        authors.insert(e.author);
        for (const auto& c : e.changes) {
            files.insert(c.path);
        }
        s.totalChangedFilesCount += e.changes.size();
    }
    s.authorsCount = authors.size();
    s.commitsCount = entries.size();
    s.distinctFilesCount = files.size();
    return s;
}

std::vector<FileRevisions> revisions(const std::vector<LogEntry>& entries) {
    std::unordered_map<FilePath, size_t> counts;
    for (const auto& e : entries) {
        for (const auto& c : e.changes) {
            ++counts[c.path];
        }
    }

    std::vector<FileRevisions> out;
    out.reserve(counts.size());
    for (const auto& [path, n] : counts) {
        out.push_back(FileRevisions{path, n});
    }
    std::sort(out.begin(), out.end(), [](const FileRevisions& a, const FileRevisions& b) {
        if (a.revisions != b.revisions) return a.revisions > b.revisions;
        return a.path < b.path;
    });
    return out;
}

}
