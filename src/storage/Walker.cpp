#include "storage/Walker.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cctype>
#include <fnmatch.h>

namespace mg::storage {

namespace {

std::string lower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool isHidden(const fs::path& p) {
    const auto name = p.filename().string();
    return !name.empty() && name.front() == '.';
}

}

Walker::Walker(CrawlOptions opts) : opts_(std::move(opts)) {
    if (opts_.batchSize == 0) opts_.batchSize = 1;
    for (auto& ext : opts_.extensions) {
        ext = lower(ext);
        if (!ext.empty() && ext.front() != '.') ext.insert(ext.begin(), '.');
    }
    if (opts_.roots.empty()) done_ = true;
}

bool Walker::advanceRoot() {
    while (rootIdx_ < opts_.roots.size()) {
        const fs::path root(opts_.roots[rootIdx_++]);
        std::error_code ec;
        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            log::Registry::scan()->warn("[Walker] Skipping root {}: {}", root.string(), ec.message());
            continue;
        }
        it_.emplace(std::move(it));
        return true;
    }
    it_.reset();
    return false;
}

bool Walker::excluded(const fs::path& p, const bool isDir) const {
    // Directories are tested with a trailing slash so "**/@eaDir/**" prunes the whole subtree
    const auto subject = isDir ? p.string() + "/" : p.string();
    return std::ranges::any_of(opts_.exclusionPatterns, [&](const std::string& pattern) {
        return ::fnmatch(pattern.c_str(), subject.c_str(), FNM_CASEFOLD) == 0;
    });
}

bool Walker::extensionAllowed(const fs::path& p) const {
    if (opts_.extensions.empty()) return true;
    const auto ext = lower(p.extension().string());
    return std::ranges::find(opts_.extensions, ext) != opts_.extensions.end();
}

std::optional<std::vector<std::string>> Walker::next() {
    if (done_) return std::nullopt;

    std::vector<std::string> batch;
    batch.reserve(std::min<size_t>(opts_.batchSize, 1024));

    while (batch.size() < opts_.batchSize) {
        if ((!it_ || *it_ == fs::recursive_directory_iterator()) && !advanceRoot()) {
            done_ = true;
            break;
        }

        auto& it = *it_;
        if (it == fs::recursive_directory_iterator()) continue;

        const auto& entry = *it;
        std::error_code ec;
        const bool isDir = entry.is_directory(ec);

        if ((!opts_.includeHidden && isHidden(entry.path())) || excluded(entry.path(), isDir)) {
            if (isDir) it.disable_recursion_pending();
        } else if (!isDir && entry.is_regular_file(ec) && extensionAllowed(entry.path())) {
            batch.push_back(fs::absolute(entry.path()).lexically_normal().string());
        }

        it.increment(ec);
        if (ec) {
            log::Registry::scan()->warn("[Walker] Iteration error, abandoning current root: {}", ec.message());
            it_.reset();
        }
    }

    if (batch.empty()) return std::nullopt;
    return batch;
}

std::vector<std::string> crawl(const CrawlOptions& opts) {
    std::vector<std::string> all;
    Walker walker(opts);
    while (auto batch = walker.next())
        all.insert(all.end(), std::make_move_iterator(batch->begin()), std::make_move_iterator(batch->end()));
    return all;
}

}
