#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace mg::storage {

struct CrawlOptions {
    std::vector<std::string> roots;
    std::vector<std::string> exclusionPatterns;  // shell globs against the absolute path
    bool includeHidden = false;
    std::vector<std::string> extensions;         // ".jpg" style, case-insensitive; empty = any file
    size_t batchSize = 10000;
};

// Forward-only, single-pass enumeration of regular files under local roots,
// handed out in batches. Stop consuming to cancel.
class Walker {
public:
    explicit Walker(CrawlOptions opts);

    Walker(const Walker&) = delete;
    Walker& operator=(const Walker&) = delete;
    Walker(Walker&&) noexcept = default;
    Walker& operator=(Walker&&) noexcept = default;

    // Next non-empty batch, std::nullopt once every root is exhausted.
    [[nodiscard]] std::optional<std::vector<std::string>> next();

    [[nodiscard]] bool done() const { return done_; }

private:
    CrawlOptions opts_;
    size_t rootIdx_ = 0;
    std::optional<fs::recursive_directory_iterator> it_;
    bool done_ = false;

    bool advanceRoot();
    [[nodiscard]] bool excluded(const fs::path& p, bool isDir) const;
    [[nodiscard]] bool extensionAllowed(const fs::path& p) const;
};

// Drains a walker into one list.
[[nodiscard]] std::vector<std::string> crawl(const CrawlOptions& opts);

}
