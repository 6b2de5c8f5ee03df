#pragma once

#include <filesystem>
#include <string>

namespace mg::util {

// Owns a path in a scratch directory and removes whatever is there when it goes
// out of scope. The file itself is created by whoever writes to path().
class TempFile {
public:
    // <dir>/mediagate-<uuid>-<suffix>
    TempFile(const std::filesystem::path& dir, const std::string& suffix);
    ~TempFile();

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

}
