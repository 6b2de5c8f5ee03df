#pragma once

#include "storage/model/FileStat.hpp"
#include "storage/model/ReadStream.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace mg::storage {

namespace fs = std::filesystem;

// Direct filesystem access. Every failure leaves here as a StorageError subclass
// named after the errno that caused it.
class LocalBackend {
public:
    virtual ~LocalBackend() = default;

    // #########################################################################
    // ############################ READ OPS ###################################
    // #########################################################################

    [[nodiscard]] virtual std::vector<uint8_t> read(const fs::path& path, const model::ReadOptions& opts = {}) const;
    [[nodiscard]] virtual std::string readText(const fs::path& path) const;
    [[nodiscard]] virtual model::ReadStream createReadStream(const fs::path& path) const;

    // #########################################################################
    // ############################ WRITE OPS ##################################
    // #########################################################################

    // Creates or truncates.
    virtual void write(const fs::path& path, const std::vector<uint8_t>& data) const;

    // The file must exist. Bytes are written from offset 0 without truncating.
    virtual void overwrite(const fs::path& path, const std::vector<uint8_t>& data) const;

    // Fails with AlreadyExistsError if the file is present.
    virtual void createExclusive(const fs::path& path, const std::vector<uint8_t>& data) const;

    [[nodiscard]] virtual std::unique_ptr<std::ostream> createWriteStream(const fs::path& path) const;

    // #########################################################################
    // ############################ METADATA ###################################
    // #########################################################################

    [[nodiscard]] virtual model::FileStat stat(const fs::path& path) const;
    [[nodiscard]] virtual bool exists(const fs::path& path) const;
    virtual void utimes(const fs::path& path, model::Clock::time_point atime, model::Clock::time_point mtime) const;
    [[nodiscard]] virtual fs::path realpath(const fs::path& path) const;
    [[nodiscard]] virtual std::vector<std::string> readdir(const fs::path& dir) const;
    [[nodiscard]] virtual model::DiskUsage diskUsage(const fs::path& path) const;

    // #########################################################################
    // ########################### NAMESPACE OPS ###############################
    // #########################################################################

    // Atomic within one filesystem, CrossDeviceError otherwise.
    virtual void rename(const fs::path& from, const fs::path& to) const;
    virtual void copy(const fs::path& from, const fs::path& to) const;
    virtual void unlink(const fs::path& path) const;
    virtual void unlinkDir(const fs::path& dir, bool recursive) const;
    virtual void mkdirs(const fs::path& dir) const;

    // Depth-first prune of empty directories below dir; dir itself only when includeSelf.
    virtual void removeEmptyDirs(const fs::path& dir, bool includeSelf = false) const;
};

}
