#pragma once

#include "config/Config.hpp"
#include "storage/LocalBackend.hpp"
#include "storage/ObjectBackend.hpp"
#include "storage/Walker.hpp"
#include "storage/Watcher.hpp"
#include "storage/model/FileStat.hpp"
#include "storage/model/LogicalPath.hpp"
#include "storage/model/ReadStream.hpp"
#include "storage/model/UploadResult.hpp"
#include "storage/s3/ClientCache.hpp"
#include "util/TempFile.hpp"
#include "log/Registry.hpp"

#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace mg::storage {

// Single entry point for file access. Each call is routed to the local
// filesystem or an object store based on the shape of the path alone.
class Gateway {
public:
    static constexpr uintmax_t REMOTE_CAPACITY = 8ULL * 1024 * 1024 * 1024 * 1024 * 1024; // 8 EiB

    // Object store clients are built from the provider table in objectStore.
    Gateway(config::StorageConfig storage, const config::ObjectStoreConfig& objectStore);

    Gateway(config::StorageConfig storage, std::shared_ptr<LocalBackend> local, s3::ClientCache::Factory clientFactory);

    // #########################################################################
    // ############################ READ OPS ###################################
    // #########################################################################

    [[nodiscard]] std::vector<uint8_t> read(const std::string& path, const model::ReadOptions& opts = {}) const;
    [[nodiscard]] std::string readText(const std::string& path) const;
    [[nodiscard]] model::ReadStream createReadStream(const std::string& path,
                                                     const std::optional<std::string>& mimeType = std::nullopt) const;

    // #########################################################################
    // ############################ WRITE OPS ##################################
    // #########################################################################

    void write(const std::string& path, const std::vector<uint8_t>& data) const;
    void overwrite(const std::string& path, const std::vector<uint8_t>& data) const;
    void createExclusive(const std::string& path, const std::vector<uint8_t>& data) const;

    // Counts and optionally hashes bytes as they are transferred.
    model::UploadResult uploadFromStream(std::istream& in, const std::string& dest,
                                         const model::UploadOptions& opts = {}) const;

    // #########################################################################
    // ############################ METADATA ###################################
    // #########################################################################

    [[nodiscard]] model::FileStat stat(const std::string& path) const;
    [[nodiscard]] bool exists(const std::string& path) const;
    [[nodiscard]] std::string realpath(const std::string& path) const;
    [[nodiscard]] std::vector<std::string> readdir(const std::string& dir) const;
    void utimes(const std::string& path, model::Clock::time_point atime, model::Clock::time_point mtime) const;

    // Hex SHA-1 of the file content.
    [[nodiscard]] std::string hash(const std::string& path) const;

    [[nodiscard]] model::DiskUsage checkDiskUsage(const std::string& root) const;

    // #########################################################################
    // ########################### NAMESPACE OPS ###############################
    // #########################################################################

    // Remote to remote only within one bucket. Mixed or cross-bucket pairs throw
    // UnsupportedOperationError before any I/O.
    void rename(const std::string& from, const std::string& to) const;
    void copy(const std::string& from, const std::string& to) const;

    // A missing local file is only logged.
    void unlink(const std::string& path) const;
    void unlinkDir(const std::string& dir, bool recursive) const;

    void mkdirs(const std::string& dir) const;
    void ensureFolders(const std::string& path) const;
    void removeEmptyDirs(const std::string& dir, bool includeSelf = false) const;

    // #########################################################################
    // ########################### LOCAL BRIDGE ################################
    // #########################################################################

    // The callback fills a local file; remote destinations receive it as an upload afterwards.
    template <typename Fn>
    auto writeFile(const std::string& path, Fn&& callback) const -> std::invoke_result_t<Fn, const std::filesystem::path&> {
        using R = std::invoke_result_t<Fn, const std::filesystem::path&>;
        if (model::isLocal(path)) return std::forward<Fn>(callback)(std::filesystem::path(path));

        const auto remote = model::parse(path);
        const util::TempFile tmp(storage_.temp_dir, std::filesystem::path(remote.key).filename().string());
        log::Registry::storage()->debug("[Gateway] Writing to temporary file for upload: {}", tmp.path().string());

        if constexpr (std::is_void_v<R>) {
            std::forward<Fn>(callback)(tmp.path());
            uploadFile(tmp.path(), remote);
        } else {
            R result = std::forward<Fn>(callback)(tmp.path());
            uploadFile(tmp.path(), remote);
            return result;
        }
    }

    // The callback reads a local file; remote sources are downloaded first.
    template <typename Fn>
    auto withLocalPath(const std::string& path, Fn&& callback) const -> std::invoke_result_t<Fn, const std::filesystem::path&> {
        if (model::isLocal(path)) return std::forward<Fn>(callback)(std::filesystem::path(path));

        const auto remote = model::parse(path);
        const util::TempFile tmp(storage_.temp_dir, std::filesystem::path(remote.key).filename().string());
        log::Registry::storage()->debug("[Gateway] Downloading {} to {}", path, tmp.path().string());

        objects_->download(remote, tmp.path());
        return std::forward<Fn>(callback)(tmp.path());
    }

    // #########################################################################
    // ############################# SCANNING ##################################
    // #########################################################################

    [[nodiscard]] std::vector<std::string> crawl(const CrawlOptions& opts) const;
    [[nodiscard]] Walker walk(const CrawlOptions& opts) const;
    [[nodiscard]] WatchHandle watch(const std::vector<std::string>& paths, const WatchOptions& opts,
                                    WatchEvents events) const;

    [[nodiscard]] const config::StorageConfig& storageConfig() const { return storage_; }

private:
    config::StorageConfig storage_;
    std::shared_ptr<LocalBackend> local_;
    std::shared_ptr<s3::ClientCache> clients_;
    std::unique_ptr<ObjectBackend> objects_;

    void uploadFile(const std::filesystem::path& src, const model::RemotePath& dest) const;
    static void requireLocalRoots(const std::vector<std::string>& roots, const char* op);
};

}
