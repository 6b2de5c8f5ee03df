#pragma once

#include "storage/model/FileStat.hpp"
#include "storage/model/LogicalPath.hpp"
#include "storage/model/ReadStream.hpp"
#include "storage/s3/ClientCache.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mg::storage {

// Logical-path operations against object stores. Paths arrive already parsed;
// the client for each request is looked up by host.
class ObjectBackend {
public:
    static constexpr auto META_LAST_MODIFIED = "last-modified";
    static constexpr auto META_LAST_ACCESSED = "last-accessed";

    // Read streams are spooled through files under tempDir.
    ObjectBackend(std::shared_ptr<s3::ClientCache> clients, std::filesystem::path tempDir);

    [[nodiscard]] std::vector<uint8_t> read(const model::RemotePath& p, const model::ReadOptions& opts = {}) const;
    // The body is downloaded into a scratch file that lives as long as the stream.
    [[nodiscard]] model::ReadStream createReadStream(const model::RemotePath& p,
                                                     const std::optional<std::string>& mimeType = std::nullopt) const;
    void write(const model::RemotePath& p, const std::vector<uint8_t>& data) const;

    [[nodiscard]] model::FileStat stat(const model::RemotePath& p) const;
    [[nodiscard]] bool exists(const model::RemotePath& p) const;

    // Server-side copy through the destination host's client. Metadata travels with the object.
    void copy(const model::RemotePath& from, const model::RemotePath& to) const;
    void unlink(const model::RemotePath& p) const;

    // Metadata-replacing self-copy that keeps existing custom metadata.
    void utimes(const model::RemotePath& p, model::Clock::time_point atime, model::Clock::time_point mtime) const;

    uintmax_t upload(const model::RemotePath& p, std::istream& in, const s3::ChunkFn& onChunk = {}) const;
    void download(const model::RemotePath& p, const std::filesystem::path& dest) const;

    // Body chunks as they arrive. Returns the content type.
    std::optional<std::string> stream(const model::RemotePath& p, const s3::ChunkFn& onChunk) const;

private:
    std::shared_ptr<s3::ClientCache> clients_;
    std::filesystem::path tempDir_;

    [[nodiscard]] std::shared_ptr<s3::ObjectClient> client(const model::RemotePath& p) const;
};

}
