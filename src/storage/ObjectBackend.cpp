#include "storage/ObjectBackend.hpp"
#include "storage/Errors.hpp"
#include "util/TempFile.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace mg::storage::model;
using namespace mg::util;

namespace mg::storage {

namespace {

// Reads a downloaded copy and removes it when the stream goes away.
class SpooledStream final : public std::ifstream {
public:
    explicit SpooledStream(std::unique_ptr<TempFile> file)
        : std::ifstream(file->path(), std::ios::binary), file_(std::move(file)) {}

    ~SpooledStream() override { close(); }

private:
    std::unique_ptr<TempFile> file_;
};

}

ObjectBackend::ObjectBackend(std::shared_ptr<s3::ClientCache> clients, std::filesystem::path tempDir)
    : clients_(std::move(clients)), tempDir_(std::move(tempDir)) {
    if (!clients_) throw std::invalid_argument("ObjectBackend requires a client cache");
}

std::shared_ptr<s3::ObjectClient> ObjectBackend::client(const RemotePath& p) const {
    return clients_->get(p.host);
}

std::vector<uint8_t> ObjectBackend::read(const RemotePath& p, const ReadOptions& opts) const {
    const auto body = client(p)->getObject(p.bucket, p.key);

    const auto size = body.data.size();
    const auto start = std::min<uintmax_t>(opts.position, size);
    auto end = size;
    if (opts.length) end = std::min<uintmax_t>(start + *opts.length, size);

    return {body.data.begin() + static_cast<std::ptrdiff_t>(start),
            body.data.begin() + static_cast<std::ptrdiff_t>(end)};
}

ReadStream ObjectBackend::createReadStream(const RemotePath& p, const std::optional<std::string>& mimeType) const {
    auto spool = std::make_unique<TempFile>(tempDir_, "read");

    std::optional<std::string> contentType;
    {
        std::ofstream out(spool->path(), std::ios::binary | std::ios::trunc);
        if (!out.is_open()) throwErrno(errno ? errno : EIO, "open " + spool->path().string());

        contentType = client(p)->streamObject(p.bucket, p.key, [&](const char* data, const size_t len) {
            out.write(data, static_cast<std::streamsize>(len));
            if (!out) throw TransientIOError("write failed for " + spool->path().string());
        });

        out.close();
        if (out.fail()) throw TransientIOError("write failed for " + spool->path().string());
    }

    const auto length = static_cast<uintmax_t>(std::filesystem::file_size(spool->path()));
    auto stream = std::make_unique<SpooledStream>(std::move(spool));
    if (!stream->is_open()) throw TransientIOError("cannot reopen spooled copy of " + to_string(p));

    return {
        .stream = std::move(stream),
        .length = length,
        .type = mimeType ? mimeType : contentType
    };
}

void ObjectBackend::write(const RemotePath& p, const std::vector<uint8_t>& data) const {
    client(p)->putObject(p.bucket, p.key, std::string(data.begin(), data.end()));
}

FileStat ObjectBackend::stat(const RemotePath& p) const {
    const auto head = client(p)->headObject(p.bucket, p.key);
    if (!head) throw NotFoundError("stat " + to_string(p) + ": object not found");

    const auto lastModified = head->lastModified.value_or(Clock::now());

    const auto fromMeta = [&](const char* key) -> Clock::time_point {
        const auto it = head->metadata.find(key);
        if (it == head->metadata.end()) return lastModified;
        if (const auto parsed = parseIsoString(it->second)) return *parsed;
        log::Registry::cloud()->debug("[ObjectBackend] Unparseable {} metadata on {}: {}", key, to_string(p), it->second);
        return lastModified;
    };

    return {
        .size = head->contentLength,
        .mtime = fromMeta(META_LAST_MODIFIED),
        .atime = fromMeta(META_LAST_ACCESSED),
        .birthtime = lastModified,
        .isDirectory = false
    };
}

bool ObjectBackend::exists(const RemotePath& p) const {
    return client(p)->headObject(p.bucket, p.key).has_value();
}

void ObjectBackend::copy(const RemotePath& from, const RemotePath& to) const {
    client(to)->copyObject(from.bucket, from.key, to.bucket, to.key);
}

void ObjectBackend::unlink(const RemotePath& p) const {
    client(p)->deleteObject(p.bucket, p.key);
}

void ObjectBackend::utimes(const RemotePath& p, const Clock::time_point atime, const Clock::time_point mtime) const {
    const auto c = client(p);
    const auto head = c->headObject(p.bucket, p.key);
    if (!head) throw NotFoundError("utimes " + to_string(p) + ": object not found");

    auto metadata = head->metadata;
    metadata.insert_or_assign(META_LAST_ACCESSED, toIsoString(atime));
    metadata.insert_or_assign(META_LAST_MODIFIED, toIsoString(mtime));

    c->copyObject(p.bucket, p.key, p.bucket, p.key, metadata, head->contentType);
}

uintmax_t ObjectBackend::upload(const RemotePath& p, std::istream& in, const s3::ChunkFn& onChunk) const {
    log::Registry::cloud()->debug("[ObjectBackend] Uploading stream to bucket={}, key={}", p.bucket, p.key);
    return client(p)->uploadStream(p.bucket, p.key, in, onChunk);
}

void ObjectBackend::download(const RemotePath& p, const std::filesystem::path& dest) const {
    client(p)->getObjectToFile(p.bucket, p.key, dest);
}

std::optional<std::string> ObjectBackend::stream(const RemotePath& p, const s3::ChunkFn& onChunk) const {
    return client(p)->streamObject(p.bucket, p.key, onChunk);
}

}
