#include "storage/Gateway.hpp"
#include "storage/Errors.hpp"
#include "storage/s3/CredentialResolver.hpp"
#include "storage/s3/S3Controller.hpp"
#include "crypto/util/hash.hpp"

#include <cerrno>
#include <fmt/format.h>
#include <fstream>

using namespace mg::storage::model;

namespace mg::storage {

namespace {

constexpr size_t STREAM_CHUNK = 64 * 1024;

s3::ClientCache::Factory s3Factory(const config::ObjectStoreConfig& cfg) {
    auto resolver = std::make_shared<s3::CredentialResolver>(cfg);
    return [resolver, partSize = cfg.multipart_part_size, timeout = cfg.connect_timeout_seconds](const std::string& host) {
        auto creds = resolver->resolve(host);
        log::Registry::cloud()->info("[Gateway] S3 client for endpoint {} (region: {})", host, creds.region);
        return std::make_shared<s3::S3Controller>(std::move(creds), partSize, timeout);
    };
}

}

Gateway::Gateway(config::StorageConfig storage, const config::ObjectStoreConfig& objectStore)
    : Gateway(std::move(storage), std::make_shared<LocalBackend>(), s3Factory(objectStore)) {}

Gateway::Gateway(config::StorageConfig storage, std::shared_ptr<LocalBackend> local, s3::ClientCache::Factory clientFactory)
    : storage_(std::move(storage)),
      local_(std::move(local)),
      clients_(std::make_shared<s3::ClientCache>(std::move(clientFactory))),
      objects_(std::make_unique<ObjectBackend>(clients_, storage_.temp_dir)) {
    if (!local_) throw std::invalid_argument("Gateway requires a local backend");
}

// #########################################################################
// ############################ READ OPS ###################################
// #########################################################################

std::vector<uint8_t> Gateway::read(const std::string& path, const ReadOptions& opts) const {
    if (isLocal(path)) return local_->read(path, opts);
    return objects_->read(parse(path), opts);
}

std::string Gateway::readText(const std::string& path) const {
    if (isLocal(path)) return local_->readText(path);
    const auto bytes = objects_->read(parse(path));
    return {bytes.begin(), bytes.end()};
}

ReadStream Gateway::createReadStream(const std::string& path, const std::optional<std::string>& mimeType) const {
    if (isLocal(path)) {
        auto rs = local_->createReadStream(path);
        rs.type = mimeType;
        return rs;
    }
    return objects_->createReadStream(parse(path), mimeType);
}

// #########################################################################
// ############################ WRITE OPS ##################################
// #########################################################################

void Gateway::write(const std::string& path, const std::vector<uint8_t>& data) const {
    if (isLocal(path)) local_->write(path, data);
    else objects_->write(parse(path), data);
}

void Gateway::overwrite(const std::string& path, const std::vector<uint8_t>& data) const {
    if (isLocal(path)) local_->overwrite(path, data);
    else objects_->write(parse(path), data);
}

void Gateway::createExclusive(const std::string& path, const std::vector<uint8_t>& data) const {
    if (isLocal(path)) local_->createExclusive(path, data);
    else objects_->write(parse(path), data);
}

UploadResult Gateway::uploadFromStream(std::istream& in, const std::string& dest, const UploadOptions& opts) const {
    std::optional<crypto::hash::Sha1Stream> sha;
    if (opts.computeChecksum) sha.emplace();

    uintmax_t size = 0;
    const auto onChunk = [&](const char* data, const size_t len) {
        if (sha) sha->update(data, len);
        size += len;
    };

    if (isLocal(dest)) {
        const fs::path target(dest);
        if (target.has_parent_path()) local_->mkdirs(target.parent_path());

        const auto out = local_->createWriteStream(target);
        char buf[STREAM_CHUNK];
        while (in) {
            in.read(buf, sizeof(buf));
            const auto got = static_cast<size_t>(in.gcount());
            if (got == 0) break;
            onChunk(buf, got);
            out->write(buf, static_cast<std::streamsize>(got));
            if (!*out) throw TransientIOError("write failed for " + dest);
        }
        if (in.bad()) throw TransientIOError("read failed on upload source for " + dest);
        out->flush();
        if (!*out) throw TransientIOError("flush failed for " + dest);
    } else {
        const auto remote = parse(dest);
        log::Registry::cloud()->debug("[Gateway] Uploading stream to bucket={}, key={}", remote.bucket, remote.key);
        try {
            objects_->upload(remote, in, onChunk);
        } catch (const StorageError& e) {
            log::Registry::cloud()->error("[Gateway] Failed to upload file to {}: {}", dest, e.what());
            throw;
        }
        log::Registry::cloud()->debug("[Gateway] Uploaded {} ({} bytes)", dest, size);
    }

    return {
        .path = dest,
        .size = size,
        .checksum = sha ? std::optional<std::string>(sha->finalHex()) : std::nullopt
    };
}

void Gateway::uploadFile(const fs::path& src, const RemotePath& dest) const {
    std::ifstream in(src, std::ios::binary);
    if (!in.is_open()) throwErrno(errno ? errno : EIO, "open " + src.string());
    log::Registry::cloud()->debug("[Gateway] Uploading temporary file to bucket={}, key={}", dest.bucket, dest.key);
    objects_->upload(dest, in);
}

// #########################################################################
// ############################ METADATA ###################################
// #########################################################################

FileStat Gateway::stat(const std::string& path) const {
    if (isLocal(path)) return local_->stat(path);
    return objects_->stat(parse(path));
}

bool Gateway::exists(const std::string& path) const {
    if (isLocal(path)) return local_->exists(path);
    return objects_->exists(parse(path));
}

std::string Gateway::realpath(const std::string& path) const {
    if (isLocal(path)) return local_->realpath(path).string();
    return path; // no symlinks in object stores
}

std::vector<std::string> Gateway::readdir(const std::string& dir) const {
    if (isLocal(dir)) return local_->readdir(dir);
    throw UnsupportedOperationError("readdir is not supported for remote storage, use crawl() or walk(): " + dir);
}

void Gateway::utimes(const std::string& path, const Clock::time_point atime, const Clock::time_point mtime) const {
    if (isLocal(path)) local_->utimes(path, atime, mtime);
    else objects_->utimes(parse(path), atime, mtime);
}

std::string Gateway::hash(const std::string& path) const {
    if (isLocal(path)) return crypto::hash::sha1(path);

    crypto::hash::Sha1Stream sha;
    (void)objects_->stream(parse(path), [&sha](const char* data, const size_t len) { sha.update(data, len); });
    return sha.finalHex();
}

DiskUsage Gateway::checkDiskUsage(const std::string& root) const {
    if (!root.starts_with('/')) return {REMOTE_CAPACITY, REMOTE_CAPACITY, REMOTE_CAPACITY};
    return local_->diskUsage(root);
}

// #########################################################################
// ########################### NAMESPACE OPS ###############################
// #########################################################################

void Gateway::rename(const std::string& from, const std::string& to) const {
    const bool fromRemote = isRemote(from), toRemote = isRemote(to);

    if (!fromRemote && !toRemote) {
        local_->rename(from, to);
        return;
    }

    if (fromRemote && toRemote) {
        const auto src = parse(from), dst = parse(to);
        if (src.host != dst.host || src.bucket != dst.bucket)
            throw UnsupportedOperationError(fmt::format(
                "Cannot rename between different remote storage buckets: {}/{} -> {}/{}",
                src.host, src.bucket, dst.host, dst.bucket));

        objects_->copy(src, dst);
        unlink(from);
        return;
    }

    throw UnsupportedOperationError(fmt::format("Cannot rename between different storage backends: {} -> {}", from, to));
}

void Gateway::copy(const std::string& from, const std::string& to) const {
    const bool fromRemote = isRemote(from), toRemote = isRemote(to);

    if (!fromRemote && !toRemote) {
        local_->copy(from, to);
        return;
    }

    if (fromRemote && toRemote) {
        const auto src = parse(from), dst = parse(to);
        if (src.host != dst.host || src.bucket != dst.bucket)
            throw UnsupportedOperationError(fmt::format(
                "Cannot copy between different remote storage buckets: {}/{} -> {}/{}",
                src.host, src.bucket, dst.host, dst.bucket));

        objects_->copy(src, dst);
        return;
    }

    throw UnsupportedOperationError(fmt::format("Cannot copy between different storage backends: {} -> {}", from, to));
}

void Gateway::unlink(const std::string& path) const {
    if (isLocal(path)) {
        try {
            local_->unlink(path);
        } catch (const NotFoundError&) {
            log::Registry::storage()->warn("[Gateway] File {} does not exist.", path);
        }
        return;
    }

    try {
        objects_->unlink(parse(path));
    } catch (const StorageError& e) {
        log::Registry::cloud()->warn("[Gateway] Failed to delete object {}: {}", path, e.what());
        throw;
    }
}

void Gateway::unlinkDir(const std::string& dir, const bool recursive) const {
    if (isRemote(dir)) throw UnsupportedOperationError("unlinkDir is not supported for remote storage: " + dir);
    local_->unlinkDir(dir, recursive);
}

void Gateway::mkdirs(const std::string& dir) const {
    if (isLocal(dir)) local_->mkdirs(dir);
}

void Gateway::ensureFolders(const std::string& path) const {
    if (isRemote(path)) return;
    const fs::path p(path);
    if (p.has_parent_path()) local_->mkdirs(p.parent_path());
}

void Gateway::removeEmptyDirs(const std::string& dir, const bool includeSelf) const {
    if (isRemote(dir)) return; // object stores have no directories to prune
    local_->removeEmptyDirs(dir, includeSelf);
}

// #########################################################################
// ############################# SCANNING ##################################
// #########################################################################

void Gateway::requireLocalRoots(const std::vector<std::string>& roots, const char* op) {
    for (const auto& r : roots)
        if (isRemote(r)) throw UnsupportedOperationError(fmt::format("{} is only supported for local roots: {}", op, r));
}

std::vector<std::string> Gateway::crawl(const CrawlOptions& opts) const {
    requireLocalRoots(opts.roots, "crawl");
    return storage::crawl(opts);
}

Walker Gateway::walk(const CrawlOptions& opts) const {
    requireLocalRoots(opts.roots, "walk");
    return Walker(opts);
}

WatchHandle Gateway::watch(const std::vector<std::string>& paths, const WatchOptions& opts, WatchEvents events) const {
    requireLocalRoots(paths, "watch");
    return storage::watch(paths, opts, std::move(events));
}

}
