#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <optional>
#include <string>
#include <unordered_map>

namespace mg::storage::s3 {

// Custom object metadata, keys without the x-amz-meta- prefix, lowercase.
using Metadata = std::unordered_map<std::string, std::string>;

// Called with every chunk of a transfer: pulled from an upload source before it is
// sent, or received from a download as it arrives.
using ChunkFn = std::function<void(const char* data, size_t len)>;

struct ObjectHead {
    uintmax_t contentLength{};
    std::optional<std::chrono::system_clock::time_point> lastModified;
    std::optional<std::string> contentType;
    Metadata metadata;
};

struct ObjectBody {
    std::string data;
    std::optional<std::string> contentType;
};

// Wire primitives of an S3-compatible store. Implementations are immutable
// after construction and may be shared between threads without locking.
class ObjectClient {
public:
    virtual ~ObjectClient() = default;

    [[nodiscard]] virtual ObjectBody getObject(const std::string& bucket, const std::string& key) const = 0;

    // Hands the body to onChunk as it arrives; nothing is buffered beyond one chunk.
    // An exception from onChunk aborts the transfer and propagates. Returns the content type.
    virtual std::optional<std::string> streamObject(const std::string& bucket, const std::string& key,
                                                    const ChunkFn& onChunk) const = 0;

    // Streams the body into dest, which is created or truncated.
    virtual void getObjectToFile(const std::string& bucket, const std::string& key,
                                 const std::filesystem::path& dest) const = 0;

    virtual void putObject(const std::string& bucket, const std::string& key, const std::string& body,
                           const Metadata& metadata = {}) const = 0;

    // Single PUT when the source is shorter than one part, multipart upload otherwise.
    // Returns the number of bytes sent.
    virtual uintmax_t uploadStream(const std::string& bucket, const std::string& key, std::istream& in,
                                   const ChunkFn& onChunk = {}) const = 0;

    // std::nullopt when the object does not exist.
    [[nodiscard]] virtual std::optional<ObjectHead> headObject(const std::string& bucket, const std::string& key) const = 0;

    // With replaceMetadata the destination gets exactly that metadata, otherwise the source's is kept.
    virtual void copyObject(const std::string& srcBucket, const std::string& srcKey,
                            const std::string& dstBucket, const std::string& dstKey,
                            const std::optional<Metadata>& replaceMetadata = std::nullopt,
                            const std::optional<std::string>& contentType = std::nullopt) const = 0;

    virtual void deleteObject(const std::string& bucket, const std::string& key) const = 0;
};

}
