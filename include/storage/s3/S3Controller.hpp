#pragma once

#include "storage/s3/Credentials.hpp"
#include "storage/s3/ObjectClient.hpp"
#include "util/curlWrappers.hpp"

#include <map>
#include <unordered_map>
#include <string>
#include <utility>
#include <vector>
#include <curl/curl.h>

namespace mg::storage::s3 {

// ObjectClient over libcurl, path-style addressing, AWS Signature V4.
class S3Controller final : public ObjectClient {
public:
    static constexpr uintmax_t MIN_PART_SIZE = 5 * 1024 * 1024; // 5 MiB

    explicit S3Controller(Credentials creds, uintmax_t partSize = MIN_PART_SIZE, long connectTimeoutSeconds = 10);

    ~S3Controller() override;

    // #########################################################################
    // ########################### OBJECT OPS ##################################
    // #########################################################################

    [[nodiscard]] ObjectBody getObject(const std::string& bucket, const std::string& key) const override;
    std::optional<std::string> streamObject(const std::string& bucket, const std::string& key,
                                            const ChunkFn& onChunk) const override;
    void getObjectToFile(const std::string& bucket, const std::string& key,
                         const std::filesystem::path& dest) const override;
    void putObject(const std::string& bucket, const std::string& key, const std::string& body,
                   const Metadata& metadata) const override;
    uintmax_t uploadStream(const std::string& bucket, const std::string& key, std::istream& in,
                           const ChunkFn& onChunk) const override;
    [[nodiscard]] std::optional<ObjectHead> headObject(const std::string& bucket, const std::string& key) const override;
    void copyObject(const std::string& srcBucket, const std::string& srcKey,
                    const std::string& dstBucket, const std::string& dstKey,
                    const std::optional<Metadata>& replaceMetadata,
                    const std::optional<std::string>& contentType) const override;
    void deleteObject(const std::string& bucket, const std::string& key) const override;

    // #########################################################################
    // ######################## MULTIPART UPLOADS ##############################
    // #########################################################################

    [[nodiscard]] std::string initiateMultipartUpload(const std::string& bucket, const std::string& key) const;

    void uploadPart(const std::string& bucket, const std::string& key, const std::string& uploadId,
                    int partNumber, const std::string& partData, std::string& etagOut) const;

    void completeMultipartUpload(const std::string& bucket, const std::string& key, const std::string& uploadId,
                                 const std::vector<std::string>& etags) const;

    void abortMultipartUpload(const std::string& bucket, const std::string& key, const std::string& uploadId) const;

    [[nodiscard]] const Credentials& credentials() const { return creds_; }

private:
    Credentials creds_;
    uintmax_t partSize_;
    long connectTimeout_;

    [[nodiscard]] std::map<std::string, std::string> buildHeaderMap(const std::string& payloadHash) const;

    std::pair<std::string, std::string> constructPaths(CURL* curl, const std::string& bucket, const std::string& key,
                                                       const std::string& query = "") const;

    // amzHeaders are lowercase x-amz-* headers that must be covered by the signature.
    [[nodiscard]] util::HeaderList makeSigHeaders(const std::string& method,
                                             const std::string& canonical,
                                             const std::string& payloadHash,
                                             const std::map<std::string, std::string>& amzHeaders = {}) const;

    void applyDefaults(CURL* h) const;

    [[noreturn]] void fail(const util::HttpResponse& resp, const std::string& context) const;
};

// Throws the StorageError matching a failed response; context names the request.
[[noreturn]] void throwForResponse(const util::HttpResponse& resp, const std::string& context);

// HEAD response headers (lowercase names) to ObjectHead. A malformed length is a TransientIOError.
[[nodiscard]] ObjectHead headFromResponseHeaders(const std::unordered_map<std::string, std::string>& headers,
                                                 const std::string& context);

}
