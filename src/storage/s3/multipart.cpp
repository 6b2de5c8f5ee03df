#include "storage/s3/S3Controller.hpp"
#include "storage/Errors.hpp"
#include "util/s3Helpers.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <regex>

using namespace mg::util;

namespace mg::storage::s3 {

namespace {

constexpr size_t READ_CHUNK = 64 * 1024;

// Fills part from in until it holds partSize bytes or the stream ends.
void readPart(std::istream& in, std::string& part, const uintmax_t partSize, const ChunkFn& onChunk) {
    part.clear();
    char buf[READ_CHUNK];
    while (part.size() < partSize && in) {
        const auto want = std::min<uintmax_t>(sizeof(buf), partSize - part.size());
        in.read(buf, static_cast<std::streamsize>(want));
        const auto got = static_cast<size_t>(in.gcount());
        if (got == 0) break;
        if (onChunk) onChunk(buf, got);
        part.append(buf, got);
    }
    if (in.bad()) throw TransientIOError("read failed on upload source stream");
}

}

std::string S3Controller::initiateMultipartUpload(const std::string& bucket, const std::string& key) const {
    CurlEasy tmpHandle;
    const auto [canonicalPath, url] = constructPaths(tmpHandle, bucket, key, "?uploads");

    const std::string payloadHash = "UNSIGNED-PAYLOAD";
    HeaderList headers = makeSigHeaders("POST", canonicalPath, payloadHash);
    headers.add("Content-Type", "application/octet-stream");

    const HttpResponse resp = performCurl([&](CURL* h) {
        applyDefaults(h);
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, "");
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(0));
    });

    if (!resp.ok()) fail(resp, fmt::format("initiateMultipartUpload {}/{}", bucket, key));

    std::smatch m;
    static const std::regex re(R"(<UploadId>([^<]+)</UploadId>)");
    if (std::regex_search(resp.body, m, re) && m.size() > 1) return m[1].str();

    log::Registry::cloud()->error("[S3Controller] initiateMultipartUpload failed to parse UploadId from response: {}", resp.body);
    throw TransientIOError(fmt::format("No UploadId in multipart initiation response for {}/{}", bucket, key));
}

void S3Controller::uploadPart(const std::string& bucket, const std::string& key, const std::string& uploadId,
                              const int partNumber, const std::string& partData, std::string& etagOut) const {
    CurlEasy tmpHandle;
    const std::string query = "?partNumber=" + std::to_string(partNumber) + "&uploadId=" + uploadId;
    const auto [canonicalPath, url] = constructPaths(tmpHandle, bucket, key, query);

    const std::string payloadHash = sha256Hex(partData);
    HeaderList headers = makeSigHeaders("PUT", canonicalPath, payloadHash);
    headers.add("Content-Type", "application/octet-stream");

    const HttpResponse resp = performCurl([&](CURL* h) {
        applyDefaults(h);
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "PUT");
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, partData.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(partData.size()));
    });

    if (!resp.ok()) fail(resp, fmt::format("uploadPart {} of {}/{}", partNumber, bucket, key));

    if (!extractETag(resp.hdr, etagOut))
        throw TransientIOError(fmt::format("Failed to extract ETag for uploaded part {}", partNumber));
}

void S3Controller::completeMultipartUpload(const std::string& bucket, const std::string& key, const std::string& uploadId,
                                           const std::vector<std::string>& etags) const {
    if (etags.empty()) throw std::invalid_argument("No ETags provided to completeMultipartUpload");

    CurlEasy tmpHandle;
    const auto [canonicalPath, url] = constructPaths(tmpHandle, bucket, key, "?uploadId=" + uploadId);

    const auto body = composeMultiPartUploadXMLBody(etags);
    HeaderList headers = makeSigHeaders("POST", canonicalPath, sha256Hex(body));
    headers.add("Content-Type", "application/xml");

    const HttpResponse resp = performCurl([&](CURL* h) {
        applyDefaults(h);
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "POST");
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    });

    const auto context = fmt::format("completeMultipartUpload {}/{}", bucket, key);
    if (!resp.ok()) fail(resp, context);
    if (resp.embeddedError()) {
        log::Registry::cloud()->error("[S3Controller] {} failed: {}", context, resp.body);
        throw TransientIOError(context + " failed: " + resp.body);
    }
}

void S3Controller::abortMultipartUpload(const std::string& bucket, const std::string& key, const std::string& uploadId) const {
    CurlEasy tmpHandle;
    const auto [canonicalPath, url] = constructPaths(tmpHandle, bucket, key, "?uploadId=" + uploadId);

    const HeaderList headers = makeSigHeaders("DELETE", canonicalPath, sha256Hex(""));

    const HttpResponse resp = performCurl([&](CURL* h) {
        applyDefaults(h);
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "DELETE");
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    });

    if (!resp.ok()) fail(resp, fmt::format("abortMultipartUpload {}/{}", bucket, key));
}

uintmax_t S3Controller::uploadStream(const std::string& bucket, const std::string& key, std::istream& in,
                                     const ChunkFn& onChunk) const {
    std::string part;
    readPart(in, part, partSize_, onChunk);

    if (part.size() < partSize_) {
        putObject(bucket, key, part, {});
        return part.size();
    }

    const auto uploadId = initiateMultipartUpload(bucket, key);
    log::Registry::cloud()->debug("[S3Controller] Multipart upload {} started for {}/{}", uploadId, bucket, key);

    std::vector<std::string> etags;
    uintmax_t total = 0;

    try {
        while (!part.empty()) {
            std::string etag;
            uploadPart(bucket, key, uploadId, static_cast<int>(etags.size() + 1), part, etag);
            etags.push_back(std::move(etag));
            total += part.size();
            readPart(in, part, partSize_, onChunk);
        }
        completeMultipartUpload(bucket, key, uploadId, etags);
    } catch (const std::exception& e) {
        log::Registry::cloud()->error("[S3Controller] Multipart upload {} for {}/{} failed, aborting: {}",
                                      uploadId, bucket, key, e.what());
        try {
            abortMultipartUpload(bucket, key, uploadId);
        } catch (const std::exception& abortErr) {
            log::Registry::cloud()->warn("[S3Controller] Abort of upload {} failed: {}", uploadId, abortErr.what());
        }
        throw;
    }

    log::Registry::cloud()->debug("[S3Controller] Multipart upload {} complete: {} parts, {} bytes",
                                  uploadId, etags.size(), total);
    return total;
}

}
