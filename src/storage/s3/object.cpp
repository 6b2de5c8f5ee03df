#include "storage/s3/S3Controller.hpp"
#include "storage/Errors.hpp"
#include "util/s3Helpers.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <exception>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <stdexcept>

using namespace mg::util;

namespace mg::storage::s3 {

namespace {

constexpr std::string_view META_PREFIX = "x-amz-meta-";

// Body sink for streamed GETs. Only a 2xx body reaches the caller; anything else is
// collected for the error report.
struct StreamSink {
    CURL* handle = nullptr;
    const ChunkFn* onChunk = nullptr;
    std::string errorBody;
    std::exception_ptr error;
};

size_t writeToSink(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* sink = static_cast<StreamSink*>(userdata);
    const size_t n = size * nmemb;

    long status = 0;
    curl_easy_getinfo(sink->handle, CURLINFO_RESPONSE_CODE, &status);
    if (status / 100 != 2) {
        sink->errorBody.append(ptr, n);
        return n;
    }

    try {
        if (*sink->onChunk) (*sink->onChunk)(ptr, n);
    } catch (...) {
        // rethrown once curl_easy_perform returns; a short count aborts the transfer
        sink->error = std::current_exception();
        return 0;
    }
    return n;
}

std::optional<std::string> headerValue(const std::unordered_map<std::string, std::string>& hdrs, const std::string& name) {
    if (const auto it = hdrs.find(name); it != hdrs.end() && !it->second.empty()) return it->second;
    return std::nullopt;
}

}

ObjectBody S3Controller::getObject(const std::string& bucket, const std::string& key) const {
    CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(tmpHandle, bucket, key);

    const HeaderList hdrs = makeSigHeaders("GET", canonical, "UNSIGNED-PAYLOAD");

    HttpResponse resp = performCurl([&](CURL* h) {
        applyDefaults(h);
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
    });

    if (!resp.ok()) fail(resp, fmt::format("getObject {}/{}", bucket, key));

    const auto headers = parseResponseHeaders(resp.hdr);
    return {.data = std::move(resp.body), .contentType = headerValue(headers, "content-type")};
}

std::optional<std::string> S3Controller::streamObject(const std::string& bucket, const std::string& key,
                                                      const ChunkFn& onChunk) const {
    CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(tmpHandle, bucket, key);

    const HeaderList hdrs = makeSigHeaders("GET", canonical, "UNSIGNED-PAYLOAD");

    StreamSink sink{.onChunk = &onChunk};
    HttpResponse resp = performCurl([&](CURL* h) {
        applyDefaults(h);
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        sink.handle = h;
        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeToSink);
        curl_easy_setopt(h, CURLOPT_WRITEDATA, &sink);
    });

    if (sink.error) std::rethrow_exception(sink.error);
    if (!resp.ok()) {
        resp.body = std::move(sink.errorBody);
        fail(resp, fmt::format("getObject {}/{}", bucket, key));
    }

    return headerValue(parseResponseHeaders(resp.hdr), "content-type");
}

void S3Controller::getObjectToFile(const std::string& bucket, const std::string& key,
                                   const std::filesystem::path& dest) const {
    std::ofstream out(dest, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) throwErrno(errno ? errno : EIO, "open " + dest.string());

    try {
        (void)streamObject(bucket, key, [&](const char* data, const size_t len) {
            out.write(data, static_cast<std::streamsize>(len));
            if (!out) throw TransientIOError("write failed for " + dest.string());
        });
        out.close();
        if (out.fail()) throw TransientIOError("write failed for " + dest.string());
    } catch (const std::exception&) {
        out.close();
        std::error_code ec;
        std::filesystem::remove(dest, ec);
        throw;
    }

    log::Registry::cloud()->debug("[S3Controller] Downloaded {}/{} to {}", bucket, key, dest.string());
}

void S3Controller::putObject(const std::string& bucket, const std::string& key, const std::string& body,
                             const Metadata& metadata) const {
    CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(tmpHandle, bucket, key);

    std::map<std::string, std::string> amz;
    for (const auto& [k, v] : metadata) amz.emplace(std::string(META_PREFIX) + k, v);

    const std::string payloadHash = sha256Hex(body);
    HeaderList hdrs = makeSigHeaders("PUT", canonical, payloadHash, amz);
    hdrs.add("Content-Type", "application/octet-stream");

    const HttpResponse resp = performCurl([&](CURL* h) {
        applyDefaults(h);
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "PUT");
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    });

    if (!resp.ok()) fail(resp, fmt::format("putObject {}/{}", bucket, key));

    log::Registry::cloud()->debug("[S3Controller] Uploaded {}/{} ({} bytes)", bucket, key, body.size());
}

std::optional<ObjectHead> S3Controller::headObject(const std::string& bucket, const std::string& key) const {
    CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(tmpHandle, bucket, key);

    const HeaderList hdrs = makeSigHeaders("HEAD", canonical, "UNSIGNED-PAYLOAD");

    const HttpResponse resp = performCurl([&](CURL* h) {
        applyDefaults(h);
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
    });

    if (resp.notFound()) return std::nullopt;
    if (!resp.ok()) fail(resp, fmt::format("headObject {}/{}", bucket, key));

    return headFromResponseHeaders(parseResponseHeaders(resp.hdr), fmt::format("headObject {}/{}", bucket, key));
}

ObjectHead headFromResponseHeaders(const std::unordered_map<std::string, std::string>& headers, const std::string& context) {
    ObjectHead head;
    if (const auto len = headerValue(headers, "content-length")) {
        try {
            size_t consumed = 0;
            head.contentLength = std::stoull(*len, &consumed);
            if (consumed != len->size()) throw std::invalid_argument(*len);
        } catch (const std::logic_error&) {
            throw TransientIOError(fmt::format("{}: malformed Content-Length '{}'", context, *len));
        }
    }
    if (const auto lm = headerValue(headers, "last-modified")) head.lastModified = parseHttpDate(*lm);
    head.contentType = headerValue(headers, "content-type");

    for (const auto& [name, value] : headers)
        if (name.starts_with(META_PREFIX)) head.metadata.emplace(name.substr(META_PREFIX.size()), value);

    return head;
}

void S3Controller::copyObject(const std::string& srcBucket, const std::string& srcKey,
                              const std::string& dstBucket, const std::string& dstKey,
                              const std::optional<Metadata>& replaceMetadata,
                              const std::optional<std::string>& contentType) const {
    CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(tmpHandle, dstBucket, dstKey);

    std::map<std::string, std::string> amz{
        {"x-amz-copy-source", "/" + srcBucket + "/" + escapeKeyPreserveSlashes(tmpHandle, srcKey)},
        {"x-amz-metadata-directive", replaceMetadata ? "REPLACE" : "COPY"}
    };
    if (replaceMetadata)
        for (const auto& [k, v] : *replaceMetadata) amz.emplace(std::string(META_PREFIX) + k, v);

    const std::string payloadHash = sha256Hex("");
    HeaderList hdrs = makeSigHeaders("PUT", canonical, payloadHash, amz);
    // curl would otherwise send a form content type, which REPLACE stores on the object
    hdrs.add("Content-Type", contentType.value_or("application/octet-stream"));

    const HttpResponse resp = performCurl([&](CURL* h) {
        applyDefaults(h);
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "PUT");
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, "");
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(0));
    });

    const auto context = fmt::format("copyObject {}/{} -> {}/{}", srcBucket, srcKey, dstBucket, dstKey);
    if (!resp.ok()) fail(resp, context);

    if (resp.embeddedError()) {
        log::Registry::cloud()->error("[S3Controller] {} failed: {}", context, resp.body);
        throw TransientIOError(context + " failed: " + resp.body);
    }

    log::Registry::cloud()->debug("[S3Controller] {}", context);
}

}
