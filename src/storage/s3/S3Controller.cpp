#include "storage/s3/S3Controller.hpp"
#include "storage/Errors.hpp"
#include "util/s3Helpers.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <utility>

using namespace mg::util;

namespace mg::storage::s3 {

S3Controller::S3Controller(Credentials creds, const uintmax_t partSize, const long connectTimeoutSeconds)
    : creds_(std::move(creds)), partSize_(std::max(partSize, MIN_PART_SIZE)), connectTimeout_(connectTimeoutSeconds) {
    if (creds_.accessKey.empty() || creds_.secretKey.empty())
        throw ConfigurationError("S3Controller requires an access key pair for " + creds_.endpoint);
    ensureCurlGlobalInit();
}

S3Controller::~S3Controller() = default;

void S3Controller::deleteObject(const std::string& bucket, const std::string& key) const {
    CurlEasy tmpHandle;
    const auto [canonical, url] = constructPaths(tmpHandle, bucket, key);

    const std::string payloadHash = sha256Hex("");
    const HeaderList hdrs = makeSigHeaders("DELETE", canonical, payloadHash);

    const HttpResponse resp = performCurl([&](CURL* h) {
        applyDefaults(h);
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "DELETE");
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
    });

    if (!resp.ok()) fail(resp, fmt::format("deleteObject {}/{}", bucket, key));

    log::Registry::cloud()->debug("[S3Controller] Deleted {}/{}", bucket, key);
}

std::pair<std::string, std::string> S3Controller::constructPaths(CURL* curl, const std::string& bucket,
                                                                 const std::string& key, const std::string& query) const {
    const auto escapedKey = escapeKeyPreserveSlashes(curl, key);
    const auto canonicalPath = "/" + bucket + "/" + escapedKey + query;
    const auto url = creds_.endpoint + canonicalPath;
    return {canonicalPath, url};
}

std::map<std::string, std::string> S3Controller::buildHeaderMap(const std::string& payloadHash) const {
    return {
        {"host", creds_.endpoint.substr(creds_.endpoint.find("//") + 2)},
        {"x-amz-content-sha256", payloadHash},
        {"x-amz-date", getCurrentTimestamp()}
    };
}

HeaderList S3Controller::makeSigHeaders(const std::string& method,
                                   const std::string& canonical,
                                   const std::string& payloadHash,
                                   const std::map<std::string, std::string>& amzHeaders) const {
    auto base = buildHeaderMap(payloadHash);
    base.insert(amzHeaders.begin(), amzHeaders.end());
    const auto auth = buildAuthorizationHeader(creds_, method, canonical, base, payloadHash);

    HeaderList out;
    out.add("Authorization", auth);
    for (const auto& [k, v] : base)
        if (k != "host") out.add(k, v);
    return out;
}

void S3Controller::applyDefaults(CURL* h) const {
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, connectTimeout_);
}

void S3Controller::fail(const HttpResponse& resp, const std::string& context) const {
    throwForResponse(resp, context);
}

void throwForResponse(const HttpResponse& resp, const std::string& context) {
    log::Registry::cloud()->error("[S3Controller] {} failed: CURL={} HTTP={} Response:\n{}",
                                  context, static_cast<int>(resp.curl), resp.http, resp.body);

    // the status decides even when curl also reports an error for it
    if (resp.http == 404)
        throw NotFoundError(fmt::format("{} failed: object not found", context));
    if (resp.curl != CURLE_OK)
        throw TransientIOError(fmt::format("{} failed: {}", context, curl_easy_strerror(resp.curl)));
    throw TransientIOError(fmt::format("{} failed (HTTP {}): {}", context, resp.http, resp.body));
}

}
