#pragma once

#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <curl/curl.h>

namespace mg::storage::s3 { struct Credentials; }

namespace mg::util {

void ensureCurlGlobalInit();

std::string toHex(const unsigned char* data, size_t len);
std::string sha256Hex(std::string_view data);
std::string hmacSha256(std::string_view key, std::string_view data);

// AWS4 signing key for one day, region and service
std::string deriveSigningKey(const std::string& secretKey, const std::string& dateStamp,
                             const std::string& region, const std::string& service = "s3");

// SigV4 Authorization header value. `headers` must hold lowercase names including host and
// x-amz-date; every entry is signed. A query embedded in `fullPath` is used when
// `canonicalQuery` is empty.
std::string buildAuthorizationHeader(const storage::s3::Credentials& creds,
                                     const std::string& method, const std::string& fullPath,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payloadHash, const std::string& canonicalQuery = "");

std::string escapeKeyPreserveSlashes(CURL* curl, const std::string& key);
std::string composeMultiPartUploadXMLBody(const std::vector<std::string>& etags);

size_t writeToString(const char* ptr, size_t size, size_t nmemb, void* userdata);

// Response header block -> lowercase name -> value. For redirects only the
// last header block is kept.
std::unordered_map<std::string, std::string> parseResponseHeaders(const std::string& hdr);
[[nodiscard]] bool extractETag(const std::string& respHdr, std::string& etagOut);

}
