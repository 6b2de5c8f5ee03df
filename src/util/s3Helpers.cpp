#include "util/s3Helpers.hpp"
#include "storage/s3/Credentials.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

namespace mg::util {

namespace {

constexpr std::string_view SIGV4_ALGORITHM = "AWS4-HMAC-SHA256";

std::string_view trimmed(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

// "/bucket/key?uploadId=x" -> path and query; a bare flag such as "?uploads" becomes "uploads="
std::pair<std::string, std::string> splitCanonical(const std::string& fullPath) {
    const auto qpos = fullPath.find('?');
    if (qpos == std::string::npos) return {fullPath, ""};
    auto query = fullPath.substr(qpos + 1);
    if (query.find('=') == std::string::npos) query += '=';
    return {fullPath.substr(0, qpos), query};
}

}

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string toHex(const unsigned char* data, const size_t len) {
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) fmt::format_to(std::back_inserter(out), "{:02x}", static_cast<unsigned>(data[i]));
    return out;
}

std::string sha256Hex(const std::string_view data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return toHex(hash, sizeof(hash));
}

std::string hmacSha256(const std::string_view key, const std::string_view data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, &len))
        throw std::runtime_error("HMAC-SHA256 failed");
    return {reinterpret_cast<char*>(digest), len};
}

std::string deriveSigningKey(const std::string& secretKey, const std::string& dateStamp,
                             const std::string& region, const std::string& service) {
    auto key = hmacSha256("AWS4" + secretKey, dateStamp);
    key = hmacSha256(key, region);
    key = hmacSha256(key, service);
    return hmacSha256(key, "aws4_request");
}

std::string buildAuthorizationHeader(const storage::s3::Credentials& creds,
                                     const std::string& method,
                                     const std::string& fullPath,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payloadHash,
                                     const std::string& canonicalQuery) {
    auto [canonicalPath, query] = canonicalQuery.empty()
                                      ? splitCanonical(fullPath)
                                      : std::pair{fullPath, canonicalQuery};

    const auto amzDate = headers.at("x-amz-date");
    const auto dateStamp = amzDate.substr(0, 8);

    // std::map iterates names in sorted order
    std::string canonicalHeaders, signedHeaders;
    for (const auto& [name, value] : headers) {
        canonicalHeaders += fmt::format("{}:{}\n", name, value);
        if (!signedHeaders.empty()) signedHeaders += ';';
        signedHeaders += name;
    }

    const auto canonicalRequest = fmt::format("{}\n{}\n{}\n{}\n{}\n{}",
                                              method, canonicalPath, query, canonicalHeaders, signedHeaders, payloadHash);

    const auto scope = fmt::format("{}/{}/s3/aws4_request", dateStamp, creds.region);
    const auto stringToSign = fmt::format("{}\n{}\n{}\n{}", SIGV4_ALGORITHM, amzDate, scope, sha256Hex(canonicalRequest));

    const auto sig = hmacSha256(deriveSigningKey(creds.secretKey, dateStamp, creds.region), stringToSign);
    const auto signature = toHex(reinterpret_cast<const unsigned char*>(sig.data()), sig.size());

    return fmt::format("{} Credential={}/{}, SignedHeaders={}, Signature={}",
                       SIGV4_ALGORITHM, creds.accessKey, scope, signedHeaders, signature);
}

std::string escapeKeyPreserveSlashes(CURL* curl, const std::string& key) {
    std::string out;
    size_t start = 0;
    for (;;) {
        const auto pos = key.find('/', start);
        const auto seg = key.substr(start, pos == std::string::npos ? std::string::npos : pos - start);

        char* esc = curl_easy_escape(curl, seg.c_str(), static_cast<int>(seg.size()));
        if (!esc) throw std::runtime_error("escape failed for key: " + key);
        out += esc;
        curl_free(esc);

        if (pos == std::string::npos) return out;
        out += '/';
        start = pos + 1;
    }
}

std::string composeMultiPartUploadXMLBody(const std::vector<std::string>& etags) {
    std::string xml = "<CompleteMultipartUpload>";
    for (size_t i = 0; i < etags.size(); ++i)
        xml += fmt::format("<Part><PartNumber>{}</PartNumber><ETag>{}</ETag></Part>", i + 1, etags[i]);
    xml += "</CompleteMultipartUpload>";
    return xml;
}

size_t writeToString(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    static_cast<std::string*>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

std::unordered_map<std::string, std::string> parseResponseHeaders(const std::string& hdr) {
    std::unordered_map<std::string, std::string> out;
    size_t start = 0;
    while (start < hdr.size()) {
        auto end = hdr.find('\n', start);
        if (end == std::string::npos) end = hdr.size();
        const std::string_view line(hdr.data() + start, end - start);
        start = end + 1;

        // a new status line starts a new block after a redirect or 100-continue
        if (line.starts_with("HTTP/")) {
            out.clear();
            continue;
        }

        const auto colon = line.find(':');
        if (colon == std::string_view::npos) continue;

        std::string name(trimmed(line.substr(0, colon)));
        std::ranges::transform(name, name.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        out.insert_or_assign(std::move(name), std::string(trimmed(line.substr(colon + 1))));
    }
    return out;
}

bool extractETag(const std::string& respHdr, std::string& etagOut) {
    const auto headers = parseResponseHeaders(respHdr);
    const auto it = headers.find("etag");
    if (it == headers.end()) return false;
    etagOut = it->second;
    return !etagOut.empty();
}

}
