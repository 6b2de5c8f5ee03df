#pragma once

#include "s3Helpers.hpp"

#include <curl/curl.h>
#include <new>
#include <stdexcept>
#include <string>
#include <vector>

namespace mg::util {

// Owns one easy handle per request; S3 calls never share handles across threads.
class CurlEasy {
public:
    CurlEasy() : h_(curl_easy_init()) {
        if (!h_) throw std::runtime_error("curl_easy_init failed");
        curl_easy_setopt(h_, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(h_, CURLOPT_NOSIGNAL, 1L);
    }
    ~CurlEasy() { curl_easy_cleanup(h_); }

    CurlEasy(const CurlEasy&) = delete;
    CurlEasy& operator=(const CurlEasy&) = delete;

    operator CURL*() { return h_; }

private:
    CURL* h_;
};

// Request headers. Keeps the strings alive for as long as curl holds the list.
class HeaderList {
public:
    HeaderList() = default;
    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;
    HeaderList(HeaderList&& o) noexcept : lines_(std::move(o.lines_)), head_(o.head_) { o.head_ = nullptr; }
    ~HeaderList() { curl_slist_free_all(head_); }

    void add(const std::string& name, const std::string& value) { append(name + ": " + value); }

    void append(std::string line) {
        lines_.push_back(std::move(line));
        head_ = curl_slist_append(head_, lines_.back().c_str());
        if (!head_) throw std::bad_alloc();
    }

    [[nodiscard]] curl_slist* get() const { return head_; }
    [[nodiscard]] size_t size() const { return lines_.size(); }

private:
    std::vector<std::string> lines_;
    curl_slist* head_ = nullptr;
};

struct HttpResponse {
    CURLcode curl = CURLE_OK;
    long http = 0;
    std::string body;
    std::string hdr;

    [[nodiscard]] bool ok() const { return curl == CURLE_OK && http / 100 == 2; }
    [[nodiscard]] bool notFound() const { return curl == CURLE_OK && http == 404; }

    // CopyObject and CompleteMultipartUpload can fail inside a 200 response
    [[nodiscard]] bool embeddedError() const { return body.find("<Error>") != std::string::npos; }
};

// Runs one request. The body and response headers are collected into the result
// unless the setup callback installs its own write sink.
template <class SetupFn>
HttpResponse performCurl(SetupFn&& setup) {
    CurlEasy h;
    HttpResponse r;

    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeToString);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &r.body);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, writeToString);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &r.hdr);

    setup(static_cast<CURL*>(h));

    r.curl = curl_easy_perform(h);
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &r.http);
    return r;
}

}
