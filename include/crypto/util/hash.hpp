#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

struct evp_md_ctx_st;

namespace mg::crypto::hash {

// Incremental SHA-1, fed chunk by chunk while bytes are in flight.
class Sha1Stream {
public:
    Sha1Stream();
    ~Sha1Stream();

    Sha1Stream(const Sha1Stream&) = delete;
    Sha1Stream& operator=(const Sha1Stream&) = delete;

    void update(const char* data, size_t len);
    void update(std::string_view chunk) { update(chunk.data(), chunk.size()); }

    // Lowercase hex digest. The stream cannot be updated afterwards.
    [[nodiscard]] std::string finalHex();

private:
    struct CtxDeleter { void operator()(evp_md_ctx_st* ctx) const; };
    std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
    bool finalized_ = false;
};

std::string sha1(const std::filesystem::path& filepath);

}
