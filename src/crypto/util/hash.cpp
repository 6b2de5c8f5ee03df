#include "crypto/util/hash.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <openssl/evp.h>

namespace mg::crypto::hash {

void Sha1Stream::CtxDeleter::operator()(evp_md_ctx_st* ctx) const { EVP_MD_CTX_free(ctx); }

Sha1Stream::Sha1Stream() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha1(), nullptr) != 1)
        throw std::runtime_error("EVP_DigestInit_ex failed for SHA-1");
}

Sha1Stream::~Sha1Stream() = default;

void Sha1Stream::update(const char* data, const size_t len) {
    if (finalized_) throw std::logic_error("Sha1Stream updated after finalHex()");
    if (len == 0) return;
    if (EVP_DigestUpdate(ctx_.get(), data, len) != 1)
        throw std::runtime_error("EVP_DigestUpdate failed");
}

std::string Sha1Stream::finalHex() {
    if (finalized_) throw std::logic_error("Sha1Stream finalized twice");

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), digest, &len) != 1)
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    finalized_ = true;

    std::ostringstream result;
    for (unsigned int i = 0; i < len; ++i)
        result << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);

    return result.str();
}

std::string sha1(const std::filesystem::path& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file) throw std::runtime_error("Failed to open file for hashing: " + filepath.string());

    Sha1Stream state;

    char buffer[8192];
    while (file.good()) {
        file.read(buffer, sizeof(buffer));
        state.update(buffer, static_cast<size_t>(file.gcount()));
    }

    return state.finalHex();
}

}
