#include "util/TempFile.hpp"
#include "crypto/util/uuid.hpp"
#include "log/Registry.hpp"

namespace mg::util {

TempFile::TempFile(const std::filesystem::path& dir, const std::string& suffix)
    : path_(dir / ("mediagate-" + crypto::util::uuid4_hex() + (suffix.empty() ? "" : "-" + suffix))) {}

TempFile::~TempFile() {
    std::error_code ec;
    const bool removed = std::filesystem::remove(path_, ec);
    if (!log::Registry::isInitialized()) return;

    if (removed)
        log::Registry::storage()->debug("[TempFile] Cleaned up temp file: {}", path_.string());
    else if (ec)
        log::Registry::storage()->warn("[TempFile] Failed to remove temp file {}: {}", path_.string(), ec.message());
}

}
