#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace mg::storage::model {

struct UploadOptions {
    bool computeChecksum = false;
};

struct UploadResult {
    std::string path;
    uintmax_t size{};
    std::optional<std::string> checksum;  // hex SHA-1 of the streamed bytes
};

void to_json(nlohmann::json& j, const UploadResult& r);

}
