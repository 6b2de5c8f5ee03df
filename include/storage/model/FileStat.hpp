#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>

namespace mg::storage::model {

using Clock = std::chrono::system_clock;

// Uniform view of a file's metadata. For remote objects mtime/atime come from the
// last-modified / last-accessed custom metadata when present, else from the
// store's Last-Modified header.
struct FileStat {
    uintmax_t size{};
    Clock::time_point mtime{}, atime{}, birthtime{};
    bool isDirectory{false};
};

struct DiskUsage {
    uintmax_t available{}, free{}, total{};
};

void to_json(nlohmann::json& j, const FileStat& s);
void to_json(nlohmann::json& j, const DiskUsage& u);

}
