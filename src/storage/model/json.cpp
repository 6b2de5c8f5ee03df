#include "storage/model/FileStat.hpp"
#include "storage/model/UploadResult.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

using namespace mg::util;

namespace mg::storage::model {

void to_json(nlohmann::json& j, const FileStat& s) {
    j = {
        {"size", s.size},
        {"mtime", toIsoString(s.mtime)},
        {"atime", toIsoString(s.atime)},
        {"birthtime", toIsoString(s.birthtime)},
        {"is_directory", s.isDirectory}
    };
}

void to_json(nlohmann::json& j, const DiskUsage& u) {
    j = {
        {"available", u.available},
        {"free", u.free},
        {"total", u.total}
    };
}

void to_json(nlohmann::json& j, const UploadResult& r) {
    j = {
        {"path", r.path},
        {"size", r.size}
    };
    if (r.checksum) j["checksum"] = *r.checksum;
}

}
