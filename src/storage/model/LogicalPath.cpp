#include "storage/model/LogicalPath.hpp"
#include "storage/Errors.hpp"

#include <vector>

namespace mg::storage::model {

static std::vector<std::string_view> split(const std::string_view path) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        const auto pos = path.find('/', start);
        if (pos == std::string_view::npos) {
            parts.push_back(path.substr(start));
            break;
        }
        parts.push_back(path.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

bool isRemote(const std::string_view path) {
    if (path.empty() || path.front() == '/') return false;
    const auto parts = split(path);
    return parts.size() >= 3 && parts.front().find('.') != std::string_view::npos;
}

RemotePath parse(const std::string_view path) {
    const auto first = path.find('/');
    const auto second = first == std::string_view::npos ? first : path.find('/', first + 1);
    if (second == std::string_view::npos)
        throw MalformedPathError("Invalid remote storage path format: " + std::string(path));

    return {
        .host = std::string(path.substr(0, first)),
        .bucket = std::string(path.substr(first + 1, second - first - 1)),
        .key = std::string(path.substr(second + 1))
    };
}

std::string to_string(const RemotePath& p) {
    return p.host + "/" + p.bucket + "/" + p.key;
}

}
