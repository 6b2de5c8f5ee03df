#pragma once

#include <string>
#include <string_view>

namespace mg::storage::model {

// <host>/<bucket>/<key...>, no scheme prefix
struct RemotePath {
    std::string host, bucket, key;
};

// Local paths start with '/'. Anything else with at least three slash-separated
// segments whose first segment looks like a hostname is remote; everything else
// is treated as a local relative path.
[[nodiscard]] bool isRemote(std::string_view path);
[[nodiscard]] inline bool isLocal(const std::string_view path) { return !isRemote(path); }

// Throws MalformedPathError when the path has fewer than three segments.
[[nodiscard]] RemotePath parse(std::string_view path);

[[nodiscard]] std::string to_string(const RemotePath& p);

}
