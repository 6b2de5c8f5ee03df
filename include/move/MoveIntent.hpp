#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <nlohmann/json_fwd.hpp>

namespace mg::move {

// Which tracked file of an entity is being relocated. Decides which field the
// commit callback writes.
enum class PathKind { Original, FullSize, Preview, Thumbnail, EncodedVideo, Sidecar, Face };

std::string_view to_string(PathKind kind);

// Throws std::invalid_argument for unknown names.
PathKind pathKindFromString(std::string_view name);

// Durable record of an in-flight relocation. At most one per (entityId, pathKind).
struct MoveIntent {
    std::string id;
    std::string entityId;
    PathKind pathKind{PathKind::Original};
    std::string oldPath;
    std::string newPath;
    std::chrono::system_clock::time_point createdAt{};
};

void to_json(nlohmann::json& j, const MoveIntent& intent);

}
