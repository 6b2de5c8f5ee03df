#include "move/MoveIntent.hpp"
#include "util/timestamp.hpp"

#include <array>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <utility>

namespace mg::move {

namespace {

constexpr std::array<std::pair<PathKind, std::string_view>, 7> KIND_NAMES{{
    {PathKind::Original, "original"},
    {PathKind::FullSize, "fullsize"},
    {PathKind::Preview, "preview"},
    {PathKind::Thumbnail, "thumbnail"},
    {PathKind::EncodedVideo, "encoded_video"},
    {PathKind::Sidecar, "sidecar"},
    {PathKind::Face, "face"},
}};

}

std::string_view to_string(const PathKind kind) {
    for (const auto& [k, name] : KIND_NAMES)
        if (k == kind) return name;
    return "unknown";
}

PathKind pathKindFromString(const std::string_view name) {
    for (const auto& [k, n] : KIND_NAMES)
        if (n == name) return k;
    throw std::invalid_argument("Unknown path kind: " + std::string(name));
}

void to_json(nlohmann::json& j, const MoveIntent& intent) {
    j = {
        {"id", intent.id},
        {"entity_id", intent.entityId},
        {"path_kind", std::string(to_string(intent.pathKind))},
        {"old_path", intent.oldPath},
        {"new_path", intent.newPath},
        {"created_at", util::toIsoString(intent.createdAt)}
    };
}

}
