#include "layout/PathLayout.hpp"
#include "storage/model/LogicalPath.hpp"
#include "crypto/util/uuid.hpp"

#include <filesystem>
#include <initializer_list>
#include <fmt/format.h>

namespace mg::layout {

namespace {

bool isRemoteRoot(const LayoutConfig& cfg) {
    return !cfg.mediaLocation.empty() && cfg.mediaLocation.front() != '/';
}

// Like path.join: empty segments vanish.
std::string joinSegments(std::initializer_list<std::string_view> segments) {
    std::string out;
    for (const auto seg : segments) {
        if (seg.empty()) continue;
        if (!out.empty() && out.back() != '/') out += '/';
        out += seg;
    }
    return out;
}

}

std::string_view to_string(const StorageFolder folder) {
    switch (folder) {
        case StorageFolder::Library: return "library";
        case StorageFolder::Upload: return "upload";
        case StorageFolder::Profile: return "profile";
        case StorageFolder::Thumbnails: return "thumbs";
        case StorageFolder::EncodedVideo: return "encoded-video";
        case StorageFolder::Backups: return "backups";
    }
    return "unknown";
}

std::string_view to_string(const ImageType type) {
    switch (type) {
        case ImageType::FullSize: return "fullsize";
        case ImageType::Preview: return "preview";
        case ImageType::Thumbnail: return "thumbnail";
    }
    return "unknown";
}

std::string_view to_string(const ImageFormat format) {
    switch (format) {
        case ImageFormat::Jpeg: return "jpeg";
        case ImageFormat::Webp: return "webp";
    }
    return "unknown";
}

std::string withRoot(const LayoutConfig& cfg, std::string_view relative) {
    while (!relative.empty() && relative.front() == '/') relative.remove_prefix(1);

    if (isRemoteRoot(cfg)) {
        std::string_view root = cfg.mediaLocation;
        while (!root.empty() && root.back() == '/') root.remove_suffix(1);
        return joinSegments({root, relative});
    }

    return (std::filesystem::path(cfg.mediaLocation) / relative).lexically_normal().string();
}

std::string baseFolder(const LayoutConfig& cfg, const StorageFolder folder) {
    return withRoot(cfg, to_string(folder));
}

std::string folderLocation(const LayoutConfig& cfg, const StorageFolder folder, const std::string_view ownerId) {
    return withRoot(cfg, joinSegments({to_string(folder), ownerId}));
}

std::string libraryFolder(const LayoutConfig& cfg, const std::optional<std::string>& storageLabel,
                          const std::string_view userId) {
    const std::string_view owner = storageLabel && !storageLabel->empty() ? std::string_view(*storageLabel) : userId;
    return folderLocation(cfg, StorageFolder::Library, owner);
}

std::string nestedFolder(const LayoutConfig& cfg, const StorageFolder folder, const std::string_view ownerId,
                         const std::string_view filename) {
    return withRoot(cfg, joinSegments({to_string(folder), ownerId, filename.substr(0, 2),
                                       filename.size() > 2 ? filename.substr(2, 2) : std::string_view{}}));
}

std::string nestedPath(const LayoutConfig& cfg, const StorageFolder folder, const std::string_view ownerId,
                       const std::string_view filename) {
    return joinSegments({nestedFolder(cfg, folder, ownerId, filename), filename});
}

std::string imagePath(const LayoutConfig& cfg, const OwnedEntity& asset, const ImageType type, const ImageFormat format) {
    return nestedPath(cfg, StorageFolder::Thumbnails, asset.ownerId,
                      fmt::format("{}-{}.{}", asset.id, to_string(type), to_string(format)));
}

std::string encodedVideoPath(const LayoutConfig& cfg, const OwnedEntity& asset) {
    return nestedPath(cfg, StorageFolder::EncodedVideo, asset.ownerId, asset.id + ".mp4");
}

std::string androidMotionPath(const LayoutConfig& cfg, const OwnedEntity& asset, const std::string_view uuid) {
    return nestedPath(cfg, StorageFolder::EncodedVideo, asset.ownerId, fmt::format("{}-MP.mp4", uuid));
}

std::string personThumbnailPath(const LayoutConfig& cfg, const OwnedEntity& person) {
    return nestedPath(cfg, StorageFolder::Thumbnails, person.ownerId, person.id + ".jpeg");
}

bool isAndroidMotionPath(const LayoutConfig& cfg, const std::string_view path) {
    if (path.empty() || path.front() != '/')
        return path.find(fmt::format("/{}/", to_string(StorageFolder::EncodedVideo))) != std::string_view::npos;
    return path.starts_with(baseFolder(cfg, StorageFolder::EncodedVideo));
}

bool isManagedPath(const LayoutConfig& cfg, const std::string_view path) {
    if (path.empty() || path.front() != '/') return storage::model::isRemote(path);

    auto resolved = std::filesystem::path(path).lexically_normal().string();
    auto root = std::filesystem::path(cfg.mediaLocation).lexically_normal().string();
    if (!resolved.ends_with('/')) resolved += '/';
    if (!root.ends_with('/')) root += '/';
    return resolved.starts_with(root);
}

std::string tempPathInDir(const std::string_view dir) {
    return (std::filesystem::path(dir) / (crypto::util::uuid4_hex() + ".tmp")).string();
}

}
