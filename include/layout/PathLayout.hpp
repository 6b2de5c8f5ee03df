#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace mg::layout {

// Root for every managed file: a local directory ("/data") or a remote
// "host/bucket[/prefix]".
struct LayoutConfig {
    std::string mediaLocation;
};

enum class StorageFolder { Library, Upload, Profile, Thumbnails, EncodedVideo, Backups };
enum class ImageType { FullSize, Preview, Thumbnail };
enum class ImageFormat { Jpeg, Webp };

std::string_view to_string(StorageFolder folder);
std::string_view to_string(ImageType type);
std::string_view to_string(ImageFormat format);

// Anything with an id that belongs to a user: assets, people.
struct OwnedEntity {
    std::string id;
    std::string ownerId;
};

// Joins a relative path onto the media root. Remote roots become the
// host/bucket prefix of an object key.
[[nodiscard]] std::string withRoot(const LayoutConfig& cfg, std::string_view relative);

[[nodiscard]] std::string baseFolder(const LayoutConfig& cfg, StorageFolder folder);
[[nodiscard]] std::string folderLocation(const LayoutConfig& cfg, StorageFolder folder, std::string_view ownerId);
[[nodiscard]] std::string libraryFolder(const LayoutConfig& cfg, const std::optional<std::string>& storageLabel,
                                        std::string_view userId);

// <root>/<folder>/<owner>/<filename[0,2)>/<filename[2,4)>
[[nodiscard]] std::string nestedFolder(const LayoutConfig& cfg, StorageFolder folder, std::string_view ownerId,
                                       std::string_view filename);
[[nodiscard]] std::string nestedPath(const LayoutConfig& cfg, StorageFolder folder, std::string_view ownerId,
                                     std::string_view filename);

[[nodiscard]] std::string imagePath(const LayoutConfig& cfg, const OwnedEntity& asset, ImageType type, ImageFormat format);
[[nodiscard]] std::string encodedVideoPath(const LayoutConfig& cfg, const OwnedEntity& asset);
[[nodiscard]] std::string androidMotionPath(const LayoutConfig& cfg, const OwnedEntity& asset, std::string_view uuid);
[[nodiscard]] std::string personThumbnailPath(const LayoutConfig& cfg, const OwnedEntity& person);

[[nodiscard]] bool isAndroidMotionPath(const LayoutConfig& cfg, std::string_view path);

// Local paths under the media root, and every remote path.
[[nodiscard]] bool isManagedPath(const LayoutConfig& cfg, std::string_view path);

// <dir>/<uuid>.tmp
[[nodiscard]] std::string tempPathInDir(std::string_view dir);

}
