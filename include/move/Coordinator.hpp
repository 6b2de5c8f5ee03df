#pragma once

#include "layout/PathLayout.hpp"
#include "move/IntentStore.hpp"
#include "move/MoveIntent.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace mg::storage { class Gateway; }

namespace mg::move {

enum class MoveState { Idle, IntentRecorded, Relocating, Verifying, Committed, Cleaned, Aborted };

std::string_view to_string(MoveState state);

struct AssetInfo {
    uintmax_t sizeInBytes{};
    std::optional<std::string> checksum;  // hex SHA-1, compared only when known
};

struct MoveRequest {
    std::string entityId;
    PathKind pathKind{PathKind::Original};
    std::optional<std::string> oldPath;
    std::string newPath;
    std::optional<AssetInfo> assetInfo;
};

struct MoveResult {
    MoveState state{MoveState::Idle};
    std::string reason;  // set for Aborted, and for Committed when the intent could not be removed

    // The owning entity now points at the new path, or never needed to move.
    [[nodiscard]] bool settled() const {
        return state == MoveState::Idle || state == MoveState::Committed || state == MoveState::Cleaned;
    }
};

// Persists the new path into the owning entity. Exceptions propagate out of moveFile.
using CommitFn = std::function<void(PathKind kind, const std::string& entityId, const std::string& newPath)>;

// Hex SHA-1 of the file at a logical path.
using HashFn = std::function<std::string(const std::string& path)>;

// Crash-safe relocation of tracked files. Callers serialize requests per
// (entityId, pathKind); the intent record is the only guard.
class Coordinator {
public:
    Coordinator(std::shared_ptr<storage::Gateway> gateway,
                std::shared_ptr<IntentStore> intents,
                CommitFn commit,
                layout::LayoutConfig layout,
                bool hashVerificationEnabled,
                HashFn hash = {});

    MoveResult moveFile(const MoveRequest& req);

    MoveResult moveAssetImage(const layout::OwnedEntity& asset, const std::optional<std::string>& currentPath,
                              layout::ImageType type, layout::ImageFormat format);
    MoveResult moveAssetVideo(const layout::OwnedEntity& asset, const std::optional<std::string>& currentPath);
    MoveResult movePersonFile(const layout::OwnedEntity& person, const std::optional<std::string>& currentPath);

    void removeEmptyDirs(layout::StorageFolder folder) const;

private:
    std::shared_ptr<storage::Gateway> gateway_;
    std::shared_ptr<IntentStore> intents_;
    CommitFn commit_;
    layout::LayoutConfig layout_;
    bool hashVerificationEnabled_;
    HashFn hash_;

    // Size against assetInfo (else the source's size) and, when enabled, checksum against assetInfo.
    [[nodiscard]] bool verify(const std::optional<std::string>& source, const std::string& dest,
                              const std::optional<AssetInfo>& assetInfo) const;

    void copyTimestamps(const std::string& from, const std::string& to) const;

    MoveResult finish(const MoveIntent& intent, const MoveRequest& req);

    static MoveResult abort(std::string reason);
};

}
