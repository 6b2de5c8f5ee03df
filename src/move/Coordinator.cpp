#include "move/Coordinator.hpp"
#include "storage/Errors.hpp"
#include "storage/Gateway.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

using namespace mg::storage;

namespace mg::move {

namespace {

std::string lowerHex(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

PathKind toPathKind(const layout::ImageType type) {
    switch (type) {
        case layout::ImageType::FullSize: return PathKind::FullSize;
        case layout::ImageType::Preview: return PathKind::Preview;
        case layout::ImageType::Thumbnail: return PathKind::Thumbnail;
    }
    throw std::invalid_argument("Unknown image type");
}

}

std::string_view to_string(const MoveState state) {
    switch (state) {
        case MoveState::Idle: return "idle";
        case MoveState::IntentRecorded: return "intent_recorded";
        case MoveState::Relocating: return "relocating";
        case MoveState::Verifying: return "verifying";
        case MoveState::Committed: return "committed";
        case MoveState::Cleaned: return "cleaned";
        case MoveState::Aborted: return "aborted";
    }
    return "unknown";
}

Coordinator::Coordinator(std::shared_ptr<Gateway> gateway,
                         std::shared_ptr<IntentStore> intents,
                         CommitFn commit,
                         layout::LayoutConfig layout,
                         const bool hashVerificationEnabled,
                         HashFn hash)
    : gateway_(std::move(gateway)),
      intents_(std::move(intents)),
      commit_(std::move(commit)),
      layout_(std::move(layout)),
      hashVerificationEnabled_(hashVerificationEnabled),
      hash_(std::move(hash)) {
    if (!gateway_ || !intents_ || !commit_)
        throw std::invalid_argument("Coordinator requires a gateway, an intent store and a commit callback");
    if (!hash_) hash_ = [gw = gateway_](const std::string& path) { return gw->hash(path); };
}

MoveResult Coordinator::abort(std::string reason) {
    return {MoveState::Aborted, std::move(reason)};
}

MoveResult Coordinator::moveFile(const MoveRequest& req) {
    if (!req.oldPath || *req.oldPath == req.newPath) return {};

    gateway_->ensureFolders(req.newPath);

    auto existing = intents_->getByEntity(req.entityId, req.pathKind);
    MoveIntent intent;

    if (existing) {
        log::Registry::move()->info("[Coordinator] Attempting to finish incomplete move: {} => {}",
                                    existing->oldPath, existing->newPath);

        const bool oldExists = gateway_->exists(existing->oldPath);
        const bool newExists = gateway_->exists(existing->newPath);

        if (!oldExists && !newExists) {
            log::Registry::move()->critical(
                "[Coordinator] Unable to complete move of {} ({}): file exists at neither {} nor {}",
                req.entityId, to_string(req.pathKind), existing->oldPath, existing->newPath);
            return abort("file does not exist at either location");
        }

        // with both present the old copy is authoritative; new may be a half-finished copy
        const auto& actualPath = oldExists ? existing->oldPath : existing->newPath;
        log::Registry::move()->info("[Coordinator] Found file at {} location", oldExists ? "old" : "new");

        if (!oldExists && !verify(std::nullopt, existing->newPath, req.assetInfo)) {
            log::Registry::move()->critical(
                "[Coordinator] Skipping move as file verification failed, old file is missing and new file {} "
                "is different to what was expected", existing->newPath);
            return abort("file at new location failed verification and old file is missing");
        }

        intent = intents_->update(existing->id, actualPath, req.newPath);
    } else {
        intent = intents_->create(req.entityId, req.pathKind, *req.oldPath, req.newPath);
    }

    log::Registry::move()->debug("[Coordinator] {} for {} ({}): {} => {}", to_string(MoveState::IntentRecorded),
                                 req.entityId, to_string(req.pathKind), intent.oldPath, intent.newPath);

    if (req.pathKind == PathKind::Original && !req.assetInfo) {
        log::Registry::move()->warn("[Coordinator] Unable to complete move. Missing asset info for {}", req.entityId);
        return abort("missing asset info for original file");
    }

    return finish(intent, req);
}

MoveResult Coordinator::finish(const MoveIntent& intent, const MoveRequest& req) {
    const auto& source = intent.oldPath;
    const auto& dest = req.newPath;

    if (source != dest) {
        try {
            log::Registry::move()->debug("[Coordinator] Attempting to rename file: {} => {}", source, dest);
            gateway_->rename(source, dest);
        } catch (const CrossDeviceError&) {
            log::Registry::move()->debug("[Coordinator] Unable to rename file. Falling back to copy, verify and delete");

            try {
                gateway_->copy(source, dest);
            } catch (const StorageError& e) {
                log::Registry::move()->warn("[Coordinator] Unable to complete move. Copy {} => {} failed: {}",
                                            source, dest, e.what());
                try {
                    gateway_->unlink(dest);
                } catch (const StorageError& cleanup) {
                    log::Registry::move()->warn("[Coordinator] Could not remove partial copy {}: {}", dest, cleanup.what());
                }
                return abort(std::string("copy failed: ") + e.what());
            }

            if (!verify(source, dest, req.assetInfo)) {
                log::Registry::move()->warn("[Coordinator] Skipping move due to file verification failure");
                try {
                    gateway_->unlink(dest);
                } catch (const StorageError& cleanup) {
                    log::Registry::move()->error("[Coordinator] Could not remove unverified copy {}: {}", dest, cleanup.what());
                }
                return abort("copied file failed verification");
            }

            copyTimestamps(source, dest);

            try {
                gateway_->unlink(source);
            } catch (const StorageError& e) {
                log::Registry::move()->warn(
                    "[Coordinator] Unable to delete old file, it will now no longer be tracked: {}", e.what());
            }
        } catch (const StorageError& e) {
            log::Registry::move()->warn("[Coordinator] Unable to complete move. Error renaming file ({}): {}",
                                        storage::to_string(e.kind()), e.what());
            return abort(std::string("rename failed: ") + e.what());
        }
    }

    commit_(req.pathKind, req.entityId, dest);

    try {
        intents_->remove(intent.id);
    } catch (const std::exception& e) {
        log::Registry::move()->warn(
            "[Coordinator] Move of {} committed but intent {} could not be removed, it will be reconciled later: {}",
            req.entityId, intent.id, e.what());
        return {MoveState::Committed, std::string("intent not removed: ") + e.what()};
    }

    log::Registry::move()->info("[Coordinator] Moved {} ({}) to {}", req.entityId, to_string(req.pathKind), dest);
    return {MoveState::Cleaned, {}};
}

bool Coordinator::verify(const std::optional<std::string>& source, const std::string& dest,
                         const std::optional<AssetInfo>& assetInfo) const {
    try {
        std::optional<uintmax_t> expectedSize;
        if (assetInfo) expectedSize = assetInfo->sizeInBytes;
        else if (source) expectedSize = gateway_->stat(*source).size;

        const auto actualSize = gateway_->stat(dest).size;
        if (!expectedSize) {
            log::Registry::move()->warn("[Coordinator] No expected size known for {}, accepting {} bytes", dest, actualSize);
        } else {
            log::Registry::move()->debug("[Coordinator] File size check: {} === {}", actualSize, *expectedSize);
            if (actualSize != *expectedSize) {
                log::Registry::move()->warn("[Coordinator] Unable to complete move. File size mismatch: {} !== {}",
                                            actualSize, *expectedSize);
                return false;
            }
        }

        if (hashVerificationEnabled_ && assetInfo && assetInfo->checksum && !assetInfo->checksum->empty()) {
            const auto actual = lowerHex(hash_(dest));
            const auto expected = lowerHex(*assetInfo->checksum);
            if (actual != expected) {
                log::Registry::move()->warn("[Coordinator] Unable to complete move. File checksum mismatch: {} !== {}",
                                            actual, expected);
                return false;
            }
            log::Registry::move()->debug("[Coordinator] File checksum check: {} === {}", actual, expected);
        }
    } catch (const StorageError& e) {
        log::Registry::move()->warn("[Coordinator] Verification of {} failed: {}", dest, e.what());
        return false;
    }

    return true;
}

void Coordinator::copyTimestamps(const std::string& from, const std::string& to) const {
    try {
        const auto st = gateway_->stat(from);
        gateway_->utimes(to, st.atime, st.mtime);
    } catch (const StorageError& e) {
        log::Registry::move()->warn("[Coordinator] Could not copy timestamps {} => {}: {}", from, to, e.what());
    }
}

MoveResult Coordinator::moveAssetImage(const layout::OwnedEntity& asset, const std::optional<std::string>& currentPath,
                                       const layout::ImageType type, const layout::ImageFormat format) {
    return moveFile({
        .entityId = asset.id,
        .pathKind = toPathKind(type),
        .oldPath = currentPath,
        .newPath = layout::imagePath(layout_, asset, type, format)
    });
}

MoveResult Coordinator::moveAssetVideo(const layout::OwnedEntity& asset, const std::optional<std::string>& currentPath) {
    return moveFile({
        .entityId = asset.id,
        .pathKind = PathKind::EncodedVideo,
        .oldPath = currentPath,
        .newPath = layout::encodedVideoPath(layout_, asset)
    });
}

MoveResult Coordinator::movePersonFile(const layout::OwnedEntity& person, const std::optional<std::string>& currentPath) {
    return moveFile({
        .entityId = person.id,
        .pathKind = PathKind::Face,
        .oldPath = currentPath,
        .newPath = layout::personThumbnailPath(layout_, person)
    });
}

void Coordinator::removeEmptyDirs(const layout::StorageFolder folder) const {
    gateway_->removeEmptyDirs(layout::baseFolder(layout_, folder));
}

}
