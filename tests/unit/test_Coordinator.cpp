#include <gtest/gtest.h>
#include "move/Coordinator.hpp"
#include "storage/Gateway.hpp"
#include "support/FakeObjectStore.hpp"
#include "support/InstrumentedLocalBackend.hpp"
#include "support/MemoryIntentStore.hpp"
#include "support/TempDir.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>

using namespace mg;
using namespace mg::move;
using namespace mg::storage;
using mg::test::FakeObjectStore;
using mg::test::InstrumentedLocalBackend;
using mg::test::MemoryIntentStore;
using mg::test::TempDir;

namespace {
constexpr auto CONTENT = "0123456789abcdefghij";  // 20 bytes
constexpr auto STALE_SHA1 = "0000000000000000000000000000000000000000";
}

class CoordinatorTest : public ::testing::Test {
protected:
    TempDir tmp;
    std::shared_ptr<InstrumentedLocalBackend> local = std::make_shared<InstrumentedLocalBackend>();
    std::shared_ptr<FakeObjectStore> store = std::make_shared<FakeObjectStore>();
    std::shared_ptr<MemoryIntentStore> intents = std::make_shared<MemoryIntentStore>();
    std::shared_ptr<Gateway> gateway;

    // what the owning entities currently point at
    std::map<std::string, std::string> committed;
    int commits = 0;
    bool failCommit = false;

    void SetUp() override {
        config::StorageConfig cfg;
        cfg.media_location = tmp.str("data");
        cfg.temp_dir = tmp.path();
        gateway = std::make_shared<Gateway>(cfg, local, [this](const std::string&) { return store; });
    }

    Coordinator coordinator(const bool hashVerification = true) {
        return {gateway, intents,
                [this](const PathKind kind, const std::string& entityId, const std::string& newPath) {
                    if (failCommit) throw std::runtime_error("entity table unavailable");
                    ++commits;
                    committed[entityId + "/" + std::string(to_string(kind))] = newPath;
                },
                layout::LayoutConfig{tmp.str("data")}, hashVerification};
    }

    [[nodiscard]] std::string expectedSha1() const {
        // the source's own digest, computed before anything moves
        return gateway->hash(tmp.str("data/lib/u1/2023/a1.jpg"));
    }

    std::string oldPath() const { return tmp.str("data/lib/u1/2023/a1.jpg"); }
    std::string newPath() const { return tmp.str("data/lib/u1/2024/a1.jpg"); }

    MoveRequest originalRequest(const std::optional<AssetInfo>& info) const {
        return {.entityId = "a1", .pathKind = PathKind::Original, .oldPath = oldPath(), .newPath = newPath(), .assetInfo = info};
    }

    static std::string read(const std::string& p) {
        std::ifstream in(p, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), {}};
    }
};

TEST_F(CoordinatorTest, NoopWhenOldPathMissingOrUnchanged) {
    auto c = coordinator();
    EXPECT_EQ(c.moveFile({.entityId = "a1", .newPath = newPath()}).state, MoveState::Idle);
    EXPECT_EQ(c.moveFile({.entityId = "a1", .oldPath = newPath(), .newPath = newPath()}).state, MoveState::Idle);
    EXPECT_EQ(local->ioCalls(), 0);
    EXPECT_EQ(intents->size(), 0u);
}

TEST_F(CoordinatorTest, SameFilesystemMoveIsAtomicRename) {
    tmp.writeFile("data/lib/u1/2023/a1.jpg", CONTENT);
    const AssetInfo info{20, expectedSha1()};
    auto c = coordinator();

    const auto res = c.moveFile(originalRequest(info));

    EXPECT_EQ(res.state, MoveState::Cleaned);
    EXPECT_TRUE(res.settled());
    EXPECT_FALSE(std::filesystem::exists(oldPath()));
    EXPECT_EQ(read(newPath()), CONTENT);
    EXPECT_EQ(committed.at("a1/original"), newPath());
    EXPECT_EQ(local->copies.load(), 0);
    EXPECT_EQ(intents->size(), 0u);
}

TEST_F(CoordinatorTest, CrossDeviceFallsBackToCopyVerifyDelete) {
    tmp.writeFile("data/lib/u1/2023/a1.jpg", CONTENT);
    const auto when = model::Clock::time_point(std::chrono::seconds(1'500'000'000));
    local->utimes(oldPath(), when, when);
    const AssetInfo info{20, expectedSha1()};
    local->crossDevice = true;
    auto c = coordinator();

    const auto res = c.moveFile(originalRequest(info));

    EXPECT_EQ(res.state, MoveState::Cleaned);
    EXPECT_EQ(local->copies.load(), 1);
    EXPECT_FALSE(std::filesystem::exists(oldPath()));
    EXPECT_EQ(read(newPath()), CONTENT);
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(local->stat(newPath()).mtime.time_since_epoch()).count(),
              1'500'000'000);
    EXPECT_EQ(committed.at("a1/original"), newPath());
    EXPECT_EQ(intents->size(), 0u);
}

TEST_F(CoordinatorTest, SizeMismatchDeletesDestinationAndKeepsSource) {
    tmp.writeFile("data/lib/u1/2023/a1.jpg", CONTENT);
    local->crossDevice = true;
    auto c = coordinator();

    const auto res = c.moveFile(originalRequest(AssetInfo{999, expectedSha1()}));

    EXPECT_EQ(res.state, MoveState::Aborted);
    EXPECT_FALSE(res.settled());
    EXPECT_FALSE(std::filesystem::exists(newPath()));
    EXPECT_EQ(read(oldPath()), CONTENT);
    EXPECT_EQ(commits, 0);
    EXPECT_EQ(intents->size(), 1u);
}

TEST_F(CoordinatorTest, ChecksumMismatchDeletesDestinationWhenEnabled) {
    tmp.writeFile("data/lib/u1/2023/a1.jpg", CONTENT);
    local->crossDevice = true;
    auto c = coordinator(true);

    const auto res = c.moveFile(originalRequest(AssetInfo{20, STALE_SHA1}));

    EXPECT_EQ(res.state, MoveState::Aborted);
    EXPECT_FALSE(std::filesystem::exists(newPath()));
    EXPECT_EQ(read(oldPath()), CONTENT);
    EXPECT_EQ(commits, 0);
}

TEST_F(CoordinatorTest, ChecksumIgnoredWhenDisabled) {
    tmp.writeFile("data/lib/u1/2023/a1.jpg", CONTENT);
    local->crossDevice = true;
    auto c = coordinator(false);

    const auto res = c.moveFile(originalRequest(AssetInfo{20, STALE_SHA1}));

    EXPECT_EQ(res.state, MoveState::Cleaned);
    EXPECT_EQ(read(newPath()), CONTENT);
}

TEST_F(CoordinatorTest, ChecksumComparisonIgnoresCase) {
    tmp.writeFile("data/lib/u1/2023/a1.jpg", CONTENT);
    auto upper = expectedSha1();
    std::ranges::transform(upper, upper.begin(), [](const unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    local->crossDevice = true;
    auto c = coordinator(true);

    EXPECT_EQ(c.moveFile(originalRequest(AssetInfo{20, upper})).state, MoveState::Cleaned);
}

TEST_F(CoordinatorTest, UnknownChecksumFallsBackToSizeCheck) {
    tmp.writeFile("data/lib/u1/2023/a1.jpg", CONTENT);
    local->crossDevice = true;
    auto c = coordinator(true);

    const auto res = c.moveFile(originalRequest(AssetInfo{.sizeInBytes = 20}));

    EXPECT_EQ(res.state, MoveState::Cleaned);
    EXPECT_EQ(local->copies.load(), 1);
    EXPECT_FALSE(std::filesystem::exists(oldPath()));
    EXPECT_EQ(read(newPath()), CONTENT);
    EXPECT_EQ(committed.at("a1/original"), newPath());
}

TEST_F(CoordinatorTest, UnknownChecksumStillEnforcesSize) {
    tmp.writeFile("data/lib/u1/2023/a1.jpg", CONTENT);
    local->crossDevice = true;
    auto c = coordinator(true);

    const auto res = c.moveFile(originalRequest(AssetInfo{.sizeInBytes = 21}));

    EXPECT_EQ(res.state, MoveState::Aborted);
    EXPECT_FALSE(std::filesystem::exists(newPath()));
    EXPECT_EQ(read(oldPath()), CONTENT);
}

TEST_F(CoordinatorTest, CopyFailureAbortsAndKeepsSource) {
    tmp.writeFile("data/lib/u1/2023/a1.jpg", CONTENT);
    local->crossDevice = true;
    local->failCopy = true;
    auto c = coordinator();

    const auto res = c.moveFile(originalRequest(AssetInfo{20, expectedSha1()}));

    EXPECT_EQ(res.state, MoveState::Aborted);
    EXPECT_EQ(read(oldPath()), CONTENT);
    EXPECT_EQ(intents->size(), 1u);
}

TEST_F(CoordinatorTest, OtherRenameErrorsAbortWithoutDestructiveAction) {
    // source vanished before the rename
    auto c = coordinator();
    const auto res = c.moveFile(originalRequest(AssetInfo{20, STALE_SHA1}));

    EXPECT_EQ(res.state, MoveState::Aborted);
    EXPECT_EQ(local->copies.load(), 0);
    EXPECT_EQ(intents->size(), 1u);
    EXPECT_EQ(commits, 0);
}

TEST_F(CoordinatorTest, OriginalWithoutAssetInfoStopsAfterRecordingIntent) {
    tmp.writeFile("data/lib/u1/2023/a1.jpg", CONTENT);
    auto c = coordinator();

    const auto res = c.moveFile(originalRequest(std::nullopt));

    EXPECT_EQ(res.state, MoveState::Aborted);
    EXPECT_TRUE(std::filesystem::exists(oldPath()));
    EXPECT_EQ(local->renames.load(), 0);
    ASSERT_EQ(intents->size(), 1u);
    EXPECT_EQ(intents->getByEntity("a1", PathKind::Original)->newPath, newPath());
}

TEST_F(CoordinatorTest, ResumeWithOnlyNewFileCommitsWithoutCopy) {
    tmp.writeFile("data/lib/u1/2024/a1.jpg", CONTENT);
    const auto sha = gateway->hash(newPath());
    (void)intents->create("a1", PathKind::Original, oldPath(), newPath());
    auto c = coordinator();

    const auto res = c.moveFile(originalRequest(AssetInfo{20, sha}));

    EXPECT_EQ(res.state, MoveState::Cleaned);
    EXPECT_EQ(local->renames.load(), 0);
    EXPECT_EQ(local->copies.load(), 0);
    EXPECT_EQ(committed.at("a1/original"), newPath());
    EXPECT_EQ(intents->size(), 0u);
}

TEST_F(CoordinatorTest, ResumeWithOnlyNewFileAndSizeOnlyAssetInfo) {
    tmp.writeFile("data/lib/u1/2024/a1.jpg", CONTENT);
    (void)intents->create("a1", PathKind::Original, oldPath(), newPath());
    auto c = coordinator(true);

    const auto res = c.moveFile(originalRequest(AssetInfo{.sizeInBytes = 20}));

    EXPECT_EQ(res.state, MoveState::Cleaned);
    EXPECT_EQ(committed.at("a1/original"), newPath());
    EXPECT_EQ(intents->size(), 0u);
}

TEST_F(CoordinatorTest, ResumeWithMismatchedNewFileLeavesItForInspection) {
    tmp.writeFile("data/lib/u1/2024/a1.jpg", "short");
    (void)intents->create("a1", PathKind::Original, oldPath(), newPath());
    auto c = coordinator();

    const auto res = c.moveFile(originalRequest(AssetInfo{20, STALE_SHA1}));

    EXPECT_EQ(res.state, MoveState::Aborted);
    EXPECT_TRUE(std::filesystem::exists(newPath()));
    EXPECT_EQ(commits, 0);
    EXPECT_EQ(intents->size(), 1u);
}

TEST_F(CoordinatorTest, ResumeWithNeitherFileAbortsWithoutMutation) {
    (void)intents->create("a1", PathKind::Original, oldPath(), newPath());
    auto c = coordinator();

    const auto res = c.moveFile(originalRequest(AssetInfo{20, STALE_SHA1}));

    EXPECT_EQ(res.state, MoveState::Aborted);
    EXPECT_EQ(local->renames.load(), 0);
    EXPECT_EQ(local->unlinks.load(), 0);
    EXPECT_EQ(commits, 0);
    EXPECT_EQ(intents->getByEntity("a1", PathKind::Original)->oldPath, oldPath());
}

TEST_F(CoordinatorTest, ResumeWithOnlyOldFileFinishesTheMove) {
    tmp.writeFile("data/lib/u1/2023/a1.jpg", CONTENT);
    const AssetInfo info{20, expectedSha1()};
    (void)intents->create("a1", PathKind::Original, oldPath(), newPath());
    auto c = coordinator();

    EXPECT_EQ(c.moveFile(originalRequest(info)).state, MoveState::Cleaned);
    EXPECT_FALSE(std::filesystem::exists(oldPath()));
    EXPECT_EQ(read(newPath()), CONTENT);
    EXPECT_EQ(intents->size(), 0u);
}

TEST_F(CoordinatorTest, ResumeWithBothFilesPrefersOld) {
    tmp.writeFile("data/lib/u1/2023/a1.jpg", CONTENT);
    tmp.writeFile("data/lib/u1/2024/a1.jpg", "partial");
    const AssetInfo info{20, expectedSha1()};
    (void)intents->create("a1", PathKind::Original, oldPath(), newPath());
    local->crossDevice = true;
    auto c = coordinator();

    EXPECT_EQ(c.moveFile(originalRequest(info)).state, MoveState::Cleaned);
    EXPECT_EQ(read(newPath()), CONTENT);
    EXPECT_FALSE(std::filesystem::exists(oldPath()));
}

TEST_F(CoordinatorTest, IntentRemovalFailureIsReconciledLater) {
    tmp.writeFile("data/lib/u1/2023/a1.jpg", CONTENT);
    const AssetInfo info{20, expectedSha1()};
    intents->failRemove = true;
    auto c = coordinator();

    const auto first = c.moveFile(originalRequest(info));
    EXPECT_EQ(first.state, MoveState::Committed);
    EXPECT_TRUE(first.settled());
    EXPECT_FALSE(first.reason.empty());
    EXPECT_EQ(intents->size(), 1u);

    intents->failRemove = false;
    const auto second = c.moveFile(originalRequest(info));
    EXPECT_EQ(second.state, MoveState::Cleaned);
    EXPECT_EQ(intents->size(), 0u);
    EXPECT_EQ(read(newPath()), CONTENT);
}

TEST_F(CoordinatorTest, CommitCallbackErrorsPropagateAndKeepIntent) {
    tmp.writeFile("data/lib/u1/2023/a1.jpg", CONTENT);
    failCommit = true;
    auto c = coordinator();

    EXPECT_THROW((void)c.moveFile(originalRequest(AssetInfo{20, expectedSha1()})), std::runtime_error);
    EXPECT_EQ(intents->size(), 1u);
    EXPECT_TRUE(std::filesystem::exists(newPath()));
}

TEST_F(CoordinatorTest, SecondMoveThroughRecordedPathDoesNoIO) {
    const layout::OwnedEntity asset{"abcdef12", "u1"};
    tmp.writeFile("data/upload/u1/preview.jpeg", CONTENT);
    auto c = coordinator();

    const auto first = c.moveAssetImage(asset, tmp.str("data/upload/u1/preview.jpeg"),
                                        layout::ImageType::Preview, layout::ImageFormat::Jpeg);
    ASSERT_EQ(first.state, MoveState::Cleaned);
    const auto recorded = committed.at("abcdef12/preview");
    EXPECT_EQ(recorded, layout::imagePath({tmp.str("data")}, asset, layout::ImageType::Preview, layout::ImageFormat::Jpeg));
    EXPECT_EQ(read(recorded), CONTENT);

    const auto before = local->ioCalls();
    const auto second = c.moveAssetImage(asset, recorded, layout::ImageType::Preview, layout::ImageFormat::Jpeg);
    EXPECT_EQ(second.state, MoveState::Idle);
    EXPECT_EQ(local->ioCalls(), before);
    EXPECT_EQ(commits, 1);
}

TEST_F(CoordinatorTest, DerivedFilesMoveWithoutAssetInfo) {
    const layout::OwnedEntity asset{"ffee0011", "u2"};
    tmp.writeFile("data/old/video.mp4", "video");
    auto c = coordinator();

    EXPECT_EQ(c.moveAssetVideo(asset, tmp.str("data/old/video.mp4")).state, MoveState::Cleaned);
    EXPECT_EQ(committed.at("ffee0011/encoded_video"), layout::encodedVideoPath({tmp.str("data")}, asset));
}

TEST_F(CoordinatorTest, RemoteRelocationIsServerSideCopyThenDelete) {
    const std::string from = "s3.example.com/bucket/u1/a.jpg";
    const std::string to = "s3.example.com/bucket/u1/2024/a.jpg";
    store->putObject("bucket", "u1/a.jpg", CONTENT);
    auto c = coordinator();

    const auto res = c.moveFile({.entityId = "a1", .pathKind = PathKind::Original, .oldPath = from, .newPath = to,
                                 .assetInfo = AssetInfo{20, gateway->hash(from)}});

    EXPECT_EQ(res.state, MoveState::Cleaned);
    EXPECT_EQ(store->copies.load(), 1);
    EXPECT_EQ(store->deletes.load(), 1);
    EXPECT_FALSE(store->has("bucket", "u1/a.jpg"));
    EXPECT_TRUE(store->has("bucket", "u1/2024/a.jpg"));
    EXPECT_EQ(local->mkdirCalls.load(), 0);
}

TEST_F(CoordinatorTest, CrossBucketRelocationIsRejectedBeforeAnyCopy) {
    store->putObject("bucket", "u1/a.jpg", CONTENT);
    auto c = coordinator();

    const auto res = c.moveFile({.entityId = "a1", .pathKind = PathKind::Preview,
                                 .oldPath = "s3.example.com/bucket/u1/a.jpg", .newPath = "s3.example.com/other/u1/a.jpg"});

    EXPECT_EQ(res.state, MoveState::Aborted);
    EXPECT_EQ(store->copies.load(), 0);
    EXPECT_TRUE(store->has("bucket", "u1/a.jpg"));
}

TEST_F(CoordinatorTest, RemoveEmptyDirsPrunesLayoutFolder) {
    local->mkdirs(tmp.path() / "data/thumbs/u1/ab/cd");
    tmp.writeFile("data/thumbs/u2/ef/gh/keep.jpeg", "k");
    auto c = coordinator();

    c.removeEmptyDirs(layout::StorageFolder::Thumbnails);

    EXPECT_FALSE(std::filesystem::exists(tmp.path() / "data/thumbs/u1"));
    EXPECT_TRUE(std::filesystem::exists(tmp.path() / "data/thumbs/u2/ef/gh/keep.jpeg"));
    EXPECT_TRUE(std::filesystem::exists(tmp.path() / "data/thumbs"));
}
