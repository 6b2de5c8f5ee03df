#include <gtest/gtest.h>
#include "layout/PathLayout.hpp"

using namespace mg::layout;

class PathLayoutTest : public ::testing::Test {
protected:
    LayoutConfig local{"/data"};
    LayoutConfig remote{"s3.us-east-1.amazonaws.com/media"};
    OwnedEntity asset{"abcdef12-3456", "user-1"};
};

TEST_F(PathLayoutTest, BaseFolders) {
    EXPECT_EQ(baseFolder(local, StorageFolder::Thumbnails), "/data/thumbs");
    EXPECT_EQ(baseFolder(local, StorageFolder::EncodedVideo), "/data/encoded-video");
    EXPECT_EQ(baseFolder(remote, StorageFolder::Library), "s3.us-east-1.amazonaws.com/media/library");
}

TEST_F(PathLayoutTest, NestedPathShardsByFilename) {
    EXPECT_EQ(nestedFolder(local, StorageFolder::Thumbnails, "user-1", "abcdef.jpg"), "/data/thumbs/user-1/ab/cd");
    EXPECT_EQ(nestedPath(local, StorageFolder::Thumbnails, "user-1", "abcdef.jpg"), "/data/thumbs/user-1/ab/cd/abcdef.jpg");
}

TEST_F(PathLayoutTest, ImagePathEncodesTypeAndFormat) {
    EXPECT_EQ(imagePath(local, asset, ImageType::Preview, ImageFormat::Jpeg),
              "/data/thumbs/user-1/ab/cd/abcdef12-3456-preview.jpeg");
    EXPECT_EQ(imagePath(remote, asset, ImageType::Thumbnail, ImageFormat::Webp),
              "s3.us-east-1.amazonaws.com/media/thumbs/user-1/ab/cd/abcdef12-3456-thumbnail.webp");
}

TEST_F(PathLayoutTest, VideoAndPersonPaths) {
    EXPECT_EQ(encodedVideoPath(local, asset), "/data/encoded-video/user-1/ab/cd/abcdef12-3456.mp4");
    EXPECT_EQ(personThumbnailPath(local, {"ff001122", "user-2"}), "/data/thumbs/user-2/ff/00/ff001122.jpeg");
    EXPECT_EQ(androidMotionPath(local, asset, "9f8e7d6c"), "/data/encoded-video/user-1/9f/8e/9f8e7d6c-MP.mp4");
}

TEST_F(PathLayoutTest, LibraryFolderPrefersStorageLabel) {
    EXPECT_EQ(libraryFolder(local, std::string("alice"), "user-1"), "/data/library/alice");
    EXPECT_EQ(libraryFolder(local, std::nullopt, "user-1"), "/data/library/user-1");
    EXPECT_EQ(libraryFolder(local, std::string(), "user-1"), "/data/library/user-1");
}

TEST_F(PathLayoutTest, AndroidMotionDetection) {
    EXPECT_TRUE(isAndroidMotionPath(local, encodedVideoPath(local, asset)));
    EXPECT_FALSE(isAndroidMotionPath(local, "/data/library/user-1/x.mp4"));
    EXPECT_TRUE(isAndroidMotionPath(remote, encodedVideoPath(remote, asset)));
}

TEST_F(PathLayoutTest, ManagedPaths) {
    EXPECT_TRUE(isManagedPath(local, "/data/upload/u/x.jpg"));
    EXPECT_TRUE(isManagedPath(local, "/data"));
    EXPECT_FALSE(isManagedPath(local, "/database/x.jpg"));
    EXPECT_FALSE(isManagedPath(local, "/data/../etc/passwd"));
    EXPECT_TRUE(isManagedPath(local, "s3.us-east-1.amazonaws.com/media/x.jpg"));
}

TEST_F(PathLayoutTest, TempPathIsUniqueInDir) {
    const auto a = tempPathInDir("/data/upload");
    const auto b = tempPathInDir("/data/upload");
    EXPECT_NE(a, b);
    EXPECT_TRUE(a.starts_with("/data/upload/"));
    EXPECT_TRUE(a.ends_with(".tmp"));
}
