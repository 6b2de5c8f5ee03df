#include <gtest/gtest.h>
#include "storage/Errors.hpp"
#include "storage/LocalBackend.hpp"
#include "support/TempDir.hpp"

#include <algorithm>
#include <chrono>

using namespace mg::storage;
using namespace mg::storage::model;
using mg::test::TempDir;

namespace {
std::vector<uint8_t> bytes(const std::string& s) { return {s.begin(), s.end()}; }
}

class LocalBackendTest : public ::testing::Test {
protected:
    TempDir tmp;
    LocalBackend local;
};

TEST_F(LocalBackendTest, WriteThenReadRoundTrip) {
    const auto p = tmp.path() / "a.bin";
    local.write(p, bytes("hello world"));
    EXPECT_EQ(local.readText(p), "hello world");
    EXPECT_EQ(local.read(p, {.position = 6, .length = 5}), bytes("world"));
}

TEST_F(LocalBackendTest, ReadMissingIsNotFound) {
    EXPECT_THROW((void)local.read(tmp.path() / "missing"), NotFoundError);
    EXPECT_THROW((void)local.stat(tmp.path() / "missing"), NotFoundError);
}

TEST_F(LocalBackendTest, CreateExclusiveRefusesExisting) {
    const auto p = tmp.path() / "x";
    local.createExclusive(p, bytes("one"));
    EXPECT_THROW(local.createExclusive(p, bytes("two")), AlreadyExistsError);
    EXPECT_EQ(local.readText(p), "one");
}

TEST_F(LocalBackendTest, OverwriteRequiresExistingAndDoesNotTruncate) {
    const auto p = tmp.path() / "o";
    EXPECT_THROW(local.overwrite(p, bytes("abc")), NotFoundError);

    local.write(p, bytes("abcdef"));
    local.overwrite(p, bytes("XY"));
    EXPECT_EQ(local.readText(p), "XYcdef");
}

TEST_F(LocalBackendTest, StatReportsSizeAndKind) {
    const auto p = tmp.writeFile("d/f.txt", "12345");
    const auto st = local.stat(p);
    EXPECT_EQ(st.size, 5u);
    EXPECT_FALSE(st.isDirectory);
    EXPECT_TRUE(local.stat(tmp.path() / "d").isDirectory);
}

TEST_F(LocalBackendTest, UtimesSetsTimestamps) {
    const auto p = tmp.writeFile("t", "x");
    const auto when = Clock::time_point(std::chrono::seconds(1'600'000'000));
    local.utimes(p, when, when);
    const auto st = local.stat(p);
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(st.mtime.time_since_epoch()).count(), 1'600'000'000);
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(st.atime.time_since_epoch()).count(), 1'600'000'000);
}

TEST_F(LocalBackendTest, RenameAndCopy) {
    const auto a = tmp.writeFile("a", "data");
    const auto b = tmp.path() / "b";
    const auto c = tmp.path() / "c";

    local.rename(a, b);
    EXPECT_FALSE(local.exists(a));
    EXPECT_TRUE(local.exists(b));

    local.copy(b, c);
    EXPECT_EQ(local.readText(c), "data");
    EXPECT_TRUE(local.exists(b));
}

TEST_F(LocalBackendTest, UnlinkMissingIsNotFound) {
    EXPECT_THROW(local.unlink(tmp.path() / "nope"), NotFoundError);
}

TEST_F(LocalBackendTest, ReaddirListsNames) {
    tmp.writeFile("r/one", "1");
    tmp.writeFile("r/two", "2");
    auto names = local.readdir(tmp.path() / "r");
    std::ranges::sort(names);
    EXPECT_EQ(names, (std::vector<std::string>{"one", "two"}));
}

TEST_F(LocalBackendTest, RemoveEmptyDirsKeepsNonEmptyBranches) {
    local.mkdirs(tmp.path() / "root/empty/deeper");
    tmp.writeFile("root/full/keep.txt", "k");

    local.removeEmptyDirs(tmp.path() / "root");

    EXPECT_FALSE(local.exists(tmp.path() / "root/empty"));
    EXPECT_TRUE(local.exists(tmp.path() / "root/full/keep.txt"));
    EXPECT_TRUE(local.exists(tmp.path() / "root"));
}

TEST_F(LocalBackendTest, RemoveEmptyDirsIncludeSelf) {
    local.mkdirs(tmp.path() / "gone/a/b");
    local.removeEmptyDirs(tmp.path() / "gone", true);
    EXPECT_FALSE(local.exists(tmp.path() / "gone"));
}

TEST_F(LocalBackendTest, DiskUsageIsConsistent) {
    const auto du = local.diskUsage(tmp.path());
    EXPECT_GT(du.total, 0u);
    EXPECT_LE(du.available, du.free);
    EXPECT_LE(du.free, du.total);
}
