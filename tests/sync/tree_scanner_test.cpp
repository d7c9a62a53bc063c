#include "csync/sync/tree_scanner.hpp"

#include "support/temp_tree.hpp"

#include <gtest/gtest.h>

#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace fs = std::filesystem;
using csync::ErrorCode;
using csync::sync::EntryKind;
using csync::sync::TreeScanner;
using csync::testing::TempDir;
using csync::testing::write_file;

class TreeScannerTest : public ::testing::Test {
protected:
    TempDir root_{"csync_scan"};
    TreeScanner scanner_;
};

TEST_F(TreeScannerTest, ListsFilesAndDirectoriesWithRelativePaths) {
    write_file(root_ / "configuration.yaml", "homeassistant:\n");
    write_file(root_ / "packages/lights.yaml", "light:\n");
    fs::create_directories(root_ / "empty");

    auto listing = scanner_.scan(root_.path());
    ASSERT_TRUE(listing.is_ok()) << listing.error().describe();

    const auto& entries = listing.value();
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries.at("configuration.yaml").kind, EntryKind::File);
    EXPECT_EQ(entries.at("packages").kind, EntryKind::Directory);
    EXPECT_EQ(entries.at("packages/lights.yaml").kind, EntryKind::File);
    EXPECT_EQ(entries.at("empty").kind, EntryKind::Directory);
    EXPECT_EQ(entries.at("packages/lights.yaml").path, "packages/lights.yaml");
}

TEST_F(TreeScannerTest, FingerprintIsSizeAndSha256) {
    write_file(root_ / "a.txt", "abc");

    auto listing = scanner_.scan(root_.path());
    ASSERT_TRUE(listing.is_ok());

    const auto& fingerprint = listing.value().at("a.txt").fingerprint;
    EXPECT_EQ(fingerprint.size, 3u);
    EXPECT_EQ(fingerprint.checksum, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(TreeScannerTest, EmptyFileHasKnownDigest) {
    write_file(root_ / "empty.txt", "");
    auto fingerprint = TreeScanner::fingerprint_file(root_ / "empty.txt");
    ASSERT_TRUE(fingerprint.is_ok());
    EXPECT_EQ(fingerprint.value().size, 0u);
    EXPECT_EQ(fingerprint.value().checksum, "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(TreeScannerTest, SameContentGivesIdenticalEntries) {
    write_file(root_ / "one/x.yaml", "same");
    write_file(root_ / "two/x.yaml", "same");
    write_file(root_ / "three/x.yaml", "different");

    auto listing = scanner_.scan(root_.path());
    ASSERT_TRUE(listing.is_ok());
    const auto& entries = listing.value();
    EXPECT_TRUE(entries.at("one/x.yaml").identical_to(entries.at("two/x.yaml")));
    EXPECT_FALSE(entries.at("one/x.yaml").identical_to(entries.at("three/x.yaml")));
    EXPECT_TRUE(entries.at("one").identical_to(entries.at("two")));
    EXPECT_FALSE(entries.at("one").identical_to(entries.at("one/x.yaml")));
}

TEST_F(TreeScannerTest, MissingRootIsAccessError) {
    auto listing = scanner_.scan(root_ / "does-not-exist");
    ASSERT_TRUE(listing.is_error());
    EXPECT_EQ(listing.error().code, ErrorCode::Access);
}

TEST_F(TreeScannerTest, FileRootIsAccessError) {
    write_file(root_ / "file", "x");
    auto listing = scanner_.scan(root_ / "file");
    ASSERT_TRUE(listing.is_error());
    EXPECT_EQ(listing.error().code, ErrorCode::Access);
}

TEST_F(TreeScannerTest, FollowsSymlinksInsideTheRoot) {
    write_file(root_ / "real/data.yaml", "x: 1\n");
    fs::create_symlink(root_ / "real/data.yaml", root_ / "alias.yaml");
    fs::create_directory_symlink(root_ / "real", root_ / "linked");

    auto listing = scanner_.scan(root_.path());
    ASSERT_TRUE(listing.is_ok()) << listing.error().describe();
    const auto& entries = listing.value();
    EXPECT_EQ(entries.at("alias.yaml").kind, EntryKind::File);
    EXPECT_TRUE(entries.at("alias.yaml").identical_to(entries.at("real/data.yaml")));
    EXPECT_EQ(entries.at("linked").kind, EntryKind::Directory);
    EXPECT_EQ(entries.count("linked/data.yaml"), 1u);

    EXPECT_TRUE(entries.at("alias.yaml").symlink);
    EXPECT_TRUE(entries.at("linked").symlink);
    EXPECT_FALSE(entries.at("real").symlink);
    EXPECT_FALSE(entries.at("linked/data.yaml").symlink);
}

TEST_F(TreeScannerTest, SymlinkOutsideRootIsTraversalError) {
    TempDir outside("csync_scan_outside");
    write_file(outside / "secret.txt", "nope");
    fs::create_directories(root_ / "tree");
    fs::create_symlink(outside / "secret.txt", root_ / "tree/escape");

    auto listing = scanner_.scan(root_ / "tree");
    ASSERT_TRUE(listing.is_error());
    EXPECT_EQ(listing.error().code, ErrorCode::Traversal);
}

TEST_F(TreeScannerTest, SymlinkLoopIsTraversalError) {
    fs::create_directories(root_ / "a/b");
    fs::create_directory_symlink(root_ / "a", root_ / "a/b/back");

    auto listing = scanner_.scan(root_.path());
    ASSERT_TRUE(listing.is_error());
    EXPECT_EQ(listing.error().code, ErrorCode::Traversal);
}

TEST_F(TreeScannerTest, DanglingSymlinkIsAccessError) {
    fs::create_symlink(root_ / "missing-target", root_ / "dangling");

    auto listing = scanner_.scan(root_.path());
    ASSERT_TRUE(listing.is_error());
    EXPECT_EQ(listing.error().code, ErrorCode::Access);
}

TEST_F(TreeScannerTest, SpecialFileIsAccessError) {
    const auto fifo = root_ / "pipe";
    ASSERT_EQ(::mkfifo(fifo.c_str(), 0600), 0);

    auto listing = scanner_.scan(root_.path());
    ASSERT_TRUE(listing.is_error());
    EXPECT_EQ(listing.error().code, ErrorCode::Access);
}

TEST_F(TreeScannerTest, UnreadableFileFailsWholeScan) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "permission checks do not apply to root";
    }
    write_file(root_ / "ok.yaml", "fine");
    write_file(root_ / "locked.yaml", "secret");
    fs::permissions(root_ / "locked.yaml", fs::perms::none);

    auto listing = scanner_.scan(root_.path());
    fs::permissions(root_ / "locked.yaml", fs::perms::owner_all);

    ASSERT_TRUE(listing.is_error());
    EXPECT_EQ(listing.error().code, ErrorCode::Access);
}
