#include "csync/sync/local_transfer.hpp"

#include "support/temp_tree.hpp"

#include <gtest/gtest.h>

using namespace csync::sync;
using csync::rules::RuleSet;
using csync::testing::read_file;
using csync::testing::TempDir;
using csync::testing::write_file;
namespace fs = std::filesystem;

class LocalTransferTest : public ::testing::Test {
protected:
    TransferRequest request(std::vector<PlanItem> items, const RuleSet& rules = RuleSet::default_push()) {
        TransferRequest req;
        req.source_root = source_.path();
        req.destination_root = destination_.path();
        req.filter_lines = rules.to_filter_lines();
        req.items = std::move(items);
        return req;
    }

    TempDir source_{"csync_local_src"};
    TempDir destination_{"csync_local_dst"};
    LocalTransfer transfer_;
};

TEST_F(LocalTransferTest, CopiesFilesAndCreatesDirectories) {
    write_file(source_ / "configuration.yaml", "homeassistant:\n");
    write_file(source_ / "packages/lights.yaml", "light: []\n");

    auto outcome = transfer_.transfer(request({
        {"configuration.yaml", SyncAction::Copy, EntryKind::File, PlanReason::New},
        {"packages", SyncAction::Copy, EntryKind::Directory, PlanReason::New},
        {"packages/lights.yaml", SyncAction::Copy, EntryKind::File, PlanReason::New},
    }));

    EXPECT_EQ(outcome.exit_code, 0) << outcome.diagnostics;
    EXPECT_TRUE(outcome.failures.empty());
    EXPECT_EQ(read_file(destination_ / "configuration.yaml"), "homeassistant:\n");
    EXPECT_EQ(read_file(destination_ / "packages/lights.yaml"), "light: []\n");
}

TEST_F(LocalTransferTest, ReplacesExistingFileWithoutLeavingStagingFiles) {
    write_file(source_ / "automations.yaml", "- id: new\n");
    write_file(destination_ / "automations.yaml", "- id: old\n");

    auto outcome = transfer_.transfer(request({
        {"automations.yaml", SyncAction::Copy, EntryKind::File, PlanReason::Changed},
    }));

    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(read_file(destination_ / "automations.yaml"), "- id: new\n");
    for (const auto& entry : fs::directory_iterator(destination_.path())) {
        EXPECT_EQ(entry.path().filename().string().find(".csync-partial"), std::string::npos);
    }
}

TEST_F(LocalTransferTest, DeletesChildrenBeforeParents) {
    write_file(destination_ / "old/nested/file.yaml", "x");

    auto outcome = transfer_.transfer(request({
        {"old/nested/file.yaml", SyncAction::Delete, EntryKind::File, PlanReason::Extraneous},
        {"old/nested", SyncAction::Delete, EntryKind::Directory, PlanReason::Extraneous},
        {"old", SyncAction::Delete, EntryKind::Directory, PlanReason::Extraneous},
    }));

    EXPECT_EQ(outcome.exit_code, 0) << outcome.diagnostics;
    EXPECT_FALSE(fs::exists(destination_ / "old"));
}

TEST_F(LocalTransferTest, MirrorOffKeepsExtraneousEntries) {
    write_file(destination_ / "stale.yaml", "x");

    auto req = request({{"stale.yaml", SyncAction::Delete, EntryKind::File, PlanReason::Extraneous}});
    req.mirror = false;
    auto outcome = transfer_.transfer(req);

    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_TRUE(fs::exists(destination_ / "stale.yaml"));
}

TEST_F(LocalTransferTest, ReplacesFileWithDirectory) {
    write_file(source_ / "node/inner.yaml", "a");
    write_file(destination_ / "node", "was a file");

    auto outcome = transfer_.transfer(request({
        {"node", SyncAction::Copy, EntryKind::Directory, PlanReason::Changed},
        {"node/inner.yaml", SyncAction::Copy, EntryKind::File, PlanReason::New},
    }));

    EXPECT_EQ(outcome.exit_code, 0) << outcome.diagnostics;
    EXPECT_TRUE(fs::is_directory(destination_ / "node"));
    EXPECT_EQ(read_file(destination_ / "node/inner.yaml"), "a");
}

TEST_F(LocalTransferTest, RefusesToDeleteProtectedPath) {
    write_file(destination_ / "blueprints/remote.yaml", "keep me");

    auto outcome = transfer_.transfer(request({
        {"blueprints/remote.yaml", SyncAction::Delete, EntryKind::File, PlanReason::Extraneous},
    }));

    EXPECT_EQ(outcome.exit_code, kPartialTransferExitCode);
    ASSERT_EQ(outcome.failures.size(), 1u);
    EXPECT_EQ(outcome.failures[0].path, "blueprints/remote.yaml");
    EXPECT_TRUE(fs::exists(destination_ / "blueprints/remote.yaml"));
}

TEST_F(LocalTransferTest, RefusesToCopyExcludedPath) {
    write_file(source_ / ".storage/auth", "secret");
    write_file(source_ / "scripts.yaml", "{}");

    auto outcome = transfer_.transfer(request({
        {".storage/auth", SyncAction::Copy, EntryKind::File, PlanReason::New},
        {"scripts.yaml", SyncAction::Copy, EntryKind::File, PlanReason::New},
    }));

    EXPECT_EQ(outcome.exit_code, kPartialTransferExitCode);
    ASSERT_EQ(outcome.failures.size(), 1u);
    EXPECT_EQ(outcome.failures[0].path, ".storage/auth");
    EXPECT_FALSE(fs::exists(destination_ / ".storage/auth"));
    EXPECT_TRUE(fs::exists(destination_ / "scripts.yaml"));
    EXPECT_NE(outcome.diagnostics.find(".storage/auth"), std::string::npos);
}

TEST_F(LocalTransferTest, MissingSourceFileIsReportedPerPath) {
    write_file(source_ / "present.yaml", "p");

    auto outcome = transfer_.transfer(request({
        {"vanished.yaml", SyncAction::Copy, EntryKind::File, PlanReason::New},
        {"present.yaml", SyncAction::Copy, EntryKind::File, PlanReason::New},
    }));

    EXPECT_EQ(outcome.exit_code, kPartialTransferExitCode);
    ASSERT_EQ(outcome.failures.size(), 1u);
    EXPECT_EQ(outcome.failures[0].path, "vanished.yaml");
    EXPECT_TRUE(fs::exists(destination_ / "present.yaml"));
}

TEST_F(LocalTransferTest, MissingSourceRootFailsWholeTransfer) {
    auto req = request({{"a", SyncAction::Copy, EntryKind::File, PlanReason::New}});
    req.source_root = source_ / "does-not-exist";

    auto outcome = transfer_.transfer(req);

    EXPECT_EQ(outcome.exit_code, 1);
    EXPECT_TRUE(outcome.failures.empty());
    EXPECT_NE(outcome.diagnostics.find("not a directory"), std::string::npos);
}

TEST_F(LocalTransferTest, CreatesMissingDestinationRoot) {
    write_file(source_ / "a.yaml", "a");

    auto req = request({{"a.yaml", SyncAction::Copy, EntryKind::File, PlanReason::New}});
    req.destination_root = destination_ / "fresh/config";

    auto outcome = transfer_.transfer(req);

    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(read_file(destination_ / "fresh/config/a.yaml"), "a");
}

TEST_F(LocalTransferTest, NeverDeletesThroughDirectoryLink) {
    write_file(destination_ / ".storage/core/entity_registry", "{}");
    fs::create_directory_symlink(".storage", destination_ / "storage_link");

    auto outcome = transfer_.transfer(request({
        {"storage_link/core/entity_registry", SyncAction::Delete, EntryKind::File, PlanReason::Extraneous},
        {"storage_link/core", SyncAction::Delete, EntryKind::Directory, PlanReason::Extraneous},
    }));

    EXPECT_EQ(outcome.exit_code, kPartialTransferExitCode);
    ASSERT_EQ(outcome.failures.size(), 2u);
    EXPECT_EQ(outcome.failures[0].path, "storage_link/core/entity_registry");
    EXPECT_NE(outcome.failures[0].reason.find("symlinked directory storage_link"), std::string::npos);
    EXPECT_EQ(read_file(destination_ / ".storage/core/entity_registry"), "{}");
}

TEST_F(LocalTransferTest, DeletingDirectoryLinkRemovesOnlyTheLink) {
    write_file(destination_ / "real/f", "kept");
    fs::create_directory_symlink("real", destination_ / "link");

    auto outcome = transfer_.transfer(request({
        {"link", SyncAction::Delete, EntryKind::Directory, PlanReason::Extraneous},
    }));

    EXPECT_EQ(outcome.exit_code, 0) << outcome.diagnostics;
    EXPECT_FALSE(fs::exists(fs::symlink_status(destination_ / "link")));
    EXPECT_EQ(read_file(destination_ / "real/f"), "kept");
}

TEST_F(LocalTransferTest, DirectoryCopyReplacesLinkInsteadOfWritingThroughIt) {
    write_file(source_ / "packages/lights.yaml", "light: []\n");
    write_file(destination_ / "elsewhere/lights.yaml", "untouched");
    fs::create_directory_symlink("elsewhere", destination_ / "packages");

    auto outcome = transfer_.transfer(request({
        {"packages", SyncAction::Copy, EntryKind::Directory, PlanReason::Changed},
        {"packages/lights.yaml", SyncAction::Copy, EntryKind::File, PlanReason::New},
    }));

    EXPECT_EQ(outcome.exit_code, 0) << outcome.diagnostics;
    EXPECT_FALSE(fs::is_symlink(fs::symlink_status(destination_ / "packages")));
    EXPECT_EQ(read_file(destination_ / "packages/lights.yaml"), "light: []\n");
    EXPECT_EQ(read_file(destination_ / "elsewhere/lights.yaml"), "untouched");
}
