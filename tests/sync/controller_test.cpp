#include "csync/events/events.hpp"
#include "csync/sync/controller.hpp"
#include "csync/sync/local_transfer.hpp"

#include "support/temp_tree.hpp"

#include <gtest/gtest.h>

using namespace csync::sync;
using csync::ErrorCode;
using csync::Ok;
using csync::Result;
using csync::events::EventBus;
using csync::events::PathFailedEvent;
using csync::events::PlanComputedEvent;
using csync::events::SyncCompletedEvent;
using csync::events::SyncFailedEvent;
using csync::events::SyncStartedEvent;
using csync::network::HttpRequest;
using csync::network::HttpResponse;
using csync::network::HttpTransport;
using csync::network::Url;
using csync::reload::ReloadNotifier;
using csync::reload::ReloadSettings;
using csync::rules::RuleSet;
using csync::testing::read_file;
using csync::testing::TempDir;
using csync::testing::write_file;
namespace fs = std::filesystem;

namespace {

// LocalTransfer that counts calls and can report injected failures.
class CountingTransfer : public TransferPrimitive {
public:
    std::string name() const override { return "counting"; }

    TransferOutcome transfer(const TransferRequest& request) override {
        ++calls;
        auto outcome = inner.transfer(request);
        if (!injected_failures.empty()) {
            outcome.exit_code = kPartialTransferExitCode;
            outcome.failures.insert(outcome.failures.end(), injected_failures.begin(), injected_failures.end());
        }
        return outcome;
    }

    LocalTransfer inner;
    std::vector<FailedPath> injected_failures;
    int calls = 0;
};

class AcceptingTransport : public HttpTransport {
public:
    Result<HttpResponse> send(const Url&, const HttpRequest& request, std::chrono::milliseconds) override {
        targets.push_back(request.target);
        HttpResponse response;
        response.status_code = 200;
        return Ok(std::move(response));
    }

    std::vector<std::string> targets;
};

} // namespace

class DirectionControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        bus_.subscribe<SyncStartedEvent>([this](const SyncStartedEvent&) { ++started_; });
        bus_.subscribe<PlanComputedEvent>([this](const PlanComputedEvent&) { ++planned_; });
        bus_.subscribe<SyncCompletedEvent>([this](const SyncCompletedEvent& e) { completed_.push_back(e); });
        bus_.subscribe<SyncFailedEvent>([this](const SyncFailedEvent&) { ++failed_; });
        bus_.subscribe<PathFailedEvent>([this](const PathFailedEvent& e) { failed_paths_.push_back(e.path); });
    }

    DirectionController controller(ReloadNotifier* notifier = nullptr) {
        return DirectionController(RuleSet::default_push(), RuleSet::default_pull(), transfer_, bus_, notifier);
    }

    // Workstation copy of the configuration.
    void seed_local() {
        write_file(local_ / "configuration.yaml", "homeassistant:\n  name: new\n");
        write_file(local_ / "automations.yaml", "- id: morning\n");
        write_file(local_ / "scripts.yaml", "{}\n");
        write_file(local_ / ".storage/core.config", "local copy");
    }

    // Live instance with runtime state next to the configuration.
    void seed_remote() {
        write_file(remote_ / "configuration.yaml", "homeassistant:\n  name: old\n");
        write_file(remote_ / "automations.yaml", "- id: stale\n");
        write_file(remote_ / "scripts.yaml", "{}\n");
        write_file(remote_ / ".storage/auth", "tokens");
        write_file(remote_ / ".storage/core.config", "live copy");
        write_file(remote_ / "backups/backup.tar", "archive");
        write_file(remote_ / "www/logo.png", "png");
        write_file(remote_ / "custom_components/hacs/__init__.py", "# hacs");
        write_file(remote_ / "home-assistant.log", "log");
    }

    TempDir local_{"csync_local"};
    TempDir remote_{"csync_remote"};
    EventBus bus_;
    CountingTransfer transfer_;

    int started_ = 0;
    int planned_ = 0;
    int failed_ = 0;
    std::vector<SyncCompletedEvent> completed_;
    std::vector<std::string> failed_paths_;
};

TEST_F(DirectionControllerTest, PushUpdatesConfigurationAndLeavesRuntimeStateAlone) {
    seed_local();
    seed_remote();

    auto ctrl = controller();
    auto report = ctrl.push(local_.path(), remote_.path());

    ASSERT_TRUE(report.is_ok()) << report.error().describe();
    EXPECT_TRUE(report.value().ok());
    EXPECT_EQ(report.value().result.copied, 2u);
    EXPECT_EQ(report.value().result.deleted, 0u);

    EXPECT_EQ(read_file(remote_ / "configuration.yaml"), "homeassistant:\n  name: new\n");
    EXPECT_EQ(read_file(remote_ / "automations.yaml"), "- id: morning\n");
    EXPECT_EQ(read_file(remote_ / ".storage/auth"), "tokens");
    EXPECT_EQ(read_file(remote_ / ".storage/core.config"), "live copy");
    EXPECT_EQ(read_file(remote_ / "backups/backup.tar"), "archive");
    EXPECT_TRUE(fs::exists(remote_ / "www/logo.png"));
    EXPECT_TRUE(fs::exists(remote_ / "custom_components/hacs/__init__.py"));
    EXPECT_TRUE(fs::exists(remote_ / "home-assistant.log"));
}

TEST_F(DirectionControllerTest, PullKeepsSecretsAndBackupsOnTheInstance) {
    write_file(remote_ / "configuration.yaml", "homeassistant:\n");
    write_file(remote_ / ".storage/auth/tokens.json", "{}");
    write_file(remote_ / ".storage/core/entity_registry", "{\"entities\": []}");
    write_file(remote_ / "backups/backup.tar", "archive");

    auto ctrl = controller();
    auto report = ctrl.pull(remote_.path(), local_.path());

    ASSERT_TRUE(report.is_ok()) << report.error().describe();
    EXPECT_EQ(read_file(local_ / "configuration.yaml"), "homeassistant:\n");
    EXPECT_EQ(read_file(local_ / ".storage/core/entity_registry"), "{\"entities\": []}");
    EXPECT_FALSE(fs::exists(local_ / ".storage/auth/tokens.json"));
    EXPECT_FALSE(fs::exists(local_ / "backups/backup.tar"));
}

TEST_F(DirectionControllerTest, PullRemovesFilesDeletedOnTheInstance) {
    write_file(remote_ / "configuration.yaml", "homeassistant:\n");
    write_file(local_ / "configuration.yaml", "homeassistant:\n");
    write_file(local_ / "packages/removed.yaml", "old package");
    write_file(local_ / ".git/HEAD", "ref: refs/heads/main");

    auto ctrl = controller();
    auto report = ctrl.pull(remote_.path(), local_.path());

    ASSERT_TRUE(report.is_ok()) << report.error().describe();
    EXPECT_EQ(report.value().result.deleted, 2u);
    EXPECT_FALSE(fs::exists(local_ / "packages"));
    EXPECT_TRUE(fs::exists(local_ / ".git/HEAD"));
}

TEST_F(DirectionControllerTest, SecondRunIsConvergedAndSkipsTransfer) {
    seed_local();
    seed_remote();

    auto ctrl = controller();
    ASSERT_TRUE(ctrl.push(local_.path(), remote_.path()).is_ok());
    EXPECT_EQ(transfer_.calls, 1);

    auto second = ctrl.push(local_.path(), remote_.path());
    ASSERT_TRUE(second.is_ok());
    EXPECT_TRUE(second.value().plan.converged());
    EXPECT_EQ(second.value().result.copied, 0u);
    EXPECT_EQ(transfer_.calls, 1);

    auto preview = ctrl.preview(Direction::Push, local_.path(), remote_.path());
    ASSERT_TRUE(preview.is_ok());
    EXPECT_TRUE(preview.value().converged());
}

TEST_F(DirectionControllerTest, PushRemovesDestinationLinkWithoutTouchingItsTarget) {
    seed_local();
    seed_remote();
    write_file(remote_ / ".storage/core/entity_registry", "{\"entities\": []}");
    fs::create_directory_symlink(".storage", remote_ / "storage_link");

    auto ctrl = controller();
    auto report = ctrl.push(local_.path(), remote_.path());

    ASSERT_TRUE(report.is_ok()) << report.error().describe();
    EXPECT_TRUE(report.value().ok());
    EXPECT_FALSE(fs::exists(fs::symlink_status(remote_ / "storage_link")));
    EXPECT_EQ(read_file(remote_ / ".storage/core/entity_registry"), "{\"entities\": []}");
    EXPECT_EQ(read_file(remote_ / ".storage/auth"), "tokens");

    auto again = ctrl.preview(Direction::Push, local_.path(), remote_.path());
    ASSERT_TRUE(again.is_ok()) << again.error().describe();
    EXPECT_TRUE(again.value().converged());
}

TEST_F(DirectionControllerTest, LinkToKeptDirectoryConvergesAfterOnePush) {
    write_file(local_ / "real/f", "same");
    write_file(remote_ / "real/f", "same");
    fs::create_directory_symlink("real", remote_ / "link");

    auto ctrl = controller();
    auto report = ctrl.push(local_.path(), remote_.path());

    ASSERT_TRUE(report.is_ok()) << report.error().describe();
    EXPECT_EQ(report.value().result.deleted, 1u);
    EXPECT_FALSE(fs::exists(fs::symlink_status(remote_ / "link")));
    EXPECT_EQ(read_file(remote_ / "real/f"), "same");

    auto again = ctrl.preview(Direction::Push, local_.path(), remote_.path());
    ASSERT_TRUE(again.is_ok());
    EXPECT_TRUE(again.value().converged());
}

TEST_F(DirectionControllerTest, MissingDestinationIsTreatedAsEmpty) {
    seed_local();
    const auto fresh = remote_ / "not-created-yet";

    auto ctrl = controller();
    auto report = ctrl.push(local_.path(), fresh);

    ASSERT_TRUE(report.is_ok()) << report.error().describe();
    EXPECT_EQ(read_file(fresh / "scripts.yaml"), "{}\n");
    EXPECT_FALSE(fs::exists(fresh / ".storage"));
}

TEST_F(DirectionControllerTest, DryRunLeavesBothTreesUntouched) {
    seed_local();
    seed_remote();

    auto ctrl = controller();
    SyncOptions options;
    options.dry_run = true;
    auto report = ctrl.push(local_.path(), remote_.path(), options);

    ASSERT_TRUE(report.is_ok());
    EXPECT_TRUE(report.value().result.dry_run);
    EXPECT_EQ(report.value().result.copied, 2u);
    EXPECT_EQ(transfer_.calls, 0);
    EXPECT_EQ(read_file(remote_ / "configuration.yaml"), "homeassistant:\n  name: old\n");
}

TEST_F(DirectionControllerTest, EmitsLifecycleEvents) {
    seed_local();
    seed_remote();

    auto ctrl = controller();
    ASSERT_TRUE(ctrl.push(local_.path(), remote_.path()).is_ok());

    EXPECT_EQ(started_, 1);
    EXPECT_EQ(planned_, 1);
    EXPECT_EQ(failed_, 0);
    ASSERT_EQ(completed_.size(), 1u);
    EXPECT_EQ(completed_[0].direction, Direction::Push);
    EXPECT_EQ(completed_[0].copied, 2u);
}

TEST_F(DirectionControllerTest, MissingSourceFailsWithAccessError) {
    auto ctrl = controller();
    auto report = ctrl.push(local_ / "missing", remote_.path());

    ASSERT_TRUE(report.is_error());
    EXPECT_EQ(report.error().code, ErrorCode::Access);
    EXPECT_EQ(started_, 1);
    EXPECT_EQ(failed_, 1);
    EXPECT_TRUE(completed_.empty());
    EXPECT_EQ(transfer_.calls, 0);
}

TEST_F(DirectionControllerTest, PartialFailureIsReportedPerPath) {
    seed_local();
    seed_remote();
    transfer_.injected_failures = {{"automations.yaml", "Permission denied (13)"}};

    auto ctrl = controller();
    auto report = ctrl.push(local_.path(), remote_.path());

    ASSERT_TRUE(report.is_ok());
    EXPECT_FALSE(report.value().ok());
    EXPECT_EQ(report.value().result.copied, 1u);
    ASSERT_EQ(failed_paths_.size(), 1u);
    EXPECT_EQ(failed_paths_[0], "automations.yaml");
}

class DirectionControllerReloadTest : public DirectionControllerTest {
protected:
    ReloadNotifier make_notifier() {
        ReloadSettings settings;
        settings.base_url = "http://homeassistant.local:8123";
        settings.token = "secret-token";
        auto created = ReloadNotifier::create(settings, http_, &bus_);
        EXPECT_TRUE(created.is_ok());
        return std::move(created.value());
    }

    AcceptingTransport http_;
};

TEST_F(DirectionControllerReloadTest, CleanPushReloadsEveryService) {
    seed_local();
    seed_remote();
    auto notifier = make_notifier();

    auto ctrl = controller(&notifier);
    auto report = ctrl.push(local_.path(), remote_.path());

    ASSERT_TRUE(report.is_ok());
    ASSERT_TRUE(report.value().reload.has_value());
    EXPECT_TRUE(report.value().reload->ok());
    EXPECT_EQ(http_.targets.size(), 4u);
    EXPECT_TRUE(report.value().ok());
}

TEST_F(DirectionControllerReloadTest, NoReloadAfterPullDryRunOrFailure) {
    seed_local();
    seed_remote();
    auto notifier = make_notifier();
    auto ctrl = controller(&notifier);

    SyncOptions dry_run;
    dry_run.dry_run = true;
    auto previewed = ctrl.push(local_.path(), remote_.path(), dry_run);
    ASSERT_TRUE(previewed.is_ok());
    EXPECT_FALSE(previewed.value().reload.has_value());

    SyncOptions no_reload;
    no_reload.reload = false;
    auto quiet = ctrl.push(local_.path(), remote_.path(), no_reload);
    ASSERT_TRUE(quiet.is_ok());
    EXPECT_FALSE(quiet.value().reload.has_value());

    auto pulled = ctrl.pull(remote_.path(), local_.path());
    ASSERT_TRUE(pulled.is_ok());
    EXPECT_FALSE(pulled.value().reload.has_value());

    write_file(local_ / "scenes.yaml", "[]\n");
    transfer_.injected_failures = {{"scenes.yaml", "Permission denied (13)"}};
    auto partial = ctrl.push(local_.path(), remote_.path());
    ASSERT_TRUE(partial.is_ok());
    EXPECT_FALSE(partial.value().reload.has_value());

    EXPECT_TRUE(http_.targets.empty());
}
