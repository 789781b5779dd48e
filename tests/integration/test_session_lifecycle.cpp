#include <gtest/gtest.h>
#include <sandkeeper/core/config.hpp>
#include <sandkeeper/core/resource_manager.hpp>
#include <sandkeeper/sync/workspace_sync.hpp>
#include <sandkeeper/utils/hash_utils.hpp>

#include "support/fake_transport.hpp"

#include <chrono>
#include <fstream>
#include <random>

using namespace sandkeeper;
using namespace sandkeeper::core;
using namespace sandkeeper::fakes;
using sandkeeper::sync::SyncConfig;
using sandkeeper::sync::UploadStatus;
using sandkeeper::sync::UploadStrategy;
using sandkeeper::sync::WorkspaceSync;
using sandkeeper::utils::HashUtils;
namespace fs = std::filesystem;

namespace {

void WriteFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream file(path, std::ios::binary);
    file << content;
}

} // namespace

class SessionLifecycleTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeProvisioningService> service_ = std::make_shared<FakeProvisioningService>();
    ManagerConfig config_;
    fs::path base_;

    void SetUp() override {
        config_ = ManagerBuilder()
            .WithApiBase(FakeProvisioningService::kApiBase)
            .WithMaxParallelAcquisitions(2)
            .Build();

        std::random_device rd;
        base_ = fs::temp_directory_path() /
                ("sandkeeper_session_" + std::to_string(rd()) + "_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(base_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(base_, ec);
    }
};

// ===========================================================================
// Full session
// ===========================================================================

TEST_F(SessionLifecycleTest, AcquireSyncAndRelease) {
    auto initial = base_ / "initial_workspace";
    auto final_dir = base_ / "agent_workspace";
    WriteFile(initial / "README.md", "# task\n");
    WriteFile(initial / "data" / "input.json", R"({"items": [1, 2, 3]})");
    WriteFile(initial / "data" / "nested" / "deep.txt", std::string(100000, 'z'));

    SandboxResourceManager manager(config_, "integration-key", service_);

    auto overrides = manager.AcquireMany({"filesystem", "terminal", "emails", "github"});

    ASSERT_EQ(overrides.size(), 4u);
    EXPECT_NE(overrides.at("filesystem").find("/filesystem/mcp"), std::string::npos);
    EXPECT_NE(overrides.at("terminal").find("/terminal/mcp"), std::string::npos);
    EXPECT_EQ(manager.TrackedCount(), 3u);
    EXPECT_EQ(service_->LiveIds().size(), 3u);

    auto sandbox_id = manager.FindSandboxId("local_dev");
    ASSERT_TRUE(sandbox_id.has_value());

    WorkspaceSync sync(manager.Client());

    auto upload = sync.Upload(*sandbox_id, initial);
    EXPECT_EQ(upload.status, UploadStatus::UPLOADED);
    EXPECT_EQ(upload.file_count, 3u);
    EXPECT_EQ(upload.archive_sha256, HashUtils::ComputeSHA256(service_->WorkspaceOf(*sandbox_id)));

    auto download = sync.Download(*sandbox_id, final_dir);
    EXPECT_EQ(download.extracted.files, 3u);

    auto before = HashUtils::BuildManifest(initial);
    auto after = HashUtils::BuildManifest(final_dir);
    ASSERT_EQ(before.size(), after.size());
    for (std::size_t i = 0; i < before.size(); ++i) {
        EXPECT_EQ(before[i].relative_path, after[i].relative_path);
        EXPECT_EQ(before[i].sha256, after[i].sha256);
    }

    manager.ReleaseAll();
    EXPECT_TRUE(service_->LiveIds().empty());
    EXPECT_EQ(service_->ReleasedIds().size(), 3u);
}

TEST_F(SessionLifecycleTest, MultipartUploadRoundTrips) {
    auto initial = base_ / "initial_workspace";
    auto final_dir = base_ / "agent_workspace";
    WriteFile(initial / "notes.txt", "multipart\n");
    WriteFile(initial / "src" / "app.py", "print('ok')\n");
    WriteFile(initial / "src" / "blob.bin", std::string(70000, '\x7f'));

    SandboxResourceManager manager(config_, "integration-key", service_);
    manager.AcquireMany({"filesystem"});
    auto sandbox_id = manager.FindSandboxId("local_dev");
    ASSERT_TRUE(sandbox_id.has_value());

    SyncConfig sync_config;
    sync_config.strategy_by_resource_type["local_dev"] = UploadStrategy::DIRECT_MULTIPART;
    WorkspaceSync sync(manager.Client(), sync_config);

    auto upload = sync.Upload(*sandbox_id, initial);
    EXPECT_EQ(upload.status, UploadStatus::UPLOADED);
    EXPECT_EQ(upload.strategy, UploadStrategy::DIRECT_MULTIPART);
    EXPECT_EQ(upload.file_count, 3u);

    auto download = sync.Download(*sandbox_id, final_dir);
    EXPECT_EQ(download.extracted.files, 3u);

    auto before = HashUtils::BuildManifest(initial);
    auto after = HashUtils::BuildManifest(final_dir);
    ASSERT_EQ(before.size(), after.size());
    for (std::size_t i = 0; i < before.size(); ++i) {
        EXPECT_EQ(before[i].relative_path, after[i].relative_path);
        EXPECT_EQ(before[i].sha256, after[i].sha256);
    }
}

TEST_F(SessionLifecycleTest, EmptyWorkspaceTouchesNothingRemote) {
    auto empty = base_ / "empty";
    fs::create_directories(empty);

    SandboxResourceManager manager(config_, "integration-key", service_);
    manager.AcquireMany({"filesystem"});
    auto calls_after_acquire = service_->CallCount();

    WorkspaceSync sync(manager.Client());
    auto result = sync.Upload(*manager.FindSandboxId("local_dev"), empty);

    EXPECT_EQ(result.status, UploadStatus::NOTHING_TO_UPLOAD);
    EXPECT_EQ(service_->CallCount(), calls_after_acquire);
}

TEST_F(SessionLifecycleTest, MissingSharedEndpointStillReleasesSandbox) {
    service_->grouped_endpoint_keys = {"filesystem"};

    {
        SandboxResourceManager manager(config_, "integration-key", service_);
        auto overrides = manager.AcquireMany({"filesystem", "terminal"});

        EXPECT_EQ(overrides.count("filesystem"), 1u);
        EXPECT_EQ(overrides.count("terminal"), 0u);
    }

    // Destructor released the shared sandbox
    EXPECT_TRUE(service_->LiveIds().empty());
    EXPECT_EQ(service_->ReleasedIds().size(), 1u);
}

TEST_F(SessionLifecycleTest, RepeatedSessionsDoNotLeak) {
    SandboxResourceManager manager(config_, "integration-key", service_);

    for (int round = 0; round < 3; ++round) {
        auto overrides = manager.AcquireMany({"filesystem", "emails"});
        EXPECT_EQ(overrides.size(), 2u);
        manager.ReleaseAll();
        EXPECT_TRUE(service_->LiveIds().empty());
    }
    EXPECT_EQ(service_->ReleasedIds().size(), 6u);
}
