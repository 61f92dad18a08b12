// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for DeploymentOrchestrator
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "deploy_mocks.hpp"
#include "deployment_orchestrator.hpp"
#include "ferry_errors.hpp"

namespace fs = std::filesystem;

using namespace ferry;
using namespace ferry::deploy;
using namespace ferry::deploy::test;
using ::testing::_;
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Throw;

class DeploymentOrchestratorTest : public ::testing::Test {
protected:
  void SetUp() override {
    publish_dir_ = fs::temp_directory_path() /
                   (std::string("ferry_orchestrator_test_") +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(publish_dir_);
    writeFile("app.dll", std::string(2048, 'x'));
    writeFile("web.config", "<configuration />");
    writeFile("wwwroot/css/site.css", "body{}");

    profile_.name = "production";
    profile_.server = "web01";
    profile_.username = "deploy";
    profile_.password = "secret";
    profile_.remote_path = "/site";
    profile_.project_path = "/src/Site/Site.csproj";
    profile_.concurrency = 2;
    profile_.retry_count = 3;

    options_.profile_name = "production";
    options_.skip_confirmation = true;
    options_.output_dir = publish_dir_.string();

    ON_CALL(profiles_, loadProfile(_)).WillByDefault(Invoke([this](const std::string& name) {
      if (name != profile_.name) {
        throw ProfileNotFoundError(name);
      }
      return profile_;
    }));
    ON_CALL(build_tool_, build(_, _, _, _))
      .WillByDefault(Invoke([](const std::string&, const std::string& output_dir,
                               const std::string&, const CancellationToken*) {
        BuildResult result;
        result.success = true;
        result.exit_code = 0;
        result.output_path = output_dir;
        return result;
      }));

    orchestrator_ =
      std::make_unique<DeploymentOrchestrator>(profiles_, build_tool_, factory_, history_);
    orchestrator_->setRetrySleepFunction(
      [this](std::chrono::milliseconds delay, const CancellationToken*) {
        std::lock_guard<std::mutex> lock(mutex_);
        sleeps_.push_back(delay.count());
        return false;
      }
    );
    orchestrator_->setStageChangedCallback(
      [this](DeploymentStage, DeploymentStage new_stage, Clock::time_point) {
        std::lock_guard<std::mutex> lock(mutex_);
        stages_.push_back(new_stage);
      }
    );
  }

  void TearDown() override {
    orchestrator_.reset();
    std::error_code ec;
    fs::remove_all(publish_dir_, ec);
  }

  void writeFile(const std::string& relative, const std::string& content) {
    const fs::path path = publish_dir_ / relative;
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
  }

  bool hasStage(DeploymentStage stage) {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::find(stages_.begin(), stages_.end(), stage) != stages_.end();
  }

  FakeRemoteServer server_;
  FakeServerClientFactory factory_{server_};
  NiceMock<MockProfileProvider> profiles_;
  NiceMock<MockBuildTool> build_tool_;
  NiceMock<MockDeploymentHistory> history_;
  std::unique_ptr<DeploymentOrchestrator> orchestrator_;

  fs::path publish_dir_;
  DeploymentProfile profile_;
  DeploymentOptions options_;

  std::mutex mutex_;
  std::vector<long long> sleeps_;
  std::vector<DeploymentStage> stages_;
};

// ============================================================================
// Successful runs
// ============================================================================

TEST_F(DeploymentOrchestratorTest, SuccessfulDeploymentRunsEveryStage) {
  EXPECT_CALL(history_, addEntry(Field(&HistoryEntry::success, true))).Times(1);

  auto result = orchestrator_->deploy(options_);

  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.final_stage, DeploymentStage::Completed);
  EXPECT_EQ(result.total_files, 3);
  EXPECT_EQ(result.files_uploaded, 3);
  EXPECT_EQ(result.files_failed, 0);
  EXPECT_EQ(result.total_size, 2048u + 17u + 6u);
  EXPECT_EQ(result.size_uploaded, result.total_size);
  EXPECT_EQ(result.profile_name, "production");
  EXPECT_EQ(result.target_host, "web01");
  EXPECT_TRUE(result.errors.empty());

  EXPECT_THAT(
    stages_, ElementsAre(
               DeploymentStage::LoadingProfile, DeploymentStage::ValidatingConnection, DeploymentStage::BuildingProject,
               DeploymentStage::ConnectingToServer, DeploymentStage::PreDeploymentSummary,
               DeploymentStage::UploadingAppOffline, DeploymentStage::UploadingFiles,
               DeploymentStage::DeletingAppOffline, DeploymentStage::RecordingHistory,
               DeploymentStage::Completed
             )
  );

  EXPECT_TRUE(server_.hasFile("/site/app.dll"));
  EXPECT_TRUE(server_.hasFile("/site/web.config"));
  EXPECT_TRUE(server_.hasFile("/site/wwwroot/css/site.css"));
  EXPECT_FALSE(server_.hasFile("/site/app_offline.htm"));

  const auto ops = server_.operations();
  ASSERT_FALSE(ops.empty());
  EXPECT_EQ(ops.front(), "upload:/site/app_offline.htm");
  EXPECT_EQ(ops.back(), "delete:/site/app_offline.htm");

  EXPECT_FALSE(orchestrator_->isRunning());
  EXPECT_TRUE(orchestrator_->currentState().isSuccess());
  EXPECT_TRUE(fs::exists(publish_dir_));
}

TEST_F(DeploymentOrchestratorTest, DisabledStagesAreNeverEntered) {
  options_.use_app_offline = false;
  options_.cleanup_mode = CleanupMode::None;
  options_.skip_connection_test = true;

  auto result = orchestrator_->deploy(options_);

  EXPECT_TRUE(result.success);
  EXPECT_FALSE(hasStage(DeploymentStage::ValidatingConnection));
  EXPECT_FALSE(hasStage(DeploymentStage::UploadingAppOffline));
  EXPECT_FALSE(hasStage(DeploymentStage::CleaningUpObsoleteFiles));
  EXPECT_FALSE(hasStage(DeploymentStage::DeletingAppOffline));
  EXPECT_TRUE(hasStage(DeploymentStage::UploadingFiles));
  EXPECT_EQ(server_.countOperations("upload:/site/app_offline.htm"), 0);
}

TEST_F(DeploymentOrchestratorTest, ProfileCanDisableAppOffline) {
  profile_.app_offline_enabled = false;

  auto result = orchestrator_->deploy(options_);

  EXPECT_TRUE(result.success);
  EXPECT_FALSE(hasStage(DeploymentStage::UploadingAppOffline));
  EXPECT_EQ(server_.countOperations("upload:/site/app_offline.htm"), 0);
}

TEST_F(DeploymentOrchestratorTest, OptionsOverrideProfile) {
  options_.build_configuration = "Debug";
  options_.max_concurrency = 1;
  options_.target_host = "web02";
  EXPECT_CALL(build_tool_, build("/src/Site/Site.csproj", publish_dir_.string(), "Debug", _));

  auto result = orchestrator_->deploy(options_);

  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.target_host, "web02");
  EXPECT_EQ(factory_.lastConfig().host, "web02");
  EXPECT_EQ(factory_.lastConfig().remote_root, "/site");
}

TEST_F(DeploymentOrchestratorTest, ProgressCallbackMirrorsUploads) {
  std::mutex progress_mutex;
  DeploymentState last;
  int calls = 0;
  orchestrator_->setProgressUpdatedCallback([&](const DeploymentState& state) {
    std::lock_guard<std::mutex> lock(progress_mutex);
    last = state;
    ++calls;
  });

  orchestrator_->deploy(options_);

  EXPECT_GT(calls, 3);
  EXPECT_EQ(last.files_uploaded, 3);
  EXPECT_EQ(last.size_uploaded, last.total_size);
  EXPECT_DOUBLE_EQ(last.progressPercentage(), 100.0);
}

TEST_F(DeploymentOrchestratorTest, DryRunStopsAfterSummary) {
  options_.dry_run = true;
  EXPECT_CALL(history_, addEntry(_)).Times(0);

  auto result = orchestrator_->deploy(options_);

  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.total_files, 3);
  EXPECT_EQ(result.files_uploaded, 0);
  EXPECT_TRUE(server_.operations().empty());
  ASSERT_GE(stages_.size(), 2u);
  EXPECT_EQ(stages_[stages_.size() - 2], DeploymentStage::PreDeploymentSummary);
  EXPECT_EQ(stages_.back(), DeploymentStage::Completed);
}

TEST_F(DeploymentOrchestratorTest, TransientConnectFailuresAreRetried) {
  server_.failNextConnects(2);

  auto result = orchestrator_->deploy(options_);

  EXPECT_TRUE(result.success);
  EXPECT_THAT(sleeps_, ElementsAre(1000, 2000));
}

TEST_F(DeploymentOrchestratorTest, ThrowingStageListenerDoesNotChangeOutcome) {
  orchestrator_->setStageChangedCallback(
    [this](DeploymentStage, DeploymentStage new_stage, Clock::time_point) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        stages_.push_back(new_stage);
      }
      if (new_stage == DeploymentStage::BuildingProject ||
          new_stage == DeploymentStage::Completed) {
        throw std::runtime_error("listener failed");
      }
    }
  );

  DeploymentResult result;
  ASSERT_NO_THROW(result = orchestrator_->deploy(options_));

  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.final_stage, DeploymentStage::Completed);
  EXPECT_TRUE(orchestrator_->currentState().isSuccess());
  EXPECT_EQ(stages_.back(), DeploymentStage::Completed);
  EXPECT_FALSE(hasStage(DeploymentStage::Failed));
  EXPECT_FALSE(orchestrator_->isRunning());
}

TEST_F(DeploymentOrchestratorTest, HistoryFailureIsOnlyAWarning) {
  EXPECT_CALL(history_, addEntry(_)).WillOnce(Throw(std::runtime_error("disk full")));

  auto result = orchestrator_->deploy(options_);

  EXPECT_TRUE(result.success);
  EXPECT_THAT(result.warnings, Contains(HasSubstr("disk full")));
}

// ============================================================================
// Cleanup
// ============================================================================

class DeploymentCleanupTest : public DeploymentOrchestratorTest {
protected:
  void SetUp() override {
    DeploymentOrchestratorTest::SetUp();
    server_.addFile("/site/old.dll");
    server_.addFile("/site/legacy/a.js");
    server_.addFile("/site/legacy/b.js");
    server_.addFile("/site/App_Data/site.db");
    server_.addFile("/site/uploads/photo.png");
  }
};

TEST_F(DeploymentCleanupTest, DeleteObsoleteKeepsExcludedFiles) {
  options_.cleanup_mode = CleanupMode::DeleteObsolete;

  auto result = orchestrator_->deploy(options_);

  ASSERT_TRUE(result.success);
  EXPECT_TRUE(hasStage(DeploymentStage::CleaningUpObsoleteFiles));
  EXPECT_EQ(result.obsolete_files_deleted, 3);
  EXPECT_EQ(orchestrator_->currentState().obsolete_files_count, 3);

  EXPECT_FALSE(server_.hasFile("/site/old.dll"));
  EXPECT_FALSE(server_.hasFile("/site/legacy/a.js"));
  EXPECT_FALSE(server_.hasFile("/site/legacy/b.js"));
  EXPECT_EQ(server_.countOperations("rmdir:/site/legacy"), 1);

  EXPECT_TRUE(server_.hasFile("/site/App_Data/site.db"));
  EXPECT_TRUE(server_.hasFile("/site/uploads/photo.png"));
  EXPECT_TRUE(server_.hasFile("/site/app.dll"));
}

TEST_F(DeploymentCleanupTest, DeleteAllIgnoresExclusions) {
  options_.cleanup_mode = CleanupMode::DeleteAll;

  auto result = orchestrator_->deploy(options_);

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.obsolete_files_deleted, 5);
  EXPECT_FALSE(server_.hasFile("/site/App_Data/site.db"));
  EXPECT_FALSE(server_.hasFile("/site/uploads/photo.png"));
  EXPECT_EQ(server_.countOperations("rmdir:/site/App_Data"), 1);
  EXPECT_TRUE(server_.hasFile("/site/web.config"));
}

TEST_F(DeploymentCleanupTest, ProfileCleanupModeIsTheDefault) {
  profile_.cleanup_mode = CleanupMode::DeleteObsolete;

  auto result = orchestrator_->deploy(options_);

  EXPECT_TRUE(result.success);
  EXPECT_FALSE(server_.hasFile("/site/old.dll"));
}

TEST_F(DeploymentCleanupTest, DeleteFailureBecomesWarning) {
  options_.cleanup_mode = CleanupMode::DeleteObsolete;
  server_.failDeletesOf("/site/old.dll");

  auto result = orchestrator_->deploy(options_);

  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.obsolete_files_deleted, 2);
  EXPECT_THAT(result.warnings, Contains(HasSubstr("Failed to delete obsolete file 'old.dll'")));
  EXPECT_TRUE(server_.hasFile("/site/old.dll"));
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(DeploymentOrchestratorTest, MissingProfileFailsAtLoadingProfile) {
  options_.profile_name = "missing";
  EXPECT_CALL(build_tool_, build(_, _, _, _)).Times(0);

  auto result = orchestrator_->deploy(options_);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.final_stage, DeploymentStage::Failed);
  ASSERT_EQ(result.errors.size(), 1u);
  EXPECT_EQ(
    result.errors[0], "Deployment failed at stage LoadingProfile: Profile 'missing' was not found."
  );
  EXPECT_THROW(std::rethrow_exception(result.error), ProfileNotFoundError);
  EXPECT_EQ(factory_.created.load(), 0);
}

TEST_F(DeploymentOrchestratorTest, InvalidProfileFailsValidation) {
  profile_.server = "";

  auto result = orchestrator_->deploy(options_);

  EXPECT_FALSE(result.success);
  EXPECT_THROW(std::rethrow_exception(result.error), ProfileValidationError);
  EXPECT_THAT(result.errors[0], HasSubstr("Server host cannot be empty."));
}

TEST_F(DeploymentOrchestratorTest, MissingProjectPathFails) {
  profile_.project_path = "";

  auto result = orchestrator_->deploy(options_);

  EXPECT_FALSE(result.success);
  EXPECT_THROW(std::rethrow_exception(result.error), ConfigurationError);
}

TEST_F(DeploymentOrchestratorTest, BuildFailureStopsBeforeUpload) {
  EXPECT_CALL(build_tool_, build(_, _, _, _)).WillOnce(Invoke([](auto&&...) {
    BuildResult result;
    result.success = false;
    result.exit_code = 1;
    result.errors = {"Program.cs(3,5): error CS1002: ; expected"};
    return result;
  }));
  EXPECT_CALL(history_, addEntry(Field(&HistoryEntry::success, false))).Times(1);

  auto result = orchestrator_->deploy(options_);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.final_stage, DeploymentStage::Failed);
  EXPECT_EQ(
    result.errors[0],
    "Deployment failed at stage BuildingProject: Build compilation failed with 1 error(s)."
  );
  EXPECT_THROW(std::rethrow_exception(result.error), BuildCompilationError);
  EXPECT_TRUE(server_.operations().empty());
  EXPECT_EQ(stages_.back(), DeploymentStage::Failed);
}

TEST_F(DeploymentOrchestratorTest, UploadFailureListsFilesAndLeavesErrorPage) {
  server_.failUploadsOf("/site/app.dll");

  auto result = orchestrator_->deploy(options_);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(
    result.errors[0], "Deployment failed at stage UploadingFiles: Failed to upload 1 file(s): app.dll"
  );
  EXPECT_THAT(result.failed_files, ElementsAre("app.dll"));
  EXPECT_EQ(result.files_uploaded, 2);
  EXPECT_EQ(result.files_failed, 1);
  EXPECT_THROW(std::rethrow_exception(result.error), DeploymentError);

  // four attempts with exponential backoff
  EXPECT_THAT(sleeps_, ElementsAre(1000, 2000, 4000));

  // the maintenance page is replaced by the error page and left in place
  EXPECT_EQ(server_.countOperations("upload:/site/app_offline.htm"), 2);
  EXPECT_TRUE(server_.hasFile("/site/app_offline.htm"));
  EXPECT_FALSE(hasStage(DeploymentStage::DeletingAppOffline));
}

// ============================================================================
// Cancellation
// ============================================================================

TEST_F(DeploymentOrchestratorTest, CancelWhenIdleReturnsFalse) {
  EXPECT_FALSE(orchestrator_->cancel());
}

TEST_F(DeploymentOrchestratorTest, CancelDuringBuild) {
  EXPECT_CALL(build_tool_, build(_, _, _, _))
    .WillOnce(Invoke([this](const std::string&, const std::string& output_dir,
                            const std::string&, const CancellationToken*) {
      EXPECT_TRUE(orchestrator_->cancel());
      BuildResult result;
      result.success = true;
      result.output_path = output_dir;
      return result;
    }));
  EXPECT_CALL(history_, addEntry(_)).Times(0);

  auto result = orchestrator_->deploy(options_);

  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.was_cancelled);
  EXPECT_EQ(result.final_stage, DeploymentStage::Cancelled);
  EXPECT_THAT(result.errors, ElementsAre("Deployment was cancelled by user"));
  EXPECT_TRUE(orchestrator_->currentState().cancellation_requested);
  EXPECT_TRUE(server_.operations().empty());
}

TEST_F(DeploymentOrchestratorTest, CancelDuringUploadKeepsPartialCounters) {
  profile_.concurrency = 1;
  server_.setUploadHook([this](const std::string& remote_path) {
    if (remote_path != "/site/app_offline.htm") {
      orchestrator_->cancel();
    }
  });
  EXPECT_CALL(history_, addEntry(_)).Times(0);

  auto result = orchestrator_->deploy(options_);

  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.was_cancelled);
  EXPECT_EQ(result.final_stage, DeploymentStage::Cancelled);
  EXPECT_THAT(result.errors, ElementsAre("Deployment was cancelled by user"));
  EXPECT_EQ(result.total_files, 3);
  EXPECT_GE(result.files_uploaded, 1);
  EXPECT_LE(result.files_uploaded, result.total_files - 1);
  EXPECT_GT(result.size_uploaded, 0u);

  EXPECT_TRUE(hasStage(DeploymentStage::UploadingFiles));
  EXPECT_FALSE(hasStage(DeploymentStage::CleaningUpObsoleteFiles));
  EXPECT_FALSE(hasStage(DeploymentStage::DeletingAppOffline));
  EXPECT_FALSE(hasStage(DeploymentStage::RecordingHistory));
  EXPECT_EQ(stages_.back(), DeploymentStage::Cancelled);

  EXPECT_TRUE(server_.hasFile("/site/app_offline.htm"));
  EXPECT_EQ(server_.countOperations("delete:/site/app_offline.htm"), 0);
  EXPECT_TRUE(orchestrator_->currentState().cancellation_requested);
}

TEST_F(DeploymentOrchestratorTest, DeclinedConfirmationCancels) {
  options_.skip_confirmation = false;
  int total_files_seen = -1;
  orchestrator_->setConfirmationCallback([&](const DeploymentState& state) {
    total_files_seen = state.total_files;
    return false;
  });

  auto result = orchestrator_->deploy(options_);

  EXPECT_EQ(total_files_seen, 3);
  EXPECT_TRUE(result.was_cancelled);
  EXPECT_TRUE(server_.operations().empty());
}

TEST_F(DeploymentOrchestratorTest, SecondDeployWhileRunningIsRejected) {
  EXPECT_CALL(build_tool_, build(_, _, _, _))
    .WillOnce(Invoke([this](const std::string&, const std::string& output_dir,
                            const std::string&, const CancellationToken*) {
      EXPECT_THROW(orchestrator_->deploy(options_), std::logic_error);
      BuildResult result;
      result.success = true;
      result.output_path = output_dir;
      return result;
    }));

  auto result = orchestrator_->deploy(options_);
  EXPECT_TRUE(result.success);
}
