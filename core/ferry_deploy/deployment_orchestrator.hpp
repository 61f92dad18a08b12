// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_DEPLOYMENT_ORCHESTRATOR_HPP
#define FERRY_DEPLOYMENT_ORCHESTRATOR_HPP

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "app_offline_manager.hpp"
#include "build_tool.hpp"
#include "cancellation_token.hpp"
#include "deployment_history.hpp"
#include "deployment_options.hpp"
#include "deployment_profile.hpp"
#include "deployment_result.hpp"
#include "deployment_state.hpp"
#include "retry_handler.hpp"
#include "transfer_client.hpp"

namespace ferry {
namespace deploy {

using StageChangedCallback =
  std::function<void(DeploymentStage old_stage, DeploymentStage new_stage, Clock::time_point at)>;
using DeploymentProgressCallback = std::function<void(const DeploymentState& state)>;
using ConfirmationCallback = std::function<bool(const DeploymentState& state)>;

/**
 * Runs one deployment end to end:
 *
 *   LoadingProfile -> ValidatingConnection -> BuildingProject ->
 *   ConnectingToServer -> PreDeploymentSummary -> UploadingAppOffline ->
 *   UploadingFiles -> CleaningUpObsoleteFiles -> DeletingAppOffline ->
 *   RecordingHistory -> Completed
 *
 * Optional stages are skipped, never entered. Any exception ends the run in
 * Failed, OperationCancelled ends it in Cancelled. deploy() itself does not
 * throw for deployment errors; they are reported in the DeploymentResult.
 *
 * Callbacks run synchronously on the thread that triggered them, which may
 * be a transfer worker during UploadingFiles. A stage listener that throws
 * is logged and does not change the outcome.
 */
class DeploymentOrchestrator {
public:
  DeploymentOrchestrator(
    IProfileProvider& profiles, IBuildTool& build_tool,
    transfer::ITransferClientFactory& client_factory, IDeploymentHistory& history
  );
  ~DeploymentOrchestrator();

  DeploymentOrchestrator(const DeploymentOrchestrator&) = delete;
  DeploymentOrchestrator& operator=(const DeploymentOrchestrator&) = delete;

  /**
   * @throws std::logic_error if a deployment is already running
   */
  DeploymentResult deploy(const DeploymentOptions& options);

  /**
   * Request cancellation of the running deployment. Thread-safe.
   *
   * @return false when nothing is running
   */
  bool cancel();

  /**
   * Snapshot of the live state.
   */
  DeploymentState currentState() const;

  bool isRunning() const { return running_.load(); }

  void setStageChangedCallback(StageChangedCallback callback);
  void setProgressUpdatedCallback(DeploymentProgressCallback callback);
  void setConfirmationCallback(ConfirmationCallback callback);

  /**
   * Replace the backoff sleep of connection retries and per-file retries.
   */
  void setRetrySleepFunction(transfer::RetrySleepFunction sleep);

  AppOfflineManager& appOfflineManager() { return app_offline_; }

private:
  struct RunContext;

  void runStages(RunContext& ctx);
  void loadProfile(RunContext& ctx);
  void validateConnection(RunContext& ctx);
  void buildProject(RunContext& ctx);
  void connectToServer(RunContext& ctx);
  void preDeploymentSummary(RunContext& ctx);
  void uploadAppOffline(RunContext& ctx);
  void uploadFiles(RunContext& ctx);
  void cleanupObsoleteFiles(RunContext& ctx);
  void deleteAppOffline(RunContext& ctx);
  void recordHistory(RunContext& ctx);

  void showErrorPage(RunContext& ctx, const std::string& message);
  void releaseResources(RunContext& ctx);

  transfer::RetryHandler makeRetryHandler(const RunContext& ctx) const;

  void enterStage(DeploymentStage stage);
  void finish(DeploymentStage terminal_stage);
  void notifyStageChanged(
    DeploymentStage old_stage, DeploymentStage new_stage, Clock::time_point at
  );
  void addWarning(const std::string& warning);
  void publishProgress();

  IProfileProvider& profiles_;
  IBuildTool& build_tool_;
  transfer::ITransferClientFactory& client_factory_;
  IDeploymentHistory& history_;
  AppOfflineManager app_offline_;

  mutable std::mutex state_mutex_;
  DeploymentState state_;

  CancellationToken token_;
  std::atomic<bool> running_{false};

  StageChangedCallback stage_callback_;
  DeploymentProgressCallback progress_callback_;
  ConfirmationCallback confirmation_callback_;
  transfer::RetrySleepFunction sleep_;
};

}  // namespace deploy
}  // namespace ferry

#endif  // FERRY_DEPLOYMENT_ORCHESTRATOR_HPP
