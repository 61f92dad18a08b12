// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_DEPLOYMENT_STATE_HPP
#define FERRY_DEPLOYMENT_STATE_HPP

#include <chrono>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <vector>

#include "deployment_stage.hpp"

namespace ferry {
namespace deploy {

using Clock = std::chrono::system_clock;

/**
 * Random 32 character lowercase hex identifier.
 */
std::string generateDeploymentId();

/**
 * Mutable progress record of one deployment.
 *
 * Owned by the orchestrator and guarded by its state mutex; callbacks receive
 * copies.
 */
struct DeploymentState {
  std::string deployment_id = generateDeploymentId();
  DeploymentStage current_stage = DeploymentStage::NotStarted;
  std::optional<Clock::time_point> started_at;
  std::optional<Clock::time_point> stage_started_at;
  std::optional<Clock::time_point> completed_at;

  std::string profile_name;
  std::string project_path;
  std::string target_host;
  std::string publish_path;

  int total_files = 0;
  int files_uploaded = 0;
  int files_failed = 0;
  uint64_t total_size = 0;
  uint64_t size_uploaded = 0;
  int obsolete_files_count = 0;
  int obsolete_files_deleted = 0;

  bool can_cancel = true;
  bool cancellation_requested = false;

  std::string error_message;
  std::exception_ptr error;
  std::vector<std::string> warnings;
  std::vector<std::string> failed_files;

  /**
   * Enter LoadingProfile and stamp the start time.
   */
  void start();

  /**
   * Move to stage.
   *
   * @throws std::logic_error when moving backwards or leaving a terminal stage
   */
  void updateStage(DeploymentStage stage);

  /**
   * Enter a terminal stage and stamp completed_at.
   *
   * @throws std::invalid_argument if terminal_stage is not terminal
   */
  void complete(DeploymentStage terminal_stage);

  double progressPercentage() const;

  /**
   * Time since start, up to completed_at once finished. Zero before start().
   */
  std::chrono::milliseconds elapsed() const;

  bool isInProgress() const;
  bool isCompleted() const { return isTerminalStage(current_stage); }
  bool isSuccess() const { return current_stage == DeploymentStage::Completed; }
  bool isFailed() const { return current_stage == DeploymentStage::Failed; }
  bool isCancelled() const { return current_stage == DeploymentStage::Cancelled; }
};

}  // namespace deploy
}  // namespace ferry

#endif  // FERRY_DEPLOYMENT_STATE_HPP
