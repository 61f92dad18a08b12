// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_DEPLOYMENT_RESULT_HPP
#define FERRY_DEPLOYMENT_RESULT_HPP

#include <chrono>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <vector>

#include "deployment_stage.hpp"
#include "deployment_state.hpp"

namespace ferry {
namespace deploy {

/**
 * Outcome of a finished deployment, built from the final DeploymentState.
 *
 * File and byte counters are clamped to the state totals.
 */
struct DeploymentResult {
  std::string deployment_id;
  bool success = false;
  DeploymentStage final_stage = DeploymentStage::NotStarted;
  Clock::time_point started_at;
  Clock::time_point completed_at;

  int total_files = 0;
  int files_uploaded = 0;
  int files_failed = 0;
  uint64_t total_size = 0;
  uint64_t size_uploaded = 0;
  int obsolete_files_deleted = 0;

  bool was_cancelled = false;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
  std::vector<std::string> failed_files;
  std::exception_ptr error;

  std::string profile_name;
  std::string project_path;
  std::string target_host;
  std::string publish_path;

  std::chrono::milliseconds duration() const;

  /**
   * size_uploaded per second, or std::nullopt for a zero duration.
   */
  std::optional<double> averageSpeed() const;

  /**
   * "12.50 KB/s" style rendering of averageSpeed(), or "N/A".
   */
  std::string formattedUploadSpeed() const;

  static DeploymentResult fromSuccess(const DeploymentState& state);
  static DeploymentResult fromFailure(
    const DeploymentState& state, const std::string& message, std::exception_ptr error
  );
  static DeploymentResult fromCancellation(const DeploymentState& state);
};

}  // namespace deploy
}  // namespace ferry

#endif  // FERRY_DEPLOYMENT_RESULT_HPP
