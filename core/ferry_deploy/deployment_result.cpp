// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "deployment_result.hpp"

#include <algorithm>
#include <cstdio>

namespace ferry {
namespace deploy {

namespace {

DeploymentResult fromState(const DeploymentState& state) {
  DeploymentResult result;
  result.deployment_id = state.deployment_id;
  result.final_stage = state.current_stage;

  const auto now = Clock::now();
  result.started_at = state.started_at.value_or(now);
  result.completed_at = state.completed_at.value_or(now);

  result.total_files = std::max(0, state.total_files);
  result.files_uploaded = std::clamp(state.files_uploaded, 0, result.total_files);
  result.files_failed = std::clamp(state.files_failed, 0, result.total_files);
  result.total_size = state.total_size;
  result.size_uploaded = std::min(state.size_uploaded, state.total_size);
  result.obsolete_files_deleted = std::max(0, state.obsolete_files_deleted);

  result.warnings = state.warnings;
  result.failed_files = state.failed_files;
  result.profile_name = state.profile_name;
  result.project_path = state.project_path;
  result.target_host = state.target_host;
  result.publish_path = state.publish_path;
  return result;
}

}  // namespace

std::chrono::milliseconds DeploymentResult::duration() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(completed_at - started_at);
}

std::optional<double> DeploymentResult::averageSpeed() const {
  const auto ms = duration().count();
  if (ms <= 0) {
    return std::nullopt;
  }
  return static_cast<double>(size_uploaded) / (static_cast<double>(ms) / 1000.0);
}

std::string DeploymentResult::formattedUploadSpeed() const {
  const auto speed = averageSpeed();
  if (!speed) {
    return "N/A";
  }

  char buf[48];
  if (*speed < 1024.0) {
    std::snprintf(buf, sizeof(buf), "%.2f B/s", *speed);
  } else if (*speed < 1024.0 * 1024.0) {
    std::snprintf(buf, sizeof(buf), "%.2f KB/s", *speed / 1024.0);
  } else {
    std::snprintf(buf, sizeof(buf), "%.2f MB/s", *speed / (1024.0 * 1024.0));
  }
  return buf;
}

DeploymentResult DeploymentResult::fromSuccess(const DeploymentState& state) {
  DeploymentResult result = fromState(state);
  result.success = true;
  result.final_stage = DeploymentStage::Completed;
  return result;
}

DeploymentResult DeploymentResult::fromFailure(
  const DeploymentState& state, const std::string& message, std::exception_ptr error
) {
  DeploymentResult result = fromState(state);
  result.success = false;
  result.final_stage = DeploymentStage::Failed;
  result.errors = {message};
  result.error = std::move(error);
  return result;
}

DeploymentResult DeploymentResult::fromCancellation(const DeploymentState& state) {
  DeploymentResult result = fromState(state);
  result.success = false;
  result.final_stage = DeploymentStage::Cancelled;
  result.was_cancelled = true;
  result.errors = {"Deployment was cancelled by user"};
  return result;
}

}  // namespace deploy
}  // namespace ferry
