// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "deployment_state.hpp"

#include <cstdio>
#include <random>
#include <stdexcept>

namespace ferry {
namespace deploy {

std::string generateDeploymentId() {
  thread_local std::mt19937_64 rng(std::random_device{}());
  char buf[33];
  std::snprintf(
    buf, sizeof(buf), "%016llx%016llx", static_cast<unsigned long long>(rng()),
    static_cast<unsigned long long>(rng())
  );
  return buf;
}

void DeploymentState::start() {
  const auto now = Clock::now();
  started_at = now;
  stage_started_at = now;
  completed_at.reset();
  current_stage = DeploymentStage::LoadingProfile;
  can_cancel = true;
}

void DeploymentState::updateStage(DeploymentStage stage) {
  if (isTerminalStage(current_stage)) {
    throw std::logic_error(
      std::string("Cannot leave terminal stage ") + stageToString(current_stage) + "."
    );
  }
  if (!isTerminalStage(stage) && stageIndex(stage) < stageIndex(current_stage)) {
    throw std::logic_error(
      std::string("Cannot move from stage ") + stageToString(current_stage) + " back to " +
      stageToString(stage) + "."
    );
  }
  current_stage = stage;
  stage_started_at = Clock::now();
}

void DeploymentState::complete(DeploymentStage terminal_stage) {
  if (!isTerminalStage(terminal_stage)) {
    throw std::invalid_argument(
      std::string(stageToString(terminal_stage)) + " is not a terminal stage."
    );
  }
  updateStage(terminal_stage);
  completed_at = stage_started_at;
  can_cancel = false;
}

double DeploymentState::progressPercentage() const {
  if (total_files <= 0) {
    return 0.0;
  }
  return static_cast<double>(files_uploaded) * 100.0 / static_cast<double>(total_files);
}

std::chrono::milliseconds DeploymentState::elapsed() const {
  if (!started_at) {
    return std::chrono::milliseconds(0);
  }
  const auto end = completed_at ? *completed_at : Clock::now();
  return std::chrono::duration_cast<std::chrono::milliseconds>(end - *started_at);
}

bool DeploymentState::isInProgress() const {
  return current_stage != DeploymentStage::NotStarted && !isTerminalStage(current_stage);
}

}  // namespace deploy
}  // namespace ferry
