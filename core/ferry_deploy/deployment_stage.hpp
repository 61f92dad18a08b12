// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_DEPLOYMENT_STAGE_HPP
#define FERRY_DEPLOYMENT_STAGE_HPP

namespace ferry {
namespace deploy {

/**
 * Stages of a deployment, in execution order.
 *
 * Completed, Failed and Cancelled are terminal and mutually exclusive.
 */
enum class DeploymentStage {
  NotStarted = 0,
  LoadingProfile = 1,
  ValidatingConnection = 2,
  BuildingProject = 3,
  ConnectingToServer = 4,
  PreDeploymentSummary = 5,
  UploadingAppOffline = 6,
  UploadingFiles = 7,
  CleaningUpObsoleteFiles = 8,
  DeletingAppOffline = 9,
  RecordingHistory = 10,
  Completed = 11,
  Failed = 12,
  Cancelled = 13
};

const char* stageToString(DeploymentStage stage);

/**
 * Human readable label, e.g. "Uploading files".
 */
const char* stageDisplayName(DeploymentStage stage);

int stageIndex(DeploymentStage stage);

bool isTerminalStage(DeploymentStage stage);

}  // namespace deploy
}  // namespace ferry

#endif  // FERRY_DEPLOYMENT_STAGE_HPP
