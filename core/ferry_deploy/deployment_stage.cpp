// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "deployment_stage.hpp"

namespace ferry {
namespace deploy {

const char* stageToString(DeploymentStage stage) {
  switch (stage) {
    case DeploymentStage::NotStarted:
      return "NotStarted";
    case DeploymentStage::LoadingProfile:
      return "LoadingProfile";
    case DeploymentStage::ValidatingConnection:
      return "ValidatingConnection";
    case DeploymentStage::BuildingProject:
      return "BuildingProject";
    case DeploymentStage::ConnectingToServer:
      return "ConnectingToServer";
    case DeploymentStage::PreDeploymentSummary:
      return "PreDeploymentSummary";
    case DeploymentStage::UploadingAppOffline:
      return "UploadingAppOffline";
    case DeploymentStage::UploadingFiles:
      return "UploadingFiles";
    case DeploymentStage::CleaningUpObsoleteFiles:
      return "CleaningUpObsoleteFiles";
    case DeploymentStage::DeletingAppOffline:
      return "DeletingAppOffline";
    case DeploymentStage::RecordingHistory:
      return "RecordingHistory";
    case DeploymentStage::Completed:
      return "Completed";
    case DeploymentStage::Failed:
      return "Failed";
    case DeploymentStage::Cancelled:
      return "Cancelled";
  }
  return "Unknown";
}

const char* stageDisplayName(DeploymentStage stage) {
  switch (stage) {
    case DeploymentStage::NotStarted:
      return "Not started";
    case DeploymentStage::LoadingProfile:
      return "Loading profile";
    case DeploymentStage::ValidatingConnection:
      return "Validating connection";
    case DeploymentStage::BuildingProject:
      return "Building project";
    case DeploymentStage::ConnectingToServer:
      return "Connecting to server";
    case DeploymentStage::PreDeploymentSummary:
      return "Pre-deployment summary";
    case DeploymentStage::UploadingAppOffline:
      return "Uploading app_offline.htm";
    case DeploymentStage::UploadingFiles:
      return "Uploading files";
    case DeploymentStage::CleaningUpObsoleteFiles:
      return "Cleaning up obsolete files";
    case DeploymentStage::DeletingAppOffline:
      return "Deleting app_offline.htm";
    case DeploymentStage::RecordingHistory:
      return "Recording history";
    case DeploymentStage::Completed:
      return "Completed";
    case DeploymentStage::Failed:
      return "Failed";
    case DeploymentStage::Cancelled:
      return "Cancelled";
  }
  return "Unknown";
}

int stageIndex(DeploymentStage stage) {
  return static_cast<int>(stage);
}

bool isTerminalStage(DeploymentStage stage) {
  return stage == DeploymentStage::Completed || stage == DeploymentStage::Failed ||
         stage == DeploymentStage::Cancelled;
}

}  // namespace deploy
}  // namespace ferry
