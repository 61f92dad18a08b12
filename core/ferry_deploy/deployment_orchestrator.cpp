// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "deployment_orchestrator.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

#include "concurrent_transfer_engine.hpp"
#include "exclusion_pattern_matcher.hpp"
#include "ferry_errors.hpp"
#include "file_comparison.hpp"
#include "publish_output_scanner.hpp"

#define FERRY_LOG_COMPONENT "orchestrator"
#include <ferry_log_macros.hpp>

using ::ferry::logging::kv;

namespace fs = std::filesystem;

namespace ferry {
namespace deploy {

namespace {

constexpr size_t kMaxListedFailures = 5;

void disposeQuietly(std::unique_ptr<transfer::ITransferClient>& client) {
  if (!client) {
    return;
  }
  try {
    client->dispose();
  } catch (const std::exception& e) {
    FERRY_LOG_WARN("Failed to dispose transfer client" << kv("error", e.what()));
  }
  client.reset();
}

// Relative path of a listed remote entry below root, empty if outside it
std::string relativeToRoot(const std::string& full_path, const std::string& root) {
  const std::string base = FileComparison::normalizePath(root);
  const std::string path = FileComparison::normalizePath(full_path);
  if (base.empty()) {
    return path;
  }
  if (path.size() > base.size() && path.compare(0, base.size(), base) == 0 &&
      path[base.size()] == '/') {
    return path.substr(base.size() + 1);
  }
  return "";
}

std::string joinNames(const std::vector<std::string>& names, size_t limit) {
  std::string joined;
  for (size_t i = 0; i < names.size() && i < limit; ++i) {
    if (i > 0) {
      joined += ", ";
    }
    joined += names[i];
  }
  return joined;
}

// Clears the running flag on every exit path of deploy()
class RunningGuard {
public:
  explicit RunningGuard(std::atomic<bool>& flag)
      : flag_(flag) {}
  ~RunningGuard() { flag_ = false; }

  RunningGuard(const RunningGuard&) = delete;
  RunningGuard& operator=(const RunningGuard&) = delete;

private:
  std::atomic<bool>& flag_;
};

}  // namespace

struct DeploymentOrchestrator::RunContext {
  DeploymentOptions options;
  DeploymentProfile profile;
  transfer::ConnectionConfig connection;

  std::string project_path;
  std::string build_configuration;
  int concurrency = 4;
  bool use_app_offline = true;
  CleanupMode cleanup_mode = CleanupMode::None;

  std::string output_dir;
  bool owns_output_dir = false;
  PublishOutput publish;

  std::unique_ptr<transfer::ITransferClient> control;
  bool app_offline_uploaded = false;
};

DeploymentOrchestrator::DeploymentOrchestrator(
  IProfileProvider& profiles, IBuildTool& build_tool,
  transfer::ITransferClientFactory& client_factory, IDeploymentHistory& history
)
    : profiles_(profiles)
    , build_tool_(build_tool)
    , client_factory_(client_factory)
    , history_(history) {}

DeploymentOrchestrator::~DeploymentOrchestrator() = default;

void DeploymentOrchestrator::setStageChangedCallback(StageChangedCallback callback) {
  stage_callback_ = std::move(callback);
}

void DeploymentOrchestrator::setProgressUpdatedCallback(DeploymentProgressCallback callback) {
  progress_callback_ = std::move(callback);
}

void DeploymentOrchestrator::setConfirmationCallback(ConfirmationCallback callback) {
  confirmation_callback_ = std::move(callback);
}

void DeploymentOrchestrator::setRetrySleepFunction(transfer::RetrySleepFunction sleep) {
  sleep_ = std::move(sleep);
}

DeploymentState DeploymentOrchestrator::currentState() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

bool DeploymentOrchestrator::cancel() {
  if (!running_.load()) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!state_.can_cancel) {
      return false;
    }
    state_.cancellation_requested = true;
  }
  FERRY_LOG_WARN("Cancellation requested");
  token_.cancel();
  return true;
}

DeploymentResult DeploymentOrchestrator::deploy(const DeploymentOptions& options) {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) {
    throw std::logic_error("A deployment is already in progress.");
  }
  RunningGuard running_guard(running_);

  token_.reset();
  RunContext ctx;
  ctx.options = options;
  Clock::time_point started_at;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = DeploymentState();
    state_.profile_name = options.profile_name;
    state_.start();
    started_at = state_.started_at.value_or(Clock::now());
  }
  const std::string deployment_id = currentState().deployment_id;
  FERRY_LOG_SCOPED_CONTEXT(deployment_id, options.profile_name);
  FERRY_LOG_INFO("Deployment started" << kv("profile", options.profile_name));
  notifyStageChanged(DeploymentStage::NotStarted, DeploymentStage::LoadingProfile, started_at);

  DeploymentResult result;
  try {
    runStages(ctx);
    finish(DeploymentStage::Completed);
    result = DeploymentResult::fromSuccess(currentState());
    FERRY_LOG_INFO(
      "Deployment completed" << kv("files", result.files_uploaded)
                             << kv("duration_ms", result.duration().count())
                             << kv("speed", result.formattedUploadSpeed())
    );
  } catch (const OperationCancelled& e) {
    FERRY_LOG_WARN("Deployment cancelled" << kv("reason", e.what()));
    finish(DeploymentStage::Cancelled);
    result = DeploymentResult::fromCancellation(currentState());
  } catch (const std::exception& e) {
    const auto error = std::current_exception();
    const DeploymentStage failed_stage = currentState().current_stage;
    const std::string message = std::string("Deployment failed at stage ") +
                                stageToString(failed_stage) + ": " + e.what();
    FERRY_LOG_ERROR(message);

    showErrorPage(ctx, e.what());
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      state_.error_message = message;
      state_.error = error;
    }
    finish(DeploymentStage::Failed);
    result = DeploymentResult::fromFailure(currentState(), message, error);

    // best effort, without a stage transition
    try {
      history_.addEntry(HistoryEntry::fromResult(result, ctx.build_configuration));
    } catch (const std::exception& history_error) {
      FERRY_LOG_WARN("Failed to record deployment history" << kv("error", history_error.what()));
    }
  }

  releaseResources(ctx);
  return result;
}

void DeploymentOrchestrator::runStages(RunContext& ctx) {
  loadProfile(ctx);

  if (!ctx.options.skip_connection_test) {
    enterStage(DeploymentStage::ValidatingConnection);
    validateConnection(ctx);
  }

  enterStage(DeploymentStage::BuildingProject);
  buildProject(ctx);

  enterStage(DeploymentStage::ConnectingToServer);
  connectToServer(ctx);

  enterStage(DeploymentStage::PreDeploymentSummary);
  preDeploymentSummary(ctx);
  if (ctx.options.dry_run) {
    FERRY_LOG_INFO("Dry run, skipping upload");
    return;
  }

  if (ctx.use_app_offline) {
    enterStage(DeploymentStage::UploadingAppOffline);
    uploadAppOffline(ctx);
  }

  enterStage(DeploymentStage::UploadingFiles);
  uploadFiles(ctx);

  if (ctx.cleanup_mode != CleanupMode::None) {
    enterStage(DeploymentStage::CleaningUpObsoleteFiles);
    cleanupObsoleteFiles(ctx);
  }

  if (ctx.use_app_offline) {
    enterStage(DeploymentStage::DeletingAppOffline);
    deleteAppOffline(ctx);
  }

  enterStage(DeploymentStage::RecordingHistory);
  recordHistory(ctx);

  token_.throwIfCancelled();
}

// ============================================================================
// Stages
// ============================================================================

void DeploymentOrchestrator::loadProfile(RunContext& ctx) {
  token_.throwIfCancelled();
  if (ctx.options.profile_name.empty()) {
    throw std::invalid_argument("Profile name cannot be empty.");
  }

  ctx.profile = profiles_.loadProfile(ctx.options.profile_name);
  ctx.profile.ensureValid();
  for (const auto& warning : ctx.profile.portWarnings()) {
    addWarning(warning);
  }

  const auto& opts = ctx.options;
  ctx.connection = ctx.profile.toConnectionConfig();
  if (!opts.target_host.empty()) {
    ctx.connection.host = opts.target_host;
  }
  ctx.project_path = opts.project_path.empty() ? ctx.profile.project_path : opts.project_path;
  ctx.build_configuration =
    opts.build_configuration.empty() ? ctx.profile.build_configuration : opts.build_configuration;
  ctx.concurrency = opts.max_concurrency > 0 ? opts.max_concurrency : ctx.profile.concurrency;
  ctx.use_app_offline = opts.use_app_offline && ctx.profile.app_offline_enabled;
  ctx.cleanup_mode = opts.cleanup_mode.value_or(ctx.profile.cleanup_mode);

  if (ctx.project_path.empty()) {
    throw ConfigurationError(
      "No project path configured for profile '" + ctx.profile.name + "'."
    );
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.profile_name = ctx.profile.name;
    state_.project_path = ctx.project_path;
    state_.target_host = ctx.connection.host;
  }
  FERRY_LOG_INFO(
    "Profile loaded" << kv("server", ctx.connection.host) << kv("port", ctx.connection.port)
                     << kv("remote_path", ctx.connection.remote_root)
                     << kv("concurrency", ctx.concurrency)
  );
  publishProgress();
}

void DeploymentOrchestrator::validateConnection(RunContext& ctx) {
  auto retry = makeRetryHandler(ctx);
  retry.execute(
    [&] {
      auto client = client_factory_.createClient(ctx.connection);
      try {
        client->connect(&token_);
        client->disconnect();
      } catch (const std::exception&) {
        disposeQuietly(client);
        throw;
      }
      disposeQuietly(client);
    },
    "Connection test", &token_
  );
  FERRY_LOG_INFO("Connection test passed" << kv("server", ctx.connection.host));
}

void DeploymentOrchestrator::buildProject(RunContext& ctx) {
  if (ctx.options.output_dir.empty()) {
    ctx.output_dir =
      (fs::temp_directory_path() / ("ferry-publish-" + currentState().deployment_id)).string();
    ctx.owns_output_dir = true;
  } else {
    ctx.output_dir = ctx.options.output_dir;
  }
  std::error_code ec;
  fs::create_directories(ctx.output_dir, ec);
  if (ec) {
    throw BuildError(
      "Failed to create output directory " + ctx.output_dir + ": " + ec.message(), ctx.project_path,
      ctx.build_configuration
    );
  }

  const BuildResult build =
    build_tool_.build(ctx.project_path, ctx.output_dir, ctx.build_configuration, &token_);
  token_.throwIfCancelled();
  if (!build.success) {
    if (build.errors.empty()) {
      throw BuildError(
        "Build failed with exit code " + std::to_string(build.exit_code) + ".", ctx.project_path,
        ctx.build_configuration
      );
    }
    throw BuildCompilationError(build.errors, ctx.project_path, ctx.build_configuration);
  }
  for (const auto& warning : build.warnings) {
    addWarning(warning);
  }

  const std::string publish_dir = build.output_path.empty() ? ctx.output_dir : build.output_path;
  PublishOutputScanner scanner;
  ctx.publish = scanner.scan(publish_dir, ctx.profile.exclusion_patterns);
  if (!ctx.publish.errors.empty()) {
    throw BuildError(ctx.publish.errors.front(), ctx.project_path, ctx.build_configuration);
  }
  for (const auto& warning : ctx.publish.warnings) {
    addWarning(warning);
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.publish_path = ctx.publish.root_path;
    state_.total_files = static_cast<int>(ctx.publish.fileCount());
    state_.total_size = ctx.publish.total_size;
  }
  publishProgress();
}

void DeploymentOrchestrator::connectToServer(RunContext& ctx) {
  auto retry = makeRetryHandler(ctx);
  retry.execute(
    [&] {
      if (!ctx.control) {
        ctx.control = client_factory_.createClient(ctx.connection);
      }
      if (!ctx.control->isConnected()) {
        ctx.control->connect(&token_);
      }
    },
    "Connect", &token_
  );
  FERRY_LOG_INFO(
    "Connected" << kv("server", ctx.connection.host)
                << kv("protocol", transfer::protocolToString(ctx.connection.protocol))
  );
}

void DeploymentOrchestrator::preDeploymentSummary(RunContext& ctx) {
  const DeploymentState snapshot = currentState();
  FERRY_LOG_INFO(
    "Ready to deploy" << kv("files", snapshot.total_files)
                      << kv("size", formatBytes(snapshot.total_size))
                      << kv("target", ctx.connection.host + ":" + ctx.connection.remote_root)
                      << kv("app_offline", ctx.use_app_offline)
                      << kv("cleanup", cleanupModeToString(ctx.cleanup_mode))
                      << kv("dry_run", ctx.options.dry_run)
  );

  if (!ctx.options.skip_confirmation && confirmation_callback_) {
    if (!confirmation_callback_(snapshot)) {
      throw OperationCancelled("Deployment was not confirmed.");
    }
  }
}

void DeploymentOrchestrator::uploadAppOffline(RunContext& ctx) {
  const fs::path local_dir =
    fs::temp_directory_path() / ("ferry-offline-" + currentState().deployment_id);
  std::error_code ec;
  fs::create_directories(local_dir, ec);
  if (ec) {
    throw DeploymentError(
      "Failed to create " + local_dir.string() + ": " + ec.message(), ctx.profile.name,
      DeploymentPhase::Upload
    );
  }

  const std::string remote = transfer::joinRemotePath(
    ctx.connection.remote_root, AppOfflineManager::kFileName
  );
  try {
    const std::string local = app_offline_.createFile(local_dir.string());
    auto retry = makeRetryHandler(ctx);
    const bool uploaded = retry.execute(
      [&] {
        return ctx.control->uploadFile(local, remote, true, false, &token_);
      },
      "Upload app_offline.htm", &token_
    );
    if (!uploaded) {
      throw DeploymentError(
        "Server declined " + remote, ctx.profile.name, DeploymentPhase::Upload
      );
    }
  } catch (const std::exception&) {
    fs::remove_all(local_dir, ec);
    throw;
  }
  fs::remove_all(local_dir, ec);

  ctx.app_offline_uploaded = true;
  FERRY_LOG_INFO("Application taken offline" << kv("marker", remote));
}

void DeploymentOrchestrator::uploadFiles(RunContext& ctx) {
  std::vector<transfer::TransferTask> tasks;
  tasks.reserve(ctx.publish.files.size());
  for (const auto& file : ctx.publish.files) {
    transfer::TransferTask task;
    task.local_path = file.absolute_path;
    task.remote_path = transfer::joinRemotePath(ctx.connection.remote_root, file.relative_path);
    task.size = file.size;
    task.priority = 0;
    task.overwrite = true;
    task.create_directories = true;
    task.metadata["relative_path"] = file.relative_path;
    tasks.push_back(std::move(task));
  }

  transfer::EngineConfig config;
  config.max_concurrency = ctx.concurrency;
  config.max_retries = ctx.profile.retry_count;
  transfer::ConcurrentTransferEngine engine(client_factory_, ctx.connection, config);
  if (sleep_) {
    engine.setSleepFunction(sleep_);
  }
  engine.setFileTransferredCallback([this](const transfer::TransferResult& result) {
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      if (result.success) {
        state_.files_uploaded++;
        state_.size_uploaded += result.task.size;
      } else if (result.status == transfer::TransferStatus::Failed) {
        state_.files_failed++;
      }
    }
    publishProgress();
  });
  engine.setProgressCallback([](const transfer::TransferProgress& progress) {
    FERRY_LOG_INFO_THROTTLE(
      2, "Upload progress" << kv("files", progress.completed_files) << kv("total", progress.total_files)
                           << kv("speed", transfer::TransferProgress::formatSpeed(progress.average_speed))
    );
  });

  const auto results = engine.uploadAll(tasks, &token_);
  engine.dispose();

  std::vector<std::string> failed;
  int succeeded = 0;
  uint64_t uploaded_bytes = 0;
  for (const auto& result : results) {
    if (result.success) {
      ++succeeded;
      uploaded_bytes += result.task.size;
    } else if (result.status == transfer::TransferStatus::Failed) {
      auto it = result.task.metadata.find("relative_path");
      failed.push_back(it != result.task.metadata.end() ? it->second : result.task.remote_path);
      FERRY_LOG_ERROR(
        "File upload failed" << kv("file", failed.back()) << kv("error", result.error_message)
      );
    }
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.files_uploaded = succeeded;
    state_.size_uploaded = uploaded_bytes;
    state_.files_failed = static_cast<int>(failed.size());
    state_.failed_files = failed;
  }
  publishProgress();

  token_.throwIfCancelled();
  if (!failed.empty()) {
    throw DeploymentError(
      "Failed to upload " + std::to_string(failed.size()) +
        " file(s): " + joinNames(failed, kMaxListedFailures),
      ctx.profile.name, DeploymentPhase::Upload
    );
  }
}

void DeploymentOrchestrator::cleanupObsoleteFiles(RunContext& ctx) {
  const std::string& root = ctx.connection.remote_root;

  std::vector<std::string> remote_files;
  for (const auto& entry : transfer::listRemoteTree(*ctx.control, root)) {
    if (entry.is_directory) {
      continue;
    }
    std::string relative = relativeToRoot(entry.full_path, root);
    if (!relative.empty()) {
      remote_files.push_back(std::move(relative));
    }
  }

  std::vector<std::string> local_files;
  local_files.reserve(ctx.publish.files.size() + 1);
  for (const auto& file : ctx.publish.files) {
    local_files.push_back(file.relative_path);
  }
  if (ctx.use_app_offline) {
    // removed by the next stage
    local_files.push_back(AppOfflineManager::kFileName);
  }

  const ExclusionPatternMatcher matcher =
    ExclusionPatternMatcher::createWithDefaults(ctx.profile.exclusion_patterns);
  const ExclusionPatternMatcher* active =
    ctx.cleanup_mode == CleanupMode::DeleteAll ? nullptr : &matcher;
  const ComparisonResult comparison = FileComparison::compare(local_files, remote_files, active);

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.obsolete_files_count = static_cast<int>(comparison.obsoleteCount());
  }
  publishProgress();
  FERRY_LOG_INFO(
    "Cleaning up obsolete files" << kv("obsolete", comparison.obsoleteCount())
                                 << kv("excluded", comparison.excludedCount())
                                 << kv("mode", cleanupModeToString(ctx.cleanup_mode))
  );

  for (const auto& file : comparison.obsolete_files) {
    token_.throwIfCancelled();
    const std::string remote = transfer::joinRemotePath(root, file);
    try {
      ctx.control->deleteFile(remote);
    } catch (const std::exception& e) {
      addWarning("Failed to delete obsolete file '" + file + "': " + e.what());
      continue;
    }
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      state_.obsolete_files_deleted++;
    }
    publishProgress();
  }

  for (const auto& dir : FileComparison::identifyEmptyDirectories(comparison.obsolete_files, remote_files)) {
    token_.throwIfCancelled();
    try {
      ctx.control->deleteDirectory(transfer::joinRemotePath(root, dir));
    } catch (const std::exception& e) {
      addWarning("Failed to delete empty directory '" + dir + "': " + e.what());
    }
  }
}

void DeploymentOrchestrator::deleteAppOffline(RunContext& ctx) {
  const std::string remote = transfer::joinRemotePath(
    ctx.connection.remote_root, AppOfflineManager::kFileName
  );
  try {
    ctx.control->deleteFile(remote);
    ctx.app_offline_uploaded = false;
    FERRY_LOG_INFO("Application back online");
  } catch (const std::exception& e) {
    addWarning(std::string("Failed to delete app_offline.htm: ") + e.what());
  }
}

void DeploymentOrchestrator::recordHistory(RunContext& ctx) {
  const auto entry =
    HistoryEntry::fromResult(DeploymentResult::fromSuccess(currentState()), ctx.build_configuration);
  try {
    history_.addEntry(entry);
  } catch (const std::exception& e) {
    addWarning(std::string("Failed to record deployment history: ") + e.what());
  }
}

// ============================================================================
// Helpers
// ============================================================================

void DeploymentOrchestrator::showErrorPage(RunContext& ctx, const std::string& message) {
  if (!ctx.app_offline_uploaded || !ctx.control || !ctx.control->isConnected()) {
    return;
  }

  const fs::path local_dir =
    fs::temp_directory_path() / ("ferry-offline-error-" + currentState().deployment_id);
  std::error_code ec;
  fs::create_directories(local_dir, ec);
  try {
    const std::string local = app_offline_.createFile(local_dir.string(), true, message);
    const std::string remote = transfer::joinRemotePath(
      ctx.connection.remote_root, AppOfflineManager::kFileName
    );
    if (ctx.control->uploadFile(local, remote, true, false, nullptr)) {
      FERRY_LOG_WARN("Application left offline with an error page" << kv("marker", remote));
    }
  } catch (const std::exception& e) {
    FERRY_LOG_WARN("Failed to upload error page" << kv("error", e.what()));
  }
  fs::remove_all(local_dir, ec);
}

void DeploymentOrchestrator::releaseResources(RunContext& ctx) {
  disposeQuietly(ctx.control);
  if (ctx.owns_output_dir && !ctx.output_dir.empty()) {
    std::error_code ec;
    fs::remove_all(ctx.output_dir, ec);
    if (ec) {
      FERRY_LOG_WARN(
        "Failed to remove publish directory" << kv("path", ctx.output_dir) << kv("error", ec.message())
      );
    }
  }
}

transfer::RetryHandler DeploymentOrchestrator::makeRetryHandler(const RunContext& ctx) const {
  transfer::RetryPolicy policy;
  policy.max_retry_count = ctx.profile.retry_count;
  transfer::RetryHandler handler(policy);
  if (sleep_) {
    handler.setSleepFunction(sleep_);
  }
  return handler;
}

void DeploymentOrchestrator::enterStage(DeploymentStage stage) {
  token_.throwIfCancelled();

  DeploymentStage old_stage;
  Clock::time_point at;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    old_stage = state_.current_stage;
    state_.updateStage(stage);
    at = state_.stage_started_at.value_or(Clock::now());
  }
  FERRY_LOG_INFO("Stage" << kv("stage", stageDisplayName(stage)));
  notifyStageChanged(old_stage, stage, at);
}

void DeploymentOrchestrator::finish(DeploymentStage terminal_stage) {
  DeploymentStage old_stage;
  Clock::time_point at;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (isTerminalStage(state_.current_stage)) {
      return;
    }
    old_stage = state_.current_stage;
    state_.complete(terminal_stage);
    at = state_.completed_at.value_or(Clock::now());
  }
  notifyStageChanged(old_stage, terminal_stage, at);
}

void DeploymentOrchestrator::notifyStageChanged(
  DeploymentStage old_stage, DeploymentStage new_stage, Clock::time_point at
) {
  if (!stage_callback_) {
    return;
  }
  try {
    stage_callback_(old_stage, new_stage, at);
  } catch (const std::exception& e) {
    FERRY_LOG_WARN(
      "Stage listener failed" << kv("stage", stageToString(new_stage)) << kv("error", e.what())
    );
  }
}

void DeploymentOrchestrator::addWarning(const std::string& warning) {
  FERRY_LOG_WARN(warning);
  std::lock_guard<std::mutex> lock(state_mutex_);
  state_.warnings.push_back(warning);
}

void DeploymentOrchestrator::publishProgress() {
  if (!progress_callback_) {
    return;
  }
  progress_callback_(currentState());
}

}  // namespace deploy
}  // namespace ferry
