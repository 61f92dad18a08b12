// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "commands.hpp"

#include <unistd.h>

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>

#include <ferry_log_init.hpp>

#include "config_parser.hpp"
#include "deployment_history.hpp"
#include "deployment_orchestrator.hpp"
#include "dotnet_build_tool.hpp"
#include "exclusion_pattern_matcher.hpp"
#include "exit_codes.hpp"
#include "ferry_errors.hpp"
#include "publish_output_scanner.hpp"
#include "sftp_transfer_client.hpp"
#include "yaml_profile_repository.hpp"

#define FERRY_LOG_COMPONENT "cli"
#include <ferry_log_macros.hpp>

using ::ferry::logging::kv;

namespace ferry {
namespace cli {

namespace fs = std::filesystem;

namespace {

constexpr auto kCancelPollInterval = std::chrono::milliseconds(100);

int parse_int(const std::string& flag, const std::string& value) {
  try {
    size_t consumed = 0;
    const int result = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      throw std::invalid_argument(value);
    }
    return result;
  } catch (const std::logic_error&) {
    throw std::invalid_argument(flag + " requires an integer, got '" + value + "'");
  }
}

const std::string& require_value(
  const std::vector<std::string>& args, size_t& i, const std::string& flag
) {
  if (i + 1 >= args.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return args[++i];
}

std::string format_local_time(deploy::Clock::time_point tp) {
  const std::time_t t = deploy::Clock::to_time_t(tp);
  std::tm tm_buf;
  localtime_r(&t, &tm_buf);
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

// Interactive yes/no; a non-interactive stdin never confirms
bool confirm_deployment(const deploy::DeploymentState& state) {
  if (!isatty(STDIN_FILENO)) {
    std::cerr << "Error: Confirmation required but stdin is not a terminal. Use --yes."
              << std::endl;
    return false;
  }

  std::cout << std::endl;
  std::cout << "Deploy " << state.total_files << " files ("
            << deploy::formatBytes(state.total_size) << ") to " << state.target_host << "?"
            << std::endl
            << "Type 'yes' to confirm: ";
  std::cout.flush();

  std::string input;
  if (!std::getline(std::cin, input)) {
    return false;
  }
  const char* whitespace = " \t\n\r";
  const size_t start = input.find_first_not_of(whitespace);
  if (start == std::string::npos) {
    return false;
  }
  input = input.substr(start, input.find_last_not_of(whitespace) - start + 1);
  return input == "yes" || input == "y";
}

void print_result(const deploy::DeploymentResult& result) {
  std::cout << std::endl;
  if (result.success) {
    std::cout << "Deployment succeeded." << std::endl;
  } else if (result.was_cancelled) {
    std::cout << "Deployment cancelled." << std::endl;
  } else {
    std::cout << "Deployment failed." << std::endl;
  }

  std::cout << "  Deployment ID: " << result.deployment_id << std::endl;
  std::cout << "  Profile: " << result.profile_name << std::endl;
  std::cout << "  Final stage: " << deploy::stageDisplayName(result.final_stage) << std::endl;
  std::cout << "  Files: " << result.files_uploaded << "/" << result.total_files << " uploaded";
  if (result.files_failed > 0) {
    std::cout << ", " << result.files_failed << " failed";
  }
  std::cout << std::endl;
  std::cout << "  Size: " << deploy::formatBytes(result.size_uploaded) << std::endl;
  std::cout << "  Duration: " << std::fixed << std::setprecision(1)
            << static_cast<double>(result.duration().count()) / 1000.0 << "s" << std::endl;
  std::cout << "  Speed: " << result.formattedUploadSpeed() << std::endl;
  if (result.obsolete_files_deleted > 0) {
    std::cout << "  Obsolete files deleted: " << result.obsolete_files_deleted << std::endl;
  }

  for (const auto& warning : result.warnings) {
    std::cout << "  Warning: " << warning << std::endl;
  }
  for (const auto& error : result.errors) {
    std::cerr << "Error: " << error << std::endl;
  }
}

}  // namespace

Commands::Commands(FerryConfig config)
    : config_(std::move(config)) {}

deploy::DeploymentOptions Commands::parse_deploy_options(const std::vector<std::string>& args) {
  deploy::DeploymentOptions options;

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "--project" || arg == "-p") {
      options.project_path = require_value(args, i, arg);
    } else if (arg == "--config" || arg == "-c") {
      options.build_configuration = require_value(args, i, arg);
    } else if (arg == "--concurrency") {
      options.max_concurrency = parse_int(arg, require_value(args, i, arg));
      if (options.max_concurrency < 1 || options.max_concurrency > 20) {
        throw std::invalid_argument("--concurrency must be between 1 and 20");
      }
    } else if (arg == "--host") {
      options.target_host = require_value(args, i, arg);
    } else if (arg == "--output") {
      options.output_dir = require_value(args, i, arg);
    } else if (arg == "--cleanup") {
      const std::string& value = require_value(args, i, arg);
      options.cleanup_mode = deploy::parseCleanupMode(value);
      if (!options.cleanup_mode) {
        throw std::invalid_argument("--cleanup must be none, obsolete or all, got '" + value + "'");
      }
    } else if (arg == "--dry-run") {
      options.dry_run = true;
    } else if (arg == "--yes" || arg == "-y") {
      options.skip_confirmation = true;
    } else if (arg == "--no-app-offline") {
      options.use_app_offline = false;
    } else if (arg == "--skip-connection-test") {
      options.skip_connection_test = true;
    } else if (!arg.empty() && arg[0] == '-') {
      throw std::invalid_argument("Unknown option: " + arg);
    } else if (options.profile_name.empty()) {
      options.profile_name = arg;
    } else {
      throw std::invalid_argument("Unexpected argument: " + arg);
    }
  }

  if (options.profile_name.empty()) {
    throw std::invalid_argument("deploy requires a profile name");
  }
  return options;
}

int Commands::deploy(const deploy::DeploymentOptions& options) {
  deploy::YamlProfileRepository profiles(config_.paths.profiles_dir, config_.defaults);
  deploy::DotnetBuildTool build_tool;
  transfer::TransferClientFactory client_factory;
  deploy::JsonDeploymentHistory history(config_.paths.history_file);
  deploy::DeploymentOrchestrator orchestrator(profiles, build_tool, client_factory, history);

  orchestrator.setStageChangedCallback(
    [](deploy::DeploymentStage, deploy::DeploymentStage stage, deploy::Clock::time_point) {
      if (!deploy::isTerminalStage(stage)) {
        std::cout << "==> " << deploy::stageDisplayName(stage) << std::endl;
      }
    }
  );
  orchestrator.setProgressUpdatedCallback([](const deploy::DeploymentState& state) {
    FERRY_LOG_INFO_THROTTLE(
      2.0, "Upload progress" << kv("uploaded", state.files_uploaded)
                             << kv("total", state.total_files)
                             << kv("percent", state.progressPercentage())
    );
  });
  orchestrator.setConfirmationCallback(confirm_deployment);

  // Forward signal-driven cancellation to the orchestrator
  std::atomic<bool> done{false};
  std::thread watcher;
  if (cancel_flag_ != nullptr) {
    watcher = std::thread([this, &done, &orchestrator] {
      bool requested = false;
      while (!done.load()) {
        if (!requested && cancel_flag_->load()) {
          requested = orchestrator.cancel();
          if (requested) {
            std::cout << std::endl << "Cancelling deployment..." << std::endl;
          }
        }
        std::this_thread::sleep_for(kCancelPollInterval);
      }
    });
  }

  deploy::DeploymentResult result;
  try {
    result = orchestrator.deploy(options);
  } catch (const std::exception&) {
    done = true;
    if (watcher.joinable()) {
      watcher.join();
    }
    throw;
  }
  done = true;
  if (watcher.joinable()) {
    watcher.join();
  }

  print_result(result);
  if (result.success) {
    return kExitSuccess;
  }
  if (result.was_cancelled) {
    return kExitCancelled;
  }
  return result.error ? exitCodeFor(result.error) : kExitGeneral;
}

int Commands::history(const std::string& profile, int limit) {
  deploy::JsonDeploymentHistory history(config_.paths.history_file);
  const auto entries =
    profile.empty() ? history.getRecentEntries(limit) : history.getProfileEntries(profile, limit);

  if (entries.empty()) {
    std::cout << "No deployments recorded." << std::endl;
    return kExitSuccess;
  }

  std::cout << std::left << std::setw(21) << "TIME" << std::setw(16) << "PROFILE"
            << std::setw(24) << "SERVER" << std::setw(9) << "RESULT" << std::setw(8) << "FILES"
            << std::setw(12) << "SIZE"
            << "DURATION" << std::endl;
  for (const auto& entry : entries) {
    std::ostringstream duration;
    duration << std::fixed << std::setprecision(1) << entry.duration_seconds << "s";
    std::cout << std::left << std::setw(21) << format_local_time(entry.timestamp)
              << std::setw(16) << entry.profile_name << std::setw(24) << entry.server_host
              << std::setw(9) << (entry.success ? "OK" : "FAILED") << std::setw(8)
              << entry.files_uploaded << std::setw(12) << deploy::formatBytes(entry.total_bytes)
              << duration.str() << std::endl;
    for (const auto& error : entry.errors) {
      std::cout << "    " << error << std::endl;
    }
  }
  return kExitSuccess;
}

int Commands::validate(const std::string& profile_name) {
  deploy::YamlProfileRepository profiles(config_.paths.profiles_dir, config_.defaults);
  const deploy::DeploymentProfile profile = profiles.loadProfile(profile_name);

  for (const auto& warning : profile.portWarnings()) {
    std::cout << "Warning: " << warning << std::endl;
  }
  for (const auto& pattern : profile.exclusion_patterns) {
    if (!deploy::ExclusionPatternMatcher::isValidPattern(pattern)) {
      std::cout << "Warning: Invalid exclusion pattern '" << pattern << "'" << std::endl;
    }
  }

  const auto errors = profile.validate();
  if (!errors.empty()) {
    std::cerr << "Profile '" << profile_name << "' is invalid:" << std::endl;
    for (const auto& error : errors) {
      std::cerr << "  - " << error << std::endl;
    }
    return kExitConfiguration;
  }

  std::cout << "Profile '" << profile_name << "' is valid." << std::endl;
  std::cout << "  Server: " << transfer::protocolToString(profile.protocol) << "://"
            << profile.username << "@" << profile.server << ":" << profile.port << std::endl;
  std::cout << "  Remote path: " << profile.remote_path << std::endl;
  std::cout << "  Concurrency: " << profile.concurrency << ", retries: " << profile.retry_count
            << std::endl;
  std::cout << "  Cleanup: " << deploy::cleanupModeToString(profile.cleanup_mode) << std::endl;
  return kExitSuccess;
}

bool Commands::load_config(const std::string& path, bool required) {
  std::error_code ec;
  if (!required && !fs::exists(path, ec)) {
    return true;
  }

  ConfigParser parser;
  if (!parser.load_from_file(path, config_)) {
    std::cerr << "Error: " << parser.get_last_error() << std::endl;
    return false;
  }
  std::string error_msg;
  if (!ConfigParser::validate(config_, error_msg)) {
    std::cerr << "Error: Invalid configuration in " << path << ": " << error_msg << std::endl;
    return false;
  }
  return true;
}

void Commands::configure_logging() {
  ::ferry::logging::LoggingConfig log_config;
  convert_logging_config(config_.logging, log_config);
  ::ferry::logging::reconfigure_logging(log_config);
}

int Commands::execute(int argc, char* argv[]) {
  std::string config_path;
  int index = 1;

  // Global options come before the command
  for (; index < argc; ++index) {
    std::string arg = argv[index];
    if (arg == "--help" || arg == "-h") {
      print_usage();
      return kExitSuccess;
    } else if (arg == "--config") {
      if (index + 1 >= argc) {
        std::cerr << "Error: --config requires a file argument" << std::endl;
        return kExitInvalidArguments;
      }
      config_path = argv[++index];
    } else {
      break;
    }
  }

  std::string command;
  if (index < argc) {
    command = argv[index++];
  }
  if (command.empty() || command == "help") {
    print_usage();
    return kExitSuccess;
  }

  std::vector<std::string> args(argv + index, argv + argc);

  if (command != "deploy" && command != "history" && command != "validate") {
    std::cerr << "Unknown command: " << command << std::endl;
    print_usage();
    return kExitInvalidArguments;
  }

  const bool explicit_config = !config_path.empty();
  if (!explicit_config) {
    config_path = default_ferry_dir() + "/ferry.yaml";
  }
  if (!load_config(config_path, explicit_config)) {
    return kExitConfiguration;
  }
  configure_logging();

  try {
    if (command == "deploy") {
      return deploy(parse_deploy_options(args));
    }

    if (command == "history") {
      std::string profile;
      int limit = 10;
      for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--profile") {
          profile = require_value(args, i, args[i]);
        } else if (args[i] == "--limit" || args[i] == "-n") {
          limit = parse_int(args[i], require_value(args, i, args[i]));
          if (limit < 1) {
            throw std::invalid_argument("--limit must be at least 1");
          }
        } else {
          throw std::invalid_argument("Unknown option: " + args[i]);
        }
      }
      return history(profile, limit);
    }

    if (args.size() != 1) {
      throw std::invalid_argument("validate requires exactly one profile name");
    }
    return validate(args[0]);
  } catch (const std::exception& e) {
    const int code = exitCodeFor(std::current_exception());
    std::cerr << "Error: " << e.what() << std::endl;
    FERRY_LOG_DEBUG("Command failed" << kv("command", command) << kv("exit_code", code));
    return code;
  }
}

void Commands::print_usage() {
  std::cout
    << "ferry - build and deploy .NET applications over SFTP\n"
    << "\n"
    << "Usage: ferry [--config PATH] <command> [options]\n"
    << "\n"
    << "Global options:\n"
    << "  --config PATH           ferry.yaml to load (default: " << default_ferry_dir()
    << "/ferry.yaml)\n"
    << "  -h, --help              Show this help\n"
    << "\n"
    << "Commands:\n"
    << "  deploy <profile>        Build, upload and activate a release\n"
    << "    -p, --project PATH    Project to publish (overrides the profile)\n"
    << "    -c, --config NAME     Build configuration, e.g. Release\n"
    << "    --concurrency N       Parallel uploads (1-20)\n"
    << "    --host HOST           Target host (overrides the profile)\n"
    << "    --output DIR          Publish directory to keep after the run\n"
    << "    --cleanup MODE        none, obsolete or all\n"
    << "    --no-app-offline      Do not take the site offline during upload\n"
    << "    --skip-connection-test\n"
    << "    --dry-run             Stop after the pre-deployment summary\n"
    << "    -y, --yes             Do not ask for confirmation\n"
    << "  history                 Show recent deployments\n"
    << "    --profile NAME        Only this profile\n"
    << "    -n, --limit N         Number of entries (default 10)\n"
    << "  validate <profile>      Check a profile for errors\n"
    << "\n"
    << "Exit codes:\n";
  for (int code = kExitSuccess; code <= kExitCancelled; ++code) {
    std::cout << "  " << code << "  " << exitCodeDescription(code) << "\n";
  }
  std::cout.flush();
}

}  // namespace cli
}  // namespace ferry
