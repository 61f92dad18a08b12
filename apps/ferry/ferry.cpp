// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

// ferry - build a .NET project and deploy it to a server over SFTP

#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>

#include <ferry_log_init.hpp>

#include "commands.hpp"
#include "exit_codes.hpp"

namespace {

std::atomic<bool> g_should_exit(false);

// Only the flag is touched here; the deploy watcher thread does the rest
void signal_handler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_should_exit.store(true);
  }
}

}  // namespace

/**
 * Main entry point for ferry
 */
int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  ferry::cli::Commands commands;
  commands.set_cancel_flag(&g_should_exit);

  int code = ferry::cli::kExitGeneral;
  try {
    code = commands.execute(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    code = ferry::cli::exitCodeFor(std::current_exception());
  }

  ferry::logging::shutdown_logging();
  return code;
}
