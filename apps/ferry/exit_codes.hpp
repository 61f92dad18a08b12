// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef FERRY_CLI_EXIT_CODES_HPP
#define FERRY_CLI_EXIT_CODES_HPP

#include <exception>

namespace ferry {
namespace cli {

enum ExitCode : int {
  kExitSuccess = 0,
  kExitGeneral = 1,
  kExitBuild = 2,
  kExitConnection = 3,
  kExitAuthentication = 4,
  kExitDeployment = 5,
  kExitConfiguration = 6,
  kExitProfileNotFound = 7,
  kExitInvalidArguments = 8,
  kExitCancelled = 9,
};

/**
 * Map an exception to the process exit code. A null pointer is success.
 */
int exitCodeFor(std::exception_ptr error);

const char* exitCodeDescription(int code);

}  // namespace cli
}  // namespace ferry

#endif  // FERRY_CLI_EXIT_CODES_HPP
