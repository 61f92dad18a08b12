// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "exit_codes.hpp"

#include <stdexcept>

#include "cancellation_token.hpp"
#include "ferry_errors.hpp"

namespace ferry {
namespace cli {

int exitCodeFor(std::exception_ptr error) {
  if (!error) {
    return kExitSuccess;
  }

  // Most derived types first: ProfileValidationError is also a ProfileError
  try {
    std::rethrow_exception(error);
  } catch (const OperationCancelled&) {
    return kExitCancelled;
  } catch (const ProfileNotFoundError&) {
    return kExitProfileNotFound;
  } catch (const ProfileValidationError&) {
    return kExitConfiguration;
  } catch (const ConfigurationError&) {
    return kExitConfiguration;
  } catch (const BuildError&) {
    return kExitBuild;
  } catch (const ConnectionError&) {
    return kExitConnection;
  } catch (const AuthenticationError&) {
    return kExitAuthentication;
  } catch (const DeploymentError&) {
    return kExitDeployment;
  } catch (const std::invalid_argument&) {
    return kExitInvalidArguments;
  } catch (const std::exception&) {
    return kExitGeneral;
  } catch (...) {
    return kExitGeneral;
  }
}

const char* exitCodeDescription(int code) {
  switch (code) {
    case kExitSuccess:
      return "Success";
    case kExitGeneral:
      return "General error";
    case kExitBuild:
      return "Build failed";
    case kExitConnection:
      return "Connection failed";
    case kExitAuthentication:
      return "Authentication failed";
    case kExitDeployment:
      return "Deployment failed";
    case kExitConfiguration:
      return "Configuration error";
    case kExitProfileNotFound:
      return "Profile not found";
    case kExitInvalidArguments:
      return "Invalid arguments";
    case kExitCancelled:
      return "Operation cancelled";
    default:
      return "Unknown error";
  }
}

}  // namespace cli
}  // namespace ferry
