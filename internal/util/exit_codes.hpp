#pragma once

#include <exception>

namespace optiraid::util {

enum ExitCode : int {
  kExitOk                  = 0,
  kExitUsage               = 1,
  kExitConfiguration       = 2,
  kExitExternalTool        = 3,
  kExitIntegrity           = 4,
  kExitUnrecoverable       = 5,
  kExitProtocolViolation   = 6,
  kExitStagingConflict     = 7,
  kExitInsufficientSpace   = 8,
  kExitInternal            = 9,
};

/*
  Converts internal exceptions into process exit codes.
*/
int ToExitCode(const std::exception& e);

const char* ExitCodeName(int code);

} // namespace optiraid::util
