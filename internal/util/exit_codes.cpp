#include "exit_codes.hpp"

#include "internal/util/errors.hpp"

namespace optiraid::util {

int ToExitCode(const std::exception& e) {
  // InsufficientSpace derives from ConfigurationError, test it first.
  if (dynamic_cast<const InsufficientSpace*>(&e)) {
    return kExitInsufficientSpace;
  }
  if (dynamic_cast<const ConfigurationError*>(&e)) {
    return kExitConfiguration;
  }
  if (dynamic_cast<const StagingConflict*>(&e)) {
    return kExitStagingConflict;
  }
  if (dynamic_cast<const ExternalToolFailure*>(&e)) {
    return kExitExternalTool;
  }
  if (dynamic_cast<const IntegrityFailure*>(&e)) {
    return kExitIntegrity;
  }
  if (dynamic_cast<const Unrecoverable*>(&e)) {
    return kExitUnrecoverable;
  }
  if (dynamic_cast<const ProtocolViolation*>(&e)) {
    return kExitProtocolViolation;
  }

  return kExitInternal;
}

const char* ExitCodeName(int code) {
  switch (code) {
    case kExitOk:
      return "ok";
    case kExitUsage:
      return "usage";
    case kExitConfiguration:
      return "configuration_error";
    case kExitExternalTool:
      return "external_tool_failure";
    case kExitIntegrity:
      return "integrity_failure";
    case kExitUnrecoverable:
      return "unrecoverable";
    case kExitProtocolViolation:
      return "protocol_violation";
    case kExitStagingConflict:
      return "staging_conflict";
    case kExitInsufficientSpace:
      return "insufficient_space";
    default:
      return "internal_error";
  }
}

} // namespace optiraid::util
