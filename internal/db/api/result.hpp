#pragma once

#include <stdexcept>
#include <string>

namespace optiraid::db {

/*
  Backend-neutral ledger result.

  Repositories translate their backend's errors into these codes; nothing
  above the db layer sees sqlite types.
*/

enum class ErrorCode {
  OK = 0,

  // another process holds the ledger past the busy timeout
  Busy,
  // unknown run, empty key, foreign key
  ConstraintViolation,

  IOError,
  // damaged file or a schema this build does not understand
  Corruption,

  InternalError
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::IOError:
      return "i/o error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      break;
  }
  return "internal error";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

// `what` names the write, e.g. "set update".
inline void ThrowIfDbError(const Result& result, const std::string& what) {
  if (result) return;
  std::string msg = "ledger " + what + " failed (" + ErrorCodeName(result.code) + ")";
  if (!result.message.empty()) msg += ": " + result.message;
  throw std::runtime_error(msg);
}

} // namespace optiraid::db
