#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace optiraid::util {

/*
  Central error types.

  These get translated later to process exit codes (see exit_codes.hpp).
*/

class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InsufficientSpace : public ConfigurationError {
 public:
  InsufficientSpace(const std::string& where, std::uint64_t have_bytes, std::uint64_t need_bytes)
      : ConfigurationError("not enough free space in " + where + ": need " + std::to_string(need_bytes) + " bytes, have " +
                           std::to_string(have_bytes)),
        have_(have_bytes),
        need_(need_bytes) {
  }

  std::uint64_t have() const {
    return have_;
  }
  std::uint64_t need() const {
    return need_;
  }

 private:
  std::uint64_t have_;
  std::uint64_t need_;
};

// Staging directory pre-exists with content, or is owned by another run.
class StagingConflict : public std::runtime_error {
 public:
  explicit StagingConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ExternalToolFailure : public std::runtime_error {
 public:
  ExternalToolFailure(std::string command, int exit_code, const std::string& detail, std::optional<std::uint64_t> set_index = std::nullopt)
      : std::runtime_error(Describe(command, exit_code, detail, set_index)),
        command_(std::move(command)),
        exit_code_(exit_code),
        set_index_(set_index) {
  }

  const std::string& command() const {
    return command_;
  }
  int exit_code() const {
    return exit_code_;
  }
  std::optional<std::uint64_t> set_index() const {
    return set_index_;
  }

 private:
  static std::string Describe(const std::string& command, int exit_code, const std::string& detail, std::optional<std::uint64_t> set_index) {
    std::string msg = "external tool failed (exit " + std::to_string(exit_code) + ")";
    if (set_index) {
      msg += " for set " + std::to_string(*set_index);
    }
    if (!detail.empty()) {
      msg += ": " + detail;
    }
    return msg + " [command: " + command + "]";
  }

  std::string                  command_;
  int                          exit_code_;
  std::optional<std::uint64_t> set_index_;
};

class IntegrityFailure : public std::runtime_error {
 public:
  explicit IntegrityFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Unrecoverable : public std::runtime_error {
 public:
  Unrecoverable(std::uint64_t set_index, std::size_t damaged, std::size_t parity)
      : std::runtime_error("set " + std::to_string(set_index) + " is unrecoverable: " + std::to_string(damaged) +
                           " members missing or corrupt, parity tolerates " + std::to_string(parity)),
        set_index_(set_index),
        damaged_(damaged),
        parity_(parity) {
  }

  std::uint64_t set_index() const {
    return set_index_;
  }
  std::size_t damaged() const {
    return damaged_;
  }
  std::size_t parity() const {
    return parity_;
  }

 private:
  std::uint64_t set_index_;
  std::size_t   damaged_;
  std::size_t   parity_;
};

// The encoder callback stream was missing, malformed or out of order.
class ProtocolViolation : public std::runtime_error {
 public:
  explicit ProtocolViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace optiraid::util
