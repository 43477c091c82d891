#pragma once

#include <sys/types.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace optiraid::process {

/*
  Typed outcome of one external tool invocation.

  Exit codes follow the shell convention: 128 + signal for a child killed by
  a signal, 127 when the program could not be executed.
*/
struct ToolResult {
  std::vector<std::string> argv;
  int                      exit_code = 0;
  // stdout and stderr, interleaved.
  std::string output;

  bool ok() const {
    return exit_code == 0;
  }

  std::string CommandLine() const;
};

/*
  Handle to a long-running child (the archive encoder).
*/
class ChildProcess {
 public:
  virtual ~ChildProcess() = default;

  // Exit code once the child has exited, without blocking.
  virtual std::optional<int> Poll() = 0;

  virtual int  Wait()      = 0;
  virtual void Terminate() = 0;

  virtual const std::vector<std::string>& Argv() const = 0;
};

class ProcessRunner {
 public:
  virtual ~ProcessRunner() = default;

  // Runs to completion, capturing output.
  virtual ToolResult Run(const std::vector<std::string>& argv, const std::filesystem::path& cwd = {}) = 0;

  // Starts a child whose output goes to our stderr.
  virtual std::unique_ptr<ChildProcess> Spawn(const std::vector<std::string>& argv, const std::filesystem::path& cwd = {}) = 0;
};

class PosixProcessRunner final : public ProcessRunner {
 public:
  ToolResult                    Run(const std::vector<std::string>& argv, const std::filesystem::path& cwd = {}) override;
  std::unique_ptr<ChildProcess> Spawn(const std::vector<std::string>& argv, const std::filesystem::path& cwd = {}) override;
};

// Logs the exact command at error level and throws util::ExternalToolFailure
// when the tool did not succeed.
void ThrowIfFailed(const ToolResult& result, std::optional<std::uint64_t> set_index = std::nullopt);

} // namespace optiraid::process
