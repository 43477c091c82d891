#include "process_runner.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/naming.hpp"

namespace optiraid::process {

namespace {

constexpr int         kExecFailed  = 127;
constexpr std::size_t kDetailLimit = 512;

std::vector<char*> MakeArgv(const std::vector<std::string>& argv) {
  std::vector<char*> out;
  out.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    out.push_back(const_cast<char*>(arg.c_str()));
  }
  out.push_back(nullptr);
  return out;
}

int DecodeStatus(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void ExecChild(const std::vector<char*>& argv, const std::string& cwd) {
  if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
    static constexpr char kMsg[] = "optiraid: chdir failed\n";
    (void)!::write(STDERR_FILENO, kMsg, sizeof(kMsg) - 1);
    ::_exit(kExecFailed);
  }
  ::execvp(argv[0], argv.data());
  static constexpr char kMsg[] = "optiraid: exec failed\n";
  (void)!::write(STDERR_FILENO, kMsg, sizeof(kMsg) - 1);
  ::_exit(kExecFailed);
}

int WaitFor(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
    }
  }
  return DecodeStatus(status);
}

class PosixChildProcess final : public ChildProcess {
 public:
  PosixChildProcess(pid_t pid, std::vector<std::string> argv) : pid_(pid), argv_(std::move(argv)) {
  }

  ~PosixChildProcess() override {
    if (!exit_code_) {
      Terminate();
    }
  }

  std::optional<int> Poll() override {
    if (exit_code_) return exit_code_;

    int         status = 0;
    const pid_t rc     = ::waitpid(pid_, &status, WNOHANG);
    if (rc == pid_) {
      exit_code_ = DecodeStatus(status);
    } else if (rc < 0 && errno != EINTR) {
      throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
    }
    return exit_code_;
  }

  int Wait() override {
    if (!exit_code_) {
      exit_code_ = WaitFor(pid_);
    }
    return *exit_code_;
  }

  void Terminate() override {
    if (exit_code_) return;
    ::kill(pid_, SIGTERM);
    exit_code_ = WaitFor(pid_);
  }

  const std::vector<std::string>& Argv() const override {
    return argv_;
  }

 private:
  pid_t                    pid_;
  std::vector<std::string> argv_;
  std::optional<int>       exit_code_;
};

} // namespace

std::string ToolResult::CommandLine() const {
  return util::CommandLine(argv);
}

ToolResult PosixProcessRunner::Run(const std::vector<std::string>& argv, const std::filesystem::path& cwd) {
  if (argv.empty()) {
    throw std::invalid_argument("empty command");
  }

  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
  }

  auto        c_argv  = MakeArgv(argv);
  const auto  cwd_str = cwd.string();
  const pid_t pid     = ::fork();
  if (pid < 0) {
    ::close(fds[0]);
    ::close(fds[1]);
    throw std::runtime_error(std::string("fork failed: ") + std::strerror(errno));
  }

  if (pid == 0) {
    ::dup2(fds[1], STDOUT_FILENO);
    ::dup2(fds[1], STDERR_FILENO);
    ExecChild(c_argv, cwd_str);
  }

  ::close(fds[1]);

  ToolResult result;
  result.argv = argv;

  char buffer[4096];
  while (true) {
    const ssize_t n = ::read(fds[0], buffer, sizeof(buffer));
    if (n > 0) {
      result.output.append(buffer, static_cast<std::size_t>(n));
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    break;
  }
  ::close(fds[0]);

  result.exit_code = WaitFor(pid);
  OPTIRAID_LOG_DEBUG("tool finished", {observability::StringField("command", result.CommandLine()),
                                       observability::IntField("exit_code", result.exit_code)});
  return result;
}

std::unique_ptr<ChildProcess> PosixProcessRunner::Spawn(const std::vector<std::string>& argv, const std::filesystem::path& cwd) {
  if (argv.empty()) {
    throw std::invalid_argument("empty command");
  }

  auto        c_argv  = MakeArgv(argv);
  const auto  cwd_str = cwd.string();
  const pid_t pid     = ::fork();
  if (pid < 0) {
    throw std::runtime_error(std::string("fork failed: ") + std::strerror(errno));
  }

  if (pid == 0) {
    // keep our stdout for command output
    ::dup2(STDERR_FILENO, STDOUT_FILENO);
    ExecChild(c_argv, cwd_str);
  }

  OPTIRAID_LOG_DEBUG("spawned", {observability::StringField("command", util::CommandLine(argv)), observability::IntField("pid", pid)});
  return std::make_unique<PosixChildProcess>(pid, argv);
}

void ThrowIfFailed(const ToolResult& result, std::optional<std::uint64_t> set_index) {
  if (result.ok()) {
    return;
  }

  const auto command = result.CommandLine();
  OPTIRAID_LOG_ERROR("external tool failed", {observability::StringField("command", command), observability::IntField("exit_code", result.exit_code),
                                              observability::StringField("output", result.output)});
  auto detail = result.output;
  if (detail.size() > kDetailLimit) {
    detail = "..." + detail.substr(detail.size() - kDetailLimit);
  }
  throw util::ExternalToolFailure(command, result.exit_code, detail, set_index);
}

} // namespace optiraid::process
