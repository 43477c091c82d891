#include "dar_slice_source.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include "internal/encoder/hook_protocol.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/naming.hpp"

namespace optiraid::encoder {

using optiraid::runtime::config::RuntimeConfig;

namespace {

constexpr int           kPollIntervalMs = 200;
constexpr std::uint64_t kMiB            = 1024 * 1024;

// dar: some files could not be saved, the archive itself is complete
constexpr int kDarFileErrors = 5;

std::filesystem::path MakeControlDir() {
  auto templ = (std::filesystem::temp_directory_path() / "optiraid-ctl-XXXXXX").string();
  if (!::mkdtemp(templ.data())) {
    throw std::runtime_error(std::string("cannot create control directory: ") + std::strerror(errno));
  }
  return templ;
}

int MakeFifo(const std::filesystem::path& path) {
  if (::mkfifo(path.c_str(), 0600) != 0) {
    throw std::runtime_error("mkfifo " + path.string() + ": " + std::strerror(errno));
  }
  const int fd = ::open(path.c_str(), O_RDWR | O_NONBLOCK | O_CLOEXEC);
  if (fd < 0) {
    throw std::runtime_error("open " + path.string() + ": " + std::strerror(errno));
  }
  return fd;
}

} // namespace

std::vector<std::string> DarCreateOptions(const RuntimeConfig& config) {
  const auto& layout  = config.layout();
  const auto& encoder = config.encoder();

  std::vector<std::string> options;
  options.push_back("--slice " + std::to_string(layout.slice_size_mib()) + "M");
  options.push_back("--min-digits " + std::to_string(layout.digits()));
  if (!encoder.compression().empty() && encoder.compression() != "none") {
    options.push_back("--compression=" + encoder.compression());
  }
  options.push_back("--crypto-block " + std::to_string(encoder.crypto_block()));
  return options;
}

std::string RenderDarrc(const RuntimeConfig& config) {
  std::string text = "create:\n";
  for (const auto& option : DarCreateOptions(config)) {
    text += "  " + option + "\n";
  }
  for (const auto& arg : config.encoder().extra_args()) {
    text += "  " + util::QuoteIfNeeded(arg) + "\n";
  }
  return text;
}

std::vector<std::string> DarArgv(const RuntimeConfig& config, const std::filesystem::path& self_program, const std::filesystem::path& control_dir,
                                 const std::vector<std::string>& encoder_args) {
  const auto& layout  = config.layout();
  const auto& encoder = config.encoder();

  const auto hook = util::QuoteIfNeeded(self_program.string()) + " hook " + util::QuoteIfNeeded(control_dir.string()) + " %p %b %N %e %c";

  std::vector<std::string> argv = {encoder.program(),
                                   "-c",
                                   (std::filesystem::path(config.staging().dir()) / layout.basename()).string(),
                                   "-Q",
                                   "-s",
                                   std::to_string(layout.slice_size_mib() * kMiB),
                                   "--min-digits",
                                   std::to_string(layout.digits())};

  if (!encoder.compression().empty() && encoder.compression() != "none") {
    argv.push_back("--compression=" + encoder.compression());
  }
  argv.push_back("--crypto-block");
  argv.push_back(std::to_string(encoder.crypto_block()));
  argv.push_back("-E");
  argv.push_back(hook);

  for (const auto& arg : encoder.extra_args()) argv.push_back(arg);
  for (const auto& arg : encoder_args) argv.push_back(arg);
  return argv;
}

DarSliceSource::DarSliceSource(const RuntimeConfig& config, process::ProcessRunner& runner, std::filesystem::path self_program,
                               std::vector<std::string> encoder_args)
    : config_(config), runner_(runner), self_program_(std::move(self_program)), encoder_args_(std::move(encoder_args)) {
}

DarSliceSource::~DarSliceSource() {
  if (child_ && !finished_) {
    try {
      Abort();
    } catch (const std::exception& e) {
      OPTIRAID_LOG_WARN("encoder abort failed", {observability::StringField("error", e.what())});
    }
  }
  CloseControl();
}

void DarSliceSource::Start() {
  if (child_) {
    throw util::InvalidState("encoder already started");
  }

  control_dir_ = MakeControlDir();
  events_fd_   = MakeFifo(control_dir_ / std::string(kEventsFifo));
  ack_fd_      = MakeFifo(control_dir_ / std::string(kAckFifo));

  auto argv = DarArgv(config_, self_program_, control_dir_, encoder_args_);
  OPTIRAID_LOG_INFO("starting encoder", {observability::StringField("command", util::CommandLine(argv))});
  child_ = runner_.Spawn(argv, config_.staging().dir());
}

std::optional<std::string> DarSliceSource::TakeLine() {
  const auto pos = pending_.find('\n');
  if (pos == std::string::npos) return std::nullopt;

  auto line = pending_.substr(0, pos + 1);
  pending_.erase(0, pos + 1);
  return line;
}

bool DarSliceSource::ReadAvailable(int timeout_ms) {
  pollfd pfd{events_fd_, POLLIN, 0};
  const int rc = ::poll(&pfd, 1, timeout_ms);
  if (rc < 0) {
    if (errno == EINTR) return false;
    throw std::runtime_error(std::string("poll failed: ") + std::strerror(errno));
  }
  if (rc == 0) return false;

  bool got = false;
  char buffer[4096];
  while (true) {
    const ssize_t n = ::read(events_fd_, buffer, sizeof(buffer));
    if (n > 0) {
      pending_.append(buffer, static_cast<std::size_t>(n));
      got = true;
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    break;
  }
  return got;
}

std::optional<SliceEvent> DarSliceSource::Next() {
  if (!child_) {
    throw util::InvalidState("encoder not started");
  }

  while (true) {
    if (auto line = TakeLine()) {
      return ParseEvent(*line);
    }

    if (ReadAvailable(kPollIntervalMs)) continue;

    if (child_->Poll()) {
      // drain anything written just before exit
      ReadAvailable(0);
      if (auto line = TakeLine()) {
        return ParseEvent(*line);
      }
      if (!pending_.empty()) {
        throw util::ProtocolViolation("truncated slice event: '" + pending_ + "'");
      }
      return std::nullopt;
    }
  }
}

void DarSliceSource::Reply(std::string_view answer) {
  while (!answer.empty()) {
    const ssize_t n = ::write(ack_fd_, answer.data(), answer.size());
    if (n < 0) {
      if (errno == EINTR) continue;
      throw std::runtime_error(std::string("ack write failed: ") + std::strerror(errno));
    }
    answer.remove_prefix(static_cast<std::size_t>(n));
  }
}

void DarSliceSource::Acknowledge() {
  Reply(kAckOk);
}

void DarSliceSource::Finish() {
  if (!child_ || finished_) return;

  const int exit_code = child_->Wait();
  finished_           = true;
  CloseControl();

  if (exit_code == kDarFileErrors) {
    OPTIRAID_LOG_WARN("encoder reported files it could not save", {observability::StringField("command", util::CommandLine(child_->Argv()))});
    return;
  }
  process::ToolResult result;
  result.argv      = child_->Argv();
  result.exit_code = exit_code;
  process::ThrowIfFailed(result);
}

void DarSliceSource::Abort() {
  if (!child_ || finished_) return;

  if (ack_fd_ >= 0) {
    Reply(kAckAbort);
  }
  child_->Terminate();
  finished_ = true;
  OPTIRAID_LOG_WARN("encoder aborted", {observability::StringField("command", util::CommandLine(child_->Argv()))});
}

void DarSliceSource::CloseControl() {
  if (events_fd_ >= 0) ::close(events_fd_);
  if (ack_fd_ >= 0) ::close(ack_fd_);
  events_fd_ = -1;
  ack_fd_    = -1;

  if (!control_dir_.empty()) {
    std::error_code ec;
    std::filesystem::remove_all(control_dir_, ec);
    if (ec) {
      OPTIRAID_LOG_WARN("cannot remove control directory", {observability::StringField("path", control_dir_.string()),
                                                             observability::StringField("error", ec.message())});
    }
    control_dir_.clear();
  }
}

} // namespace optiraid::encoder
