#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/encoder/slice_source.hpp"
#include "internal/process/process_runner.hpp"

namespace optiraid::encoder {

// dar options every backup uses, one per line, in darrc syntax. Rendered into
// the on-disc documentation as well.
std::vector<std::string> DarCreateOptions(const optiraid::runtime::config::RuntimeConfig& config);
std::string              RenderDarrc(const optiraid::runtime::config::RuntimeConfig& config);

// Stands in for the per-run control directory when the command is recorded.
inline constexpr const char* kControlDirPlaceholder = "<control-dir>";

// The full dar command line: slicing options, the slice hook, then the
// configured extra args and the user's encoder args.
std::vector<std::string> DarArgv(const optiraid::runtime::config::RuntimeConfig& config, const std::filesystem::path& self_program,
                                 const std::filesystem::path& control_dir, const std::vector<std::string>& encoder_args);

/*
  Runs dar and turns its per-slice hook invocations into SliceEvents.

  The control directory holds two FIFOs (see hook_protocol.hpp) and lives
  outside the staging area. Both FIFOs are held open read-write here, so
  neither side blocks on open and the hook sees EOF if this process dies.
*/
class DarSliceSource final : public SliceSource {
 public:
  DarSliceSource(const optiraid::runtime::config::RuntimeConfig& config, process::ProcessRunner& runner, std::filesystem::path self_program,
                 std::vector<std::string> encoder_args);
  ~DarSliceSource() override;

  DarSliceSource(const DarSliceSource&)            = delete;
  DarSliceSource& operator=(const DarSliceSource&) = delete;

  void Start() override;

  std::optional<SliceEvent> Next() override;
  void                      Acknowledge() override;
  void                      Finish() override;
  void                      Abort() override;

  const std::filesystem::path& ControlDir() const {
    return control_dir_;
  }

 private:
  std::optional<std::string> TakeLine();
  bool                       ReadAvailable(int timeout_ms);
  void                       Reply(std::string_view answer);
  void                       CloseControl();

  const optiraid::runtime::config::RuntimeConfig& config_;
  process::ProcessRunner&                         runner_;
  std::filesystem::path                           self_program_;
  std::vector<std::string>                        encoder_args_;

  std::filesystem::path                  control_dir_;
  int                                    events_fd_ = -1;
  int                                    ack_fd_    = -1;
  std::string                            pending_;
  std::unique_ptr<process::ChildProcess> child_;
  bool                                   finished_ = false;
};

} // namespace optiraid::encoder
