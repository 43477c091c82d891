#pragma once

#include "internal/burn/burn_tool.hpp"
#include "internal/process/process_runner.hpp"

namespace optiraid::burn {

// growisofs -Z <device> -R -J -V <title> <dir>
class GrowisofsBurner final : public BurnTool {
 public:
  GrowisofsBurner(std::string program, std::string device, std::filesystem::path verify_mount_point, process::ProcessRunner& runner);

  std::string Describe() const override;

  void Burn(const model::DiscBundle& bundle, const std::filesystem::path& bundle_dir) override;

  // The configured mount point; nullopt when none is configured.
  std::optional<std::filesystem::path> BurnedLocation(const std::string& title) const override;

 private:
  std::string             program_;
  std::string             device_;
  std::filesystem::path   verify_mount_point_;
  process::ProcessRunner& runner_;
};

} // namespace optiraid::burn
