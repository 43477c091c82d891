#include "growisofs_burner.hpp"

#include "internal/observability/logging.hpp"

namespace optiraid::burn {

GrowisofsBurner::GrowisofsBurner(std::string program, std::string device, std::filesystem::path verify_mount_point, process::ProcessRunner& runner)
    : program_(std::move(program)), device_(std::move(device)), verify_mount_point_(std::move(verify_mount_point)), runner_(runner) {
}

std::string GrowisofsBurner::Describe() const {
  return program_ + " on " + device_;
}

void GrowisofsBurner::Burn(const model::DiscBundle& bundle, const std::filesystem::path& bundle_dir) {
  const std::vector<std::string> argv = {program_, "-Z", device_, "-R", "-J", "-V", bundle.title, bundle_dir.string()};

  OPTIRAID_LOG_INFO("burning disc", {observability::StringField("title", bundle.title), observability::StringField("device", device_)});
  process::ThrowIfFailed(runner_.Run(argv));
}

std::optional<std::filesystem::path> GrowisofsBurner::BurnedLocation(const std::string&) const {
  if (verify_mount_point_.empty()) return std::nullopt;
  return verify_mount_point_;
}

} // namespace optiraid::burn
