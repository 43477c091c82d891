#pragma once

#include <filesystem>
#include <iosfwd>

#include "internal/model/disc_bundle.hpp"

namespace optiraid::burn {

class MediaPrompt {
 public:
  virtual ~MediaPrompt() = default;

  // Blocks until the operator confirms a blank disc is in the drive.
  virtual void RequestBlankMedia(const model::DiscBundle& bundle) = 0;

  // Blocks until the operator confirms the burned disc is mounted.
  virtual void RequestMounted(const model::DiscBundle& bundle, const std::filesystem::path& mount_point) = 0;
};

class ConsolePrompt final : public MediaPrompt {
 public:
  ConsolePrompt(std::istream& in, std::ostream& out);

  void RequestBlankMedia(const model::DiscBundle& bundle) override;
  void RequestMounted(const model::DiscBundle& bundle, const std::filesystem::path& mount_point) override;

 private:
  void WaitForEnter();

  std::istream& in_;
  std::ostream& out_;
};

// Unattended runs (directory output, dry runs, prompt_for_media: false).
class NoPrompt final : public MediaPrompt {
 public:
  void RequestBlankMedia(const model::DiscBundle&) override {
  }
  void RequestMounted(const model::DiscBundle&, const std::filesystem::path&) override {
  }
};

} // namespace optiraid::burn
