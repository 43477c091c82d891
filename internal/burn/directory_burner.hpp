#pragma once

#include "internal/burn/burn_tool.hpp"

namespace optiraid::burn {

/*
  Stand-in for a burner: each disc becomes <output_dir>/<title>/.

  The disc directory appears complete or not at all: files are linked (or
  copied) into <title>.partial first and the directory is renamed at the end.
*/
class DirectoryBurner final : public BurnTool {
 public:
  explicit DirectoryBurner(std::filesystem::path output_dir);

  std::string Describe() const override;

  void Burn(const model::DiscBundle& bundle, const std::filesystem::path& bundle_dir) override;

  std::optional<std::filesystem::path> BurnedLocation(const std::string& title) const override;

 private:
  std::filesystem::path output_dir_;
};

} // namespace optiraid::burn
