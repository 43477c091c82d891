#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "internal/model/disc_bundle.hpp"

namespace optiraid::burn {

/*
  Writes one staged disc directory to its medium.

  Implementations must not retry on their own: a failed burn is reported and
  the caller decides, after re-verifying, whether to burn again.
*/
class BurnTool {
 public:
  virtual ~BurnTool() = default;

  virtual std::string Describe() const = 0;

  virtual void Burn(const model::DiscBundle& bundle, const std::filesystem::path& bundle_dir) = 0;

  // Where the files of a burned disc can be read back, if anywhere.
  virtual std::optional<std::filesystem::path> BurnedLocation(const std::string& title) const = 0;
};

} // namespace optiraid::burn
