#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace optiraid::burn {

/*
  Reads a burned disc back. Every expected file must exist; set members are
  checked for size and SHA-256 against the manifests found on the same disc.
  Throws util::IntegrityFailure listing every problem.
*/
void VerifyBurnedDisc(const std::filesystem::path& burned_dir, const std::vector<std::string>& files);

} // namespace optiraid::burn
