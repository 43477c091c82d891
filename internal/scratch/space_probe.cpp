#include "space_probe.hpp"

namespace optiraid::scratch {

std::filesystem::path NearestExistingAncestor(const std::filesystem::path& path) {
  auto current = std::filesystem::absolute(path).lexically_normal();
  while (!std::filesystem::exists(current) && current.has_parent_path() && current != current.parent_path()) {
    current = current.parent_path();
  }
  return current;
}

std::uint64_t StatvfsProbe::FreeBytes(const std::filesystem::path& path) {
  return std::filesystem::space(NearestExistingAncestor(path)).available;
}

} // namespace optiraid::scratch
