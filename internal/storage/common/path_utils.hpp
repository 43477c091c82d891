#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace optiraid::storage::common {

// Set members are flat files directly under a staging or restore root.
inline void ValidateMemberName(const std::string& name) {
  if (name.empty()) {
    throw std::invalid_argument("member name must not be empty");
  }
  for (char c : name) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument("member name contains invalid character: " + name);
    }
  }
  if (name == "." || name == "..") {
    throw std::invalid_argument("member name must not be a relative path component");
  }
}

inline std::filesystem::path TempPathFor(const std::filesystem::path& final_path) {
  return final_path.string() + ".tmp";
}

} // namespace optiraid::storage::common
