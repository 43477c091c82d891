#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace optiraid::model {

/*
  One fixed-size archive slice as produced by the encoder.

  Sequence numbers are the encoder's own (1-based); the set index is derived
  from them. Immutable once admitted.
*/
struct Slice {
  std::string           basename;
  std::uint64_t         set_index = 0;
  std::uint64_t         sequence  = 0;
  std::string           extension;
  std::filesystem::path path;
  std::uint64_t         size_bytes = 0;
  bool                  is_final   = false;

  std::string Name() const {
    return path.filename().string();
  }
};

} // namespace optiraid::model
