#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace optiraid::encoder {

// Encoder contexts as dar reports them through %c.
inline constexpr std::string_view kContextInit       = "init";
inline constexpr std::string_view kContextOperation  = "operation";
inline constexpr std::string_view kContextOperating  = "operating";
inline constexpr std::string_view kContextLastSlice  = "last_slice";

/*
  "A slice is complete" notification from the archive encoder.
*/
struct SliceEvent {
  std::filesystem::path dir;
  std::string           basename;
  std::uint64_t         slice_number = 0;
  std::string           extension;
  std::string           context;

  // Set by sources that never write the slice (dry runs); otherwise the
  // size is taken from the file.
  std::optional<std::uint64_t> size_bytes;

  bool IsFinal() const {
    return context == kContextLastSlice;
  }
};

inline bool IsKnownContext(std::string_view context) {
  return context == kContextInit || context == kContextOperation || context == kContextOperating || context == kContextLastSlice;
}

} // namespace optiraid::encoder
