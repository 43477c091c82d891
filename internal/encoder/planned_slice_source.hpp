#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/encoder/slice_source.hpp"

namespace optiraid::encoder {

// Sum of regular file sizes below the encoder's filesystem root (-R / --fs-root,
// the current directory when absent). Uncompressed, so an upper bound.
std::uint64_t EstimateInputBytes(const std::vector<std::string>& encoder_args);

/*
  Slice events for a dry run: the archive is never written, each event
  carries the size the slice would have.
*/
class PlannedSliceSource final : public SliceSource {
 public:
  PlannedSliceSource(const optiraid::runtime::config::RuntimeConfig& config, std::uint64_t estimated_bytes);

  void Start() override {
  }

  std::optional<SliceEvent> Next() override;

  void Acknowledge() override {
  }
  void Finish() override {
  }
  void Abort() override {
  }

  std::uint64_t SliceCount() const {
    return slice_count_;
  }

 private:
  const optiraid::runtime::config::RuntimeConfig& config_;
  std::uint64_t                                   estimated_bytes_;
  std::uint64_t                                   slice_bytes_;
  std::uint64_t                                   slice_count_;
  std::uint64_t                                   next_ = 1;
};

} // namespace optiraid::encoder
