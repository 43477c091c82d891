#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "config/config.pb.h"
#include "internal/encoder/slice_event.hpp"
#include "internal/model/slice.hpp"

namespace optiraid::intake {

/*
  Turns encoder events into admitted slices.

  Sequence numbers must arrive as 1, 2, 3, ... A re-delivered event for the
  last admitted slice (same number, same name) is dropped so an encoder
  restart is harmless; anything else out of order is a ProtocolViolation.
*/
class SliceIntake {
 public:
  explicit SliceIntake(const optiraid::runtime::config::RuntimeConfig& config);

  // nullopt for an exact duplicate of the previous event.
  std::optional<model::Slice> Accept(const encoder::SliceEvent& event);

  std::uint64_t LastSequence() const {
    return last_sequence_;
  }

  bool SawFinal() const {
    return saw_final_;
  }

 private:
  const optiraid::runtime::config::RuntimeConfig& config_;
  std::uint64_t                                   slice_bytes_;
  std::uint64_t                                   last_sequence_ = 0;
  std::string                                     last_name_;
  bool                                            saw_final_ = false;
};

} // namespace optiraid::intake
