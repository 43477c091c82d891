#pragma once

#include <optional>

#include "internal/encoder/slice_event.hpp"

namespace optiraid::encoder {

/*
  Lazy, finite sequence of slice events.

  The encoder is paused after every event until Acknowledge() is called, so
  the core decides when the next slice may be produced.
*/
class SliceSource {
 public:
  virtual ~SliceSource() = default;

  // Launches the encoder; nothing is produced before this.
  virtual void Start() = 0;

  // Blocks for the next event; nullopt once the encoder finished.
  virtual std::optional<SliceEvent> Next() = 0;

  // The last returned event has been admitted.
  virtual void Acknowledge() = 0;

  // Waits for the encoder to exit; throws util::ExternalToolFailure on failure.
  virtual void Finish() = 0;

  // Stops the encoder after an error elsewhere in the run.
  virtual void Abort() = 0;
};

} // namespace optiraid::encoder
