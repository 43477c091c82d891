#pragma once

#include <cstdint>
#include <string>

#include "optiraid/core/v1/types.pb.h"

namespace optiraid::db::model {

/*
  One backup run, keyed by its absolute staging directory.
*/
struct RunRecord {
  std::string run_id;
  std::string basename;

  ::optiraid::core::v1::RunState state = ::optiraid::core::v1::RUN_STATE_UNSPECIFIED;

  // Last admitted encoder slice.
  std::uint64_t last_sequence = 0;

  // Discs and groups already emitted; resume continues numbering after them.
  std::uint64_t discs_emitted  = 0;
  std::uint64_t groups_emitted = 0;

  // Command lines the backup was started with, as written on its discs.
  std::string invocation;
};

} // namespace optiraid::db::model
