#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "optiraid/core/v1/types.pb.h"

namespace optiraid::db::model {

struct SetMemberRecord {
  std::uint64_t sequence   = 0;
  std::uint64_t size_bytes = 0;
  std::string   name;
};

/*
  Persistent redundancy set row. Data members are recorded as soon as the set
  closes so a failed parity run can be retried without the encoder.
*/
struct SetRecord {
  std::string   run_id;
  std::uint64_t set_index = 0;

  ::optiraid::core::v1::SetState state = ::optiraid::core::v1::SET_STATE_UNSPECIFIED;

  std::vector<SetMemberRecord> members;

  // Most recent failure, empty once parity succeeded.
  std::string last_error;
};

} // namespace optiraid::db::model
