#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "optiraid/core/v1/types.pb.h"

namespace optiraid::db::model {

struct BundleRecord {
  std::string   run_id;
  std::uint64_t disc_index  = 0;
  std::uint64_t group_index = 0;
  std::uint32_t position    = 0;
  std::string   title;
  bool          pure_parity = false;
  std::uint64_t total_bytes = 0;

  ::optiraid::core::v1::BundleState state = ::optiraid::core::v1::BUNDLE_STATE_UNSPECIFIED;

  // File names on the disc, in burn order.
  std::vector<std::string> files;
  // Member files that are removed from staging once this disc is verified.
  std::vector<std::string> owned_files;
};

} // namespace optiraid::db::model
