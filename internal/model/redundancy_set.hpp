#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "internal/model/slice.hpp"
#include "optiraid/core/v1/types.pb.h"

namespace optiraid::model {

// A parity codec output. Role PARITY marks the shard that fills parity
// position `position`; role INDEX marks auxiliary files (par2 index).
struct ParityShard {
  std::string                    name;
  std::filesystem::path          path;
  std::uint64_t                  size_bytes = 0;
  std::uint32_t                  position   = 0;
  ::optiraid::core::v1::MemberRole role     = ::optiraid::core::v1::MEMBER_ROLE_PARITY;
};

struct RedundancySet {
  std::uint64_t            index = 0;
  std::vector<Slice>       data;
  std::vector<ParityShard> parity;
  ::optiraid::core::v1::SetState state = ::optiraid::core::v1::SET_STATE_OPEN;

  // Written once parity is in place.
  std::string manifest_name;

  std::uint64_t DataBytes() const {
    std::uint64_t total = 0;
    for (const auto& slice : data) total += slice.size_bytes;
    return total;
  }

  std::uint64_t ParityBytes() const {
    std::uint64_t total = 0;
    for (const auto& shard : parity) total += shard.size_bytes;
    return total;
  }

  std::uint64_t TotalBytes() const {
    return DataBytes() + ParityBytes();
  }
};

} // namespace optiraid::model
