#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/model/disc_bundle.hpp"
#include "internal/model/redundancy_set.hpp"
#include "internal/sequencer/documentation.hpp"

namespace optiraid::sequencer {

/*
  Lays closed sets out onto disc groups.

  A group is set_size + parity discs. Data member i of every set lands on
  disc i of the group and parity shard j on disc set_size + j, so no disc
  carries two members of one set. A set goes into the current group only if
  every disc it touches still has room; otherwise the group is flushed and
  the set opens the next one.
*/
class DiscSequencer {
 public:
  // Numbering continues after `groups_emitted` / `discs_emitted` (resume).
  // `invocation` is written into every README.
  DiscSequencer(const optiraid::runtime::config::RuntimeConfig& config, std::uint64_t groups_emitted = 0, std::uint64_t discs_emitted = 0,
                std::optional<std::filesystem::path> program_copy = std::nullopt, std::string invocation = {});

  // Places a set; returns the bundles of the group it displaced, if any.
  std::vector<model::DiscBundle> Place(const model::RedundancySet& set);

  // Emits the current group, if it holds anything.
  std::vector<model::DiscBundle> Flush();

  bool Empty() const {
    return sets_.empty();
  }

  // 1-based index of the group being filled.
  std::uint64_t GroupIndex() const {
    return groups_emitted_ + 1;
  }

  std::uint64_t GroupsEmitted() const {
    return groups_emitted_;
  }

  std::uint64_t DiscsEmitted() const {
    return discs_emitted_;
  }

  // Usable bytes per disc.
  std::uint64_t Capacity() const {
    return capacity_;
  }

  // Member bytes already placed on each disc of the current group.
  const std::vector<std::uint64_t>& Used() const {
    return used_;
  }

 private:
  // Member files a set puts on each disc of a group.
  std::vector<std::vector<model::DiscFile>> Split(const model::RedundancySet& set) const;

  const optiraid::runtime::config::RuntimeConfig& config_;
  std::filesystem::path                           staging_dir_;
  std::optional<std::filesystem::path>            program_copy_;
  std::string                                     invocation_;
  std::uint32_t                                   data_discs_;
  std::uint32_t                                   discs_;
  std::uint64_t                                   capacity_;

  std::uint64_t groups_emitted_;
  std::uint64_t discs_emitted_;

  std::vector<std::vector<model::DiscFile>> members_;
  std::vector<std::vector<std::uint64_t>>   disc_sets_;
  std::vector<std::uint64_t>                used_;
  std::vector<SetSummary>                   sets_;
};

} // namespace optiraid::sequencer
