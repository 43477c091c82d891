#pragma once

#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/model/disc_bundle.hpp"

namespace optiraid::sequencer {

inline constexpr const char* kReadmeName = "README.txt";
inline constexpr const char* kConfigName = "optiraid.yaml";

// What a README says about one set of its group.
struct SetSummary {
  std::uint64_t            index = 0;
  std::vector<std::string> data;
  std::vector<std::string> parity;
  std::string              manifest;
};

// optiraid's own command line and the encoder command it spawns, one per line.
std::string RenderInvocation(const std::vector<std::string>& command, const std::vector<std::string>& encoder);

// Explains the layout and the restore procedure, ending with `invocation`
// when there is one; no timestamps, so equal inputs render equal text.
std::string RenderOverview(const optiraid::runtime::config::RuntimeConfig& config, const std::string& invocation);

// Per-disc README: the overview plus where this disc sits and what it holds.
std::string RenderReadme(const optiraid::runtime::config::RuntimeConfig& config, const std::string& invocation, const model::DiscBundle& bundle,
                         std::uint32_t discs_in_group, const std::vector<SetSummary>& sets);

} // namespace optiraid::sequencer
