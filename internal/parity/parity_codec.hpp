#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "optiraid/v1.hpp"
#include "internal/model/redundancy_set.hpp"

namespace optiraid::parity {

struct ParityRequest {
  std::uint64_t set_index = 0;
  std::string   basename;
  std::uint32_t parity = 0;
  std::uint32_t digits = 0;

  // Data members in position order.
  std::vector<std::filesystem::path> inputs;
  std::vector<std::uint64_t>         input_sizes;

  std::filesystem::path output_dir;
};

struct ParityResult {
  std::vector<model::ParityShard> outputs;
  // Reed-Solomon column length; 0 for codecs without one.
  std::uint64_t shard_length = 0;
};

struct RepairRequest {
  const v1::SetManifest*   manifest = nullptr;
  std::filesystem::path    dir;
  // Member names that are missing or failed their checksum.
  std::vector<std::string> damaged;
};

/*
  Parity generator for one redundancy set.

  Generate() either leaves every output in place or none of them. Plan()
  names and sizes the outputs without touching the filesystem; Generate()
  produces exactly the planned names.
*/
class ParityCodec {
 public:
  virtual ~ParityCodec() = default;

  virtual optiraid::runtime::config::ParityCodec Kind() const = 0;

  virtual ParityResult Plan(const ParityRequest& request) const = 0;
  virtual ParityResult Generate(const ParityRequest& request)   = 0;

  // Rewrites damaged members in place; throws util::Unrecoverable when the
  // damage exceeds the parity count.
  virtual void Repair(const RepairRequest& request) = 0;
};

} // namespace optiraid::parity
