#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "internal/parity/parity_codec.hpp"
#include "optiraid/v1.hpp"

namespace optiraid::verify {

struct SetCheck {
  std::uint64_t            set_index = 0;
  std::string              manifest;
  std::vector<std::string> missing;
  std::vector<std::string> corrupt;
  std::size_t              parity = 0;

  std::size_t Damaged() const {
    return missing.size() + corrupt.size();
  }
  bool Intact() const {
    return Damaged() == 0;
  }
  bool Recoverable() const {
    return Damaged() <= parity;
  }
};

struct ReconstructReport {
  bool                       all_data_recovered = true;
  std::vector<std::uint64_t> sets;
  std::vector<std::string>   missing;
  std::vector<std::string>   corrupt;
  std::vector<std::string>   repaired;
};

/*
  Checks and repairs the sets found in a restore directory.

  The directory holds the union of every disc of a group (or more), so each
  set's manifest appears once. Index files of external tools are reported
  but never count against the parity budget.
*/
class SetVerifier {
 public:
  using CodecFactory = std::function<std::shared_ptr<parity::ParityCodec>(optiraid::runtime::config::ParityCodec)>;

  explicit SetVerifier(CodecFactory codecs);

  // Read-only: sizes and checksums of every member of every set.
  std::vector<SetCheck> Check(const std::filesystem::path& dir) const;

  SetCheck CheckSet(const std::filesystem::path& dir, const v1::SetManifest& manifest) const;

  // Repairs every recoverable set; throws util::Unrecoverable for the first
  // set beyond its parity once the others are repaired.
  ReconstructReport Reconstruct(const std::filesystem::path& dir);

 private:
  CodecFactory codecs_;
};

} // namespace optiraid::verify
