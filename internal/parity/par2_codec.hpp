#pragma once

#include <cstdint>
#include <string>

#include "internal/parity/parity_codec.hpp"
#include "internal/process/process_runner.hpp"

namespace optiraid::parity {

// Bytes par2 adds beyond its recovery blocks for a set of `files` inputs.
// Fitted to measurements of par2cmdline output.
std::uint64_t Par2OverheadBytes(std::size_t files);

/*
  External par2 (par2cmdline).

  One recovery file per parity position, each holding enough blocks to
  replace the largest data member. The <stem>.par2 index produced alongside
  is kept as an auxiliary member.
*/
class Par2Codec final : public ParityCodec {
 public:
  Par2Codec(std::string program, std::uint64_t block_bytes, process::ProcessRunner& runner);

  optiraid::runtime::config::ParityCodec Kind() const override {
    return optiraid::runtime::config::PARITY_CODEC_PAR2;
  }

  ParityResult Plan(const ParityRequest& request) const override;
  ParityResult Generate(const ParityRequest& request) override;
  void         Repair(const RepairRequest& request) override;

 private:
  std::uint64_t BlocksPerFile(std::uint64_t largest) const;

  std::string             program_;
  std::uint64_t           block_bytes_;
  process::ProcessRunner& runner_;
};

} // namespace optiraid::parity
