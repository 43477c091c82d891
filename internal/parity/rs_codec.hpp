#pragma once

#include <cstdint>
#include <vector>

#include "internal/parity/gf256.hpp"
#include "internal/parity/parity_codec.hpp"

namespace optiraid::parity {

/*
  Systematic Cauchy Reed-Solomon over GF(2^8).

  Data member j is column j, zero-padded to the longest member. Parity row i
  is sum_j C[i][j] * column_j with C[i][j] = 1 / ((k + i) xor j), so any
  square submatrix of C is invertible and any `parity` lost members can be
  rebuilt. Columns are streamed in fixed chunks; members larger than memory
  are fine.
*/
class ReedSolomonCodec final : public ParityCodec {
 public:
  static constexpr std::uint32_t kMaxColumns = 255;

  explicit ReedSolomonCodec(std::uint64_t chunk_bytes = 1 << 20);

  optiraid::runtime::config::ParityCodec Kind() const override {
    return optiraid::runtime::config::PARITY_CODEC_REED_SOLOMON;
  }

  ParityResult Plan(const ParityRequest& request) const override;
  ParityResult Generate(const ParityRequest& request) override;
  void         Repair(const RepairRequest& request) override;

  // Coefficient matrix, `parity` rows by `data` columns.
  static gf256::Matrix CauchyMatrix(std::uint32_t data, std::uint32_t parity);

 private:
  std::uint64_t chunk_bytes_;
};

} // namespace optiraid::parity
