#include "gf256.hpp"

#include <array>
#include <stdexcept>
#include <utility>

namespace optiraid::parity::gf256 {

namespace {

constexpr unsigned kPolynomial = 0x11D;

struct Tables {
  std::array<std::uint8_t, 512> exp{};
  std::array<std::uint8_t, 256> log{};

  Tables() {
    unsigned x = 1;
    for (unsigned i = 0; i < 255; ++i) {
      exp[i] = static_cast<std::uint8_t>(x);
      log[x] = static_cast<std::uint8_t>(i);
      x <<= 1;
      if (x & 0x100) x ^= kPolynomial;
    }
    for (unsigned i = 255; i < exp.size(); ++i) {
      exp[i] = exp[i - 255];
    }
  }
};

const Tables& T() {
  static const Tables tables;
  return tables;
}

} // namespace

std::uint8_t Mul(std::uint8_t a, std::uint8_t b) {
  if (a == 0 || b == 0) return 0;
  const auto& t = T();
  return t.exp[t.log[a] + t.log[b]];
}

std::uint8_t Div(std::uint8_t a, std::uint8_t b) {
  if (b == 0) throw std::domain_error("gf256 division by zero");
  if (a == 0) return 0;
  const auto& t = T();
  return t.exp[t.log[a] + 255 - t.log[b]];
}

std::uint8_t Inv(std::uint8_t a) {
  return Div(1, a);
}

void MulAddRegion(std::uint8_t* dst, const std::uint8_t* src, std::uint8_t coef, std::size_t length) {
  if (coef == 0) return;
  if (coef == 1) {
    for (std::size_t i = 0; i < length; ++i) dst[i] ^= src[i];
    return;
  }

  // one row of the multiplication table per call
  const auto&                   t = T();
  std::array<std::uint8_t, 256> row{};
  const unsigned                log_coef = t.log[coef];
  for (unsigned v = 1; v < 256; ++v) {
    row[v] = t.exp[t.log[v] + log_coef];
  }
  for (std::size_t i = 0; i < length; ++i) {
    dst[i] ^= row[src[i]];
  }
}

Matrix Invert(Matrix m) {
  const std::size_t n = m.size();
  Matrix            inv(n, std::vector<std::uint8_t>(n, 0));
  for (std::size_t i = 0; i < n; ++i) {
    if (m[i].size() != n) throw std::invalid_argument("matrix is not square");
    inv[i][i] = 1;
  }

  for (std::size_t col = 0; col < n; ++col) {
    std::size_t pivot = col;
    while (pivot < n && m[pivot][col] == 0) ++pivot;
    if (pivot == n) throw std::domain_error("singular matrix");
    std::swap(m[pivot], m[col]);
    std::swap(inv[pivot], inv[col]);

    const auto scale = Inv(m[col][col]);
    for (std::size_t j = 0; j < n; ++j) {
      m[col][j]   = Mul(m[col][j], scale);
      inv[col][j] = Mul(inv[col][j], scale);
    }

    for (std::size_t row = 0; row < n; ++row) {
      if (row == col || m[row][col] == 0) continue;
      const auto factor = m[row][col];
      for (std::size_t j = 0; j < n; ++j) {
        m[row][j] ^= Mul(factor, m[col][j]);
        inv[row][j] ^= Mul(factor, inv[col][j]);
      }
    }
  }
  return inv;
}

} // namespace optiraid::parity::gf256
