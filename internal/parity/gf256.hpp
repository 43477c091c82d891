#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace optiraid::parity::gf256 {

/*
  Arithmetic in GF(2^8) with the primitive polynomial x^8+x^4+x^3+x^2+1
  (0x11D). Addition is XOR.
*/

std::uint8_t Mul(std::uint8_t a, std::uint8_t b);
std::uint8_t Div(std::uint8_t a, std::uint8_t b);
std::uint8_t Inv(std::uint8_t a);

// dst[i] ^= coef * src[i]
void MulAddRegion(std::uint8_t* dst, const std::uint8_t* src, std::uint8_t coef, std::size_t length);

using Matrix = std::vector<std::vector<std::uint8_t>>;

// Gauss-Jordan inversion; throws std::domain_error for a singular matrix.
Matrix Invert(Matrix m);

} // namespace optiraid::parity::gf256
