#pragma once

#include <cstdint>
#include <exception>

#include "internal/parity/parity_codec.hpp"

namespace optiraid::parity {

/*
  A scheduled parity generation for one closed set.
*/
struct ParityTask {
  std::uint64_t set_index = 0;
  ParityRequest request;
};

struct ParityCompletion {
  std::uint64_t      set_index = 0;
  ParityResult       result;
  std::exception_ptr error;
};

} // namespace optiraid::parity
