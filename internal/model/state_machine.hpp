#pragma once

#include "optiraid/core/v1/types.pb.h"

namespace optiraid::model {

using SetState = ::optiraid::core::v1::SetState;

constexpr bool IsTerminal(SetState state) {
  return state == ::optiraid::core::v1::SET_STATE_VERIFIED;
}

/*
  Redundancy set lifecycle:

    OPEN -> CLOSING -> PARITY_PENDING -> CLOSED -> SEQUENCED -> BURNED -> VERIFIED

  PARITY_PENDING may be re-entered from itself (parity retry). A set never
  moves backwards.
*/
constexpr bool CanTransition(SetState from, SetState to) {
  if (from == to) {
    return from == ::optiraid::core::v1::SET_STATE_PARITY_PENDING;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (to == ::optiraid::core::v1::SET_STATE_UNSPECIFIED) {
    return false;
  }

  return static_cast<int>(to) == static_cast<int>(from) + 1;
}

} // namespace optiraid::model
