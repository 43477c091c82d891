#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "internal/encoder/slice_event.hpp"

namespace optiraid::encoder {

/*
  Wire protocol between `optiraid hook` (run by the encoder after each slice)
  and the running backup.

  The hook writes one line to <control>/events:

      slice \t <dir> \t <basename> \t <number> \t <extension> \t <context> \n

  and then blocks reading <control>/ack until the core answers "ok" (slice
  admitted, continue) or "abort". Lines are shorter than PIPE_BUF so writes
  from the hook are atomic.
*/

inline constexpr std::string_view kEventsFifo = "events";
inline constexpr std::string_view kAckFifo    = "ack";
inline constexpr std::string_view kAckOk      = "ok\n";
inline constexpr std::string_view kAckAbort   = "abort\n";

// Throws util::ProtocolViolation when a field cannot be framed.
std::string FormatEvent(const SliceEvent& event);

// Throws util::ProtocolViolation on malformed input.
SliceEvent ParseEvent(std::string_view line);

// Entry point of `optiraid hook <control-dir> <dir> <basename> <number>
// <extension> <context>`. Returns the process exit code.
int RunHook(const std::filesystem::path& control_dir, const std::vector<std::string>& args);

} // namespace optiraid::encoder
