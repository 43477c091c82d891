#include "hook_protocol.hpp"

#include <fcntl.h>
#include <limits.h>
#include <unistd.h>

#include <cerrno>
#include <charconv>
#include <iostream>

#include "internal/util/errors.hpp"

namespace optiraid::encoder {

using util::ProtocolViolation;

namespace {

constexpr std::string_view kRecordTag = "slice";
constexpr std::size_t      kFieldCount = 6;

void CheckField(std::string_view name, std::string_view value) {
  if (value.find_first_of("\t\n") != std::string_view::npos) {
    throw ProtocolViolation("slice event field '" + std::string(name) + "' contains a tab or newline");
  }
}

std::vector<std::string_view> Split(std::string_view line, char sep) {
  std::vector<std::string_view> parts;
  std::size_t                   start = 0;
  while (true) {
    const auto pos = line.find(sep, start);
    if (pos == std::string_view::npos) {
      parts.push_back(line.substr(start));
      break;
    }
    parts.push_back(line.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

bool WriteAll(int fd, std::string_view data) {
  while (!data.empty()) {
    const ssize_t n = ::write(fd, data.data(), data.size());
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    data.remove_prefix(static_cast<std::size_t>(n));
  }
  return true;
}

std::string ReadLine(int fd) {
  std::string line;
  char        c = 0;
  while (true) {
    const ssize_t n = ::read(fd, &c, 1);
    if (n == 1) {
      line.push_back(c);
      if (c == '\n') break;
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    break;
  }
  return line;
}

} // namespace

std::string FormatEvent(const SliceEvent& event) {
  CheckField("dir", event.dir.string());
  CheckField("basename", event.basename);
  CheckField("extension", event.extension);
  CheckField("context", event.context);

  std::string line(kRecordTag);
  line += '\t';
  line += event.dir.string();
  line += '\t';
  line += event.basename;
  line += '\t';
  line += std::to_string(event.slice_number);
  line += '\t';
  line += event.extension;
  line += '\t';
  line += event.context;
  line += '\n';

  if (line.size() > PIPE_BUF) {
    throw ProtocolViolation("slice event exceeds " + std::to_string(PIPE_BUF) + " bytes");
  }
  return line;
}

SliceEvent ParseEvent(std::string_view line) {
  if (!line.empty() && line.back() == '\n') {
    line.remove_suffix(1);
  }

  auto fields = Split(line, '\t');
  if (fields.size() != kFieldCount || fields[0] != kRecordTag) {
    throw ProtocolViolation("malformed slice event: '" + std::string(line) + "'");
  }

  SliceEvent event;
  event.dir       = std::string(fields[1]);
  event.basename  = std::string(fields[2]);
  event.extension = std::string(fields[4]);
  event.context   = std::string(fields[5]);

  const auto number = fields[3];
  const auto parsed = std::from_chars(number.data(), number.data() + number.size(), event.slice_number);
  if (number.empty() || parsed.ec != std::errc() || parsed.ptr != number.data() + number.size()) {
    throw ProtocolViolation("slice number is not a number: '" + std::string(number) + "'");
  }

  if (event.dir.empty() || event.basename.empty() || event.extension.empty()) {
    throw ProtocolViolation("slice event has empty fields: '" + std::string(line) + "'");
  }
  if (!IsKnownContext(event.context)) {
    throw ProtocolViolation("unknown encoder context '" + event.context + "'");
  }
  return event;
}

int RunHook(const std::filesystem::path& control_dir, const std::vector<std::string>& args) {
  if (args.size() != kFieldCount - 1) {
    std::cerr << "optiraid hook: expected <dir> <basename> <number> <extension> <context>\n";
    return 1;
  }

  std::string line;
  try {
    line = FormatEvent(ParseEvent(std::string(kRecordTag) + '\t' + args[0] + '\t' + args[1] + '\t' + args[2] + '\t' + args[3] + '\t' + args[4]));
  } catch (const ProtocolViolation& e) {
    std::cerr << "optiraid hook: " << e.what() << "\n";
    return 1;
  }

  const auto events_path = control_dir / std::string(kEventsFifo);
  const auto ack_path    = control_dir / std::string(kAckFifo);

  const int events_fd = ::open(events_path.c_str(), O_WRONLY | O_CLOEXEC);
  if (events_fd < 0) {
    std::cerr << "optiraid hook: cannot open " << events_path << "\n";
    return 1;
  }
  const bool written = WriteAll(events_fd, line);
  ::close(events_fd);
  if (!written) {
    std::cerr << "optiraid hook: cannot write slice event\n";
    return 1;
  }

  const int ack_fd = ::open(ack_path.c_str(), O_RDONLY | O_CLOEXEC);
  if (ack_fd < 0) {
    std::cerr << "optiraid hook: cannot open " << ack_path << "\n";
    return 1;
  }
  const auto answer = ReadLine(ack_fd);
  ::close(ack_fd);

  // a non-zero exit makes the encoder abort the archive
  return answer == kAckOk ? 0 : 1;
}

} // namespace optiraid::encoder
