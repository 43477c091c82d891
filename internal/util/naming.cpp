#include "naming.hpp"

#include <algorithm>

namespace optiraid::util {

namespace {

constexpr std::size_t kMaxVolumeId = 32;

} // namespace

std::string PadNumber(std::uint64_t value, std::uint32_t digits) {
  auto text = std::to_string(value);
  if (text.size() < digits) {
    text.insert(0, digits - text.size(), '0');
  }
  return text;
}

std::string DataSliceName(std::string_view basename, std::uint64_t sequence, std::uint32_t digits, std::string_view extension) {
  std::string name(basename);
  name += '.';
  name += PadNumber(sequence, digits);
  name += '.';
  name += extension;
  return name;
}

std::string SetStem(std::string_view basename, std::uint64_t set_index, std::uint32_t digits) {
  std::string stem(basename);
  stem += ".set-";
  stem += PadNumber(set_index, digits);
  return stem;
}

std::string ParityShardName(std::string_view basename, std::uint64_t set_index, std::uint32_t shard, std::uint32_t digits) {
  return SetStem(basename, set_index, digits) + ".par-" + PadNumber(shard, digits);
}

std::string ManifestName(std::string_view basename, std::uint64_t set_index, std::uint32_t digits) {
  return SetStem(basename, set_index, digits) + ".manifest";
}

std::string DiscTitle(std::string_view basename, std::uint64_t group, std::uint64_t disc_in_group) {
  // room for "-GGGG-DDD"
  const std::size_t keep = kMaxVolumeId - 4 - 3 - 2;
  std::string       title(basename.substr(0, std::min(basename.size(), keep)));
  title += '-';
  title += PadNumber(group, 4);
  title += '-';
  title += PadNumber(disc_in_group, 3);
  return title;
}

std::string BundleDirName(std::uint64_t disc_index) {
  return "__disc" + PadNumber(disc_index, 4);
}

std::string QuoteIfNeeded(std::string_view arg) {
  if (!arg.empty() && arg.find_first_of(" \t\n'\"\\$`*?;&|<>()") == std::string_view::npos) {
    return std::string(arg);
  }

  std::string quoted = "'";
  for (char c : arg) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += '\'';
  return quoted;
}

std::string CommandLine(const std::vector<std::string>& argv) {
  std::string line;
  for (const auto& arg : argv) {
    if (!line.empty()) {
      line += ' ';
    }
    line += QuoteIfNeeded(arg);
  }
  return line;
}

} // namespace optiraid::util
