#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace optiraid::util {

/*
  File and volume naming.

  Every number is zero padded to the run's digit width so that plain lexical
  order equals numeric order. Restore locates set members by these patterns
  alone, so the formats here must never change between releases.
*/

std::string PadNumber(std::uint64_t value, std::uint32_t digits);

// <basename>.<NNNN>.<extension>, the encoder's slice name.
std::string DataSliceName(std::string_view basename, std::uint64_t sequence, std::uint32_t digits, std::string_view extension);

// <basename>.set-<SSSS>.par-<PPPP>
std::string ParityShardName(std::string_view basename, std::uint64_t set_index, std::uint32_t shard, std::uint32_t digits);

// <basename>.set-<SSSS>
std::string SetStem(std::string_view basename, std::uint64_t set_index, std::uint32_t digits);

// <basename>.set-<SSSS>.manifest
std::string ManifestName(std::string_view basename, std::uint64_t set_index, std::uint32_t digits);

// ISO 9660 volume ids are at most 32 characters: <basename[0:23]>-<GGGG>-<DDD>,
// group and disc are 1-based.
std::string DiscTitle(std::string_view basename, std::uint64_t group, std::uint64_t disc_in_group);

// Staging subdirectory a bundle is assembled in before burning.
std::string BundleDirName(std::uint64_t disc_index);

// Renders argv the way a shell would accept it back.
std::string QuoteIfNeeded(std::string_view arg);
std::string CommandLine(const std::vector<std::string>& argv);

} // namespace optiraid::util
