#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/model/redundancy_set.hpp"
#include "optiraid/v1.hpp"

namespace optiraid::verify {

inline constexpr std::uint32_t kManifestFormatVersion = 1;
inline constexpr std::string_view kManifestSuffix    = ".manifest";

/*
  Describes a set for restore. Checksums are filled from the staged files
  unless `with_checksums` is false (dry runs never read slice contents).
*/
v1::SetManifest BuildManifest(const optiraid::runtime::config::RuntimeConfig& config, const model::RedundancySet& set,
                              optiraid::runtime::config::ParityCodec codec, std::uint64_t shard_length, bool with_checksums);

std::string     RenderManifest(const v1::SetManifest& manifest);
v1::SetManifest ParseManifest(const std::string& text, const std::string& origin);

void            WriteManifest(const std::filesystem::path& path, const v1::SetManifest& manifest);
v1::SetManifest ReadManifest(const std::filesystem::path& path);

// Manifest files directly inside `dir`, sorted by name.
std::vector<std::filesystem::path> FindManifests(const std::filesystem::path& dir);

// Rebuilds the in-memory set a manifest describes, with files under `dir`.
model::RedundancySet SetFromManifest(const v1::SetManifest& manifest, const std::filesystem::path& dir, const std::string& manifest_name);

} // namespace optiraid::verify
