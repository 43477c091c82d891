#include "manifest_io.hpp"

#include <google/protobuf/text_format.h>

#include <algorithm>
#include <stdexcept>

#include "internal/storage/common/checksum.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/staging_store.hpp"
#include "internal/util/errors.hpp"

namespace optiraid::verify {

using optiraid::runtime::config::RuntimeConfig;

v1::SetManifest BuildManifest(const RuntimeConfig& config, const model::RedundancySet& set, optiraid::runtime::config::ParityCodec codec,
                              std::uint64_t shard_length, bool with_checksums) {
  v1::SetManifest manifest;
  manifest.set_format_version(kManifestFormatVersion);
  manifest.set_basename(config.layout().basename());
  manifest.set_set_index(set.index);
  manifest.set_set_size(config.layout().set_size());
  manifest.set_parity(config.layout().parity());
  manifest.set_codec(codec);
  manifest.set_shard_length(shard_length);
  manifest.set_digits(config.layout().digits());

  std::uint32_t position = 0;
  for (const auto& slice : set.data) {
    auto* member = manifest.add_members();
    member->set_name(slice.Name());
    member->set_role(v1::MEMBER_ROLE_DATA);
    member->set_position(position++);
    member->set_size_bytes(slice.size_bytes);
    member->set_sequence(slice.sequence);
    if (with_checksums) member->set_sha256(storage::common::Sha256HexOfFile(slice.path));
  }

  for (const auto& shard : set.parity) {
    auto* member = manifest.add_members();
    member->set_name(shard.name);
    member->set_role(shard.role);
    member->set_position(shard.position);
    member->set_size_bytes(shard.size_bytes);
    if (with_checksums) member->set_sha256(storage::common::Sha256HexOfFile(shard.path));
  }
  return manifest;
}

std::string RenderManifest(const v1::SetManifest& manifest) {
  std::string text;
  if (!google::protobuf::TextFormat::PrintToString(manifest, &text)) {
    throw std::runtime_error("cannot render manifest for set " + std::to_string(manifest.set_index()));
  }
  return text;
}

v1::SetManifest ParseManifest(const std::string& text, const std::string& origin) {
  v1::SetManifest manifest;
  if (!google::protobuf::TextFormat::ParseFromString(text, &manifest)) {
    throw util::IntegrityFailure("unreadable manifest " + origin);
  }
  if (manifest.format_version() != kManifestFormatVersion) {
    throw util::IntegrityFailure("manifest " + origin + " has unsupported format version " + std::to_string(manifest.format_version()));
  }
  // members are joined onto restore directories, so no name may leave them
  for (const auto& member : manifest.members()) {
    try {
      storage::common::ValidateMemberName(member.name());
    } catch (const std::invalid_argument& e) {
      throw util::IntegrityFailure("manifest " + origin + ": " + e.what());
    }
  }
  return manifest;
}

void WriteManifest(const std::filesystem::path& path, const v1::SetManifest& manifest) {
  storage::WriteFileAtomic(path, RenderManifest(manifest), true);
}

v1::SetManifest ReadManifest(const std::filesystem::path& path) {
  std::string text;
  try {
    text = storage::ReadTextFile(path);
  } catch (const std::exception& e) {
    throw util::IntegrityFailure("cannot read manifest " + path.string() + ": " + e.what());
  }
  return ParseManifest(text, path.string());
}

std::vector<std::filesystem::path> FindManifests(const std::filesystem::path& dir) {
  std::vector<std::filesystem::path> out;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    if (!entry.is_regular_file()) continue;
    const auto name = entry.path().filename().string();
    if (name.size() > kManifestSuffix.size() && name.ends_with(kManifestSuffix)) {
      out.push_back(entry.path());
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

model::RedundancySet SetFromManifest(const v1::SetManifest& manifest, const std::filesystem::path& dir, const std::string& manifest_name) {
  model::RedundancySet set;
  set.index         = manifest.set_index();
  set.state         = v1::SET_STATE_CLOSED;
  set.manifest_name = manifest_name;

  for (const auto& member : manifest.members()) {
    if (member.role() == v1::MEMBER_ROLE_DATA) {
      model::Slice slice;
      slice.basename   = manifest.basename();
      slice.set_index  = manifest.set_index();
      slice.sequence   = member.sequence();
      slice.path       = dir / member.name();
      slice.size_bytes = member.size_bytes();
      const auto dot   = member.name().rfind('.');
      slice.extension  = dot == std::string::npos ? std::string() : member.name().substr(dot + 1);
      set.data.push_back(std::move(slice));
    } else {
      model::ParityShard shard;
      shard.name       = member.name();
      shard.path       = dir / member.name();
      shard.size_bytes = member.size_bytes();
      shard.position   = member.position();
      shard.role       = member.role();
      set.parity.push_back(std::move(shard));
    }
  }

  std::sort(set.data.begin(), set.data.end(), [](const auto& a, const auto& b) { return a.sequence < b.sequence; });
  return set;
}

} // namespace optiraid::verify
