#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace optiraid::model {

enum class DiscFileKind {
  kMember,   // data slice or parity output, on exactly one disc
  kManifest, // copied onto every disc of the group
  kDocument, // rendered text, written when the disc is staged
  kProgram,  // copy of the optiraid executable
};

struct DiscFile {
  std::string           name;
  DiscFileKind          kind = DiscFileKind::kMember;
  std::filesystem::path source;
  std::uint64_t         size_bytes = 0;
  // Document text; empty for other kinds.
  std::string content;
};

/*
  Everything that goes onto one physical disc.

  total_bytes counts set members only; manifests and documentation are
  carried in the per-disc reserve.
*/
struct DiscBundle {
  std::uint64_t              disc_index  = 0; // global, 1-based
  std::uint64_t              group_index = 0; // 1-based
  std::uint32_t              position    = 0; // 1-based disc within the group
  std::string                title;
  bool                       pure_parity = false;
  std::vector<DiscFile>      files;
  std::uint64_t              total_bytes = 0;
  std::vector<std::uint64_t> set_indexes;

  std::vector<std::string> FileNames() const {
    std::vector<std::string> names;
    for (const auto& file : files) names.push_back(file.name);
    return names;
  }

  std::vector<std::string> MemberNames() const {
    std::vector<std::string> names;
    for (const auto& file : files) {
      if (file.kind == DiscFileKind::kMember) names.push_back(file.name);
    }
    return names;
  }
};

} // namespace optiraid::model
