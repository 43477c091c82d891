#pragma once

#include <filesystem>

#include "internal/model/disc_bundle.hpp"

namespace optiraid::burn {

// Assembles a bundle as <staging>/__discNNNN/: members and manifests are hard
// links into staging, documents are written out. Restaging replaces an
// earlier attempt.
std::filesystem::path StageBundle(const model::DiscBundle& bundle, const std::filesystem::path& staging_dir);

std::filesystem::path BundleDir(const model::DiscBundle& bundle, const std::filesystem::path& staging_dir);

} // namespace optiraid::burn
