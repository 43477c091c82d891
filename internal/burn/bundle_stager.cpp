#include "bundle_stager.hpp"

#include "internal/storage/staging_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/naming.hpp"

namespace optiraid::burn {

std::filesystem::path BundleDir(const model::DiscBundle& bundle, const std::filesystem::path& staging_dir) {
  return staging_dir / util::BundleDirName(bundle.disc_index);
}

std::filesystem::path StageBundle(const model::DiscBundle& bundle, const std::filesystem::path& staging_dir) {
  const auto dir = BundleDir(bundle, staging_dir);
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);

  for (const auto& file : bundle.files) {
    const auto target = dir / file.name;
    if (file.kind == model::DiscFileKind::kDocument) {
      storage::WriteFileAtomic(target, file.content, false);
      continue;
    }
    if (!std::filesystem::is_regular_file(file.source)) {
      throw util::IntegrityFailure("file " + file.source.string() + " for disc " + bundle.title + " is missing");
    }
    storage::LinkOrCopy(file.source, target);
  }
  return dir;
}

} // namespace optiraid::burn
