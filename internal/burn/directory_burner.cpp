#include "directory_burner.hpp"

#include "internal/observability/logging.hpp"
#include "internal/storage/staging_store.hpp"

namespace optiraid::burn {

DirectoryBurner::DirectoryBurner(std::filesystem::path output_dir) : output_dir_(std::move(output_dir)) {
}

std::string DirectoryBurner::Describe() const {
  return "directory " + output_dir_.string();
}

void DirectoryBurner::Burn(const model::DiscBundle& bundle, const std::filesystem::path& bundle_dir) {
  const auto target  = output_dir_ / bundle.title;
  const auto partial = output_dir_ / (bundle.title + ".partial");

  std::filesystem::create_directories(output_dir_);
  std::filesystem::remove_all(partial);
  std::filesystem::create_directory(partial);

  for (const auto& entry : std::filesystem::directory_iterator(bundle_dir)) {
    storage::LinkOrCopy(entry.path(), partial / entry.path().filename());
  }

  if (std::filesystem::exists(target)) {
    OPTIRAID_LOG_WARN("replacing earlier output for disc", {observability::StringField("path", target.string())});
    std::filesystem::remove_all(target);
  }
  std::filesystem::rename(partial, target);

  OPTIRAID_LOG_INFO("disc written", {observability::StringField("title", bundle.title), observability::StringField("path", target.string())});
}

std::optional<std::filesystem::path> DirectoryBurner::BurnedLocation(const std::string& title) const {
  return output_dir_ / title;
}

} // namespace optiraid::burn
