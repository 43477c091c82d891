#include "burn_verifier.hpp"

#include <set>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/checksum.hpp"
#include "internal/util/errors.hpp"
#include "internal/verify/manifest_io.hpp"

namespace optiraid::burn {

void VerifyBurnedDisc(const std::filesystem::path& burned_dir, const std::vector<std::string>& files) {
  std::vector<std::string> problems;
  const std::set<std::string> expected(files.begin(), files.end());

  for (const auto& name : files) {
    if (!std::filesystem::is_regular_file(burned_dir / name)) problems.push_back(name + " missing");
  }

  std::size_t checked = 0;
  for (const auto& name : files) {
    if (!name.ends_with(verify::kManifestSuffix) || !std::filesystem::is_regular_file(burned_dir / name)) continue;

    const auto manifest = verify::ReadManifest(burned_dir / name);
    for (const auto& member : manifest.members()) {
      if (!expected.contains(member.name())) continue;
      const auto path = burned_dir / member.name();
      if (!std::filesystem::is_regular_file(path)) continue;

      if (std::filesystem::file_size(path) != member.size_bytes()) {
        problems.push_back(member.name() + " has the wrong size");
      } else if (!member.sha256().empty() && storage::common::Sha256HexOfFile(path) != member.sha256()) {
        problems.push_back(member.name() + " fails its checksum");
      } else {
        ++checked;
      }
    }
  }

  if (!problems.empty()) {
    std::string message = "burned disc at " + burned_dir.string() + " is not intact:";
    for (const auto& problem : problems) message += " " + problem + ";";
    throw util::IntegrityFailure(message);
  }

  OPTIRAID_LOG_INFO("disc verified", {observability::StringField("path", burned_dir.string()),
                                      observability::IntField("members", static_cast<std::int64_t>(checked))});
}

} // namespace optiraid::burn
