#include "set_verifier.hpp"

#include <algorithm>
#include <optional>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/checksum.hpp"
#include "internal/util/errors.hpp"
#include "internal/verify/manifest_io.hpp"

namespace optiraid::verify {

namespace {

enum class MemberHealth { kGood, kMissing, kCorrupt };

MemberHealth Inspect(const std::filesystem::path& path, const v1::MemberEntry& member) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) return MemberHealth::kMissing;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec || size != member.size_bytes()) return MemberHealth::kCorrupt;
  if (!member.sha256().empty() && storage::common::Sha256HexOfFile(path) != member.sha256()) {
    return MemberHealth::kCorrupt;
  }
  return MemberHealth::kGood;
}

} // namespace

SetVerifier::SetVerifier(CodecFactory codecs) : codecs_(std::move(codecs)) {
}

SetCheck SetVerifier::CheckSet(const std::filesystem::path& dir, const v1::SetManifest& manifest) const {
  SetCheck check;
  check.set_index = manifest.set_index();
  check.parity    = manifest.parity();

  for (const auto& member : manifest.members()) {
    const auto health = Inspect(dir / member.name(), member);
    if (health == MemberHealth::kGood) continue;

    if (member.role() == v1::MEMBER_ROLE_INDEX) {
      OPTIRAID_LOG_WARN("parity index file damaged", {observability::StringField("file", member.name())});
      continue;
    }
    if (health == MemberHealth::kMissing) {
      check.missing.push_back(member.name());
    } else {
      check.corrupt.push_back(member.name());
    }
  }
  return check;
}

std::vector<SetCheck> SetVerifier::Check(const std::filesystem::path& dir) const {
  std::vector<SetCheck> checks;
  for (const auto& path : FindManifests(dir)) {
    auto check     = CheckSet(dir, ReadManifest(path));
    check.manifest = path.filename().string();
    checks.push_back(std::move(check));
  }
  return checks;
}

ReconstructReport SetVerifier::Reconstruct(const std::filesystem::path& dir) {
  ReconstructReport                  report;
  std::optional<util::Unrecoverable> first_unrecoverable;

  const auto manifests = FindManifests(dir);
  if (manifests.empty()) {
    throw util::IntegrityFailure("no set manifests in " + dir.string());
  }

  for (const auto& path : manifests) {
    const auto manifest = ReadManifest(path);
    const auto check    = CheckSet(dir, manifest);
    report.sets.push_back(manifest.set_index());
    report.missing.insert(report.missing.end(), check.missing.begin(), check.missing.end());
    report.corrupt.insert(report.corrupt.end(), check.corrupt.begin(), check.corrupt.end());
    if (check.Intact()) continue;

    OPTIRAID_LOG_INFO("repairing set", {observability::IntField("set", static_cast<std::int64_t>(manifest.set_index())),
                                        observability::IntField("missing", static_cast<std::int64_t>(check.missing.size())),
                                        observability::IntField("corrupt", static_cast<std::int64_t>(check.corrupt.size()))});

    if (!check.Recoverable()) {
      report.all_data_recovered = false;
      if (!first_unrecoverable) first_unrecoverable.emplace(manifest.set_index(), check.Damaged(), check.parity);
      continue;
    }

    std::vector<std::string> damaged = check.missing;
    damaged.insert(damaged.end(), check.corrupt.begin(), check.corrupt.end());

    parity::RepairRequest request;
    request.manifest = &manifest;
    request.dir      = dir;
    request.damaged  = damaged;

    try {
      auto codec = codecs_(manifest.codec());
      if (!codec) {
        throw util::ConfigurationError("no parity codec for manifest " + path.filename().string());
      }
      codec->Repair(request);
    } catch (const util::Unrecoverable& e) {
      report.all_data_recovered = false;
      if (!first_unrecoverable) first_unrecoverable.emplace(e);
      continue;
    }

    const auto after = CheckSet(dir, manifest);
    for (const auto& name : damaged) {
      const bool still_bad = std::find(after.missing.begin(), after.missing.end(), name) != after.missing.end() ||
                             std::find(after.corrupt.begin(), after.corrupt.end(), name) != after.corrupt.end();
      if (!still_bad) report.repaired.push_back(name);
    }

    // external tools may leave their own outputs alone; only data matters for restore
    for (const auto& member : manifest.members()) {
      if (member.role() != v1::MEMBER_ROLE_DATA) continue;
      const bool bad = std::find(after.missing.begin(), after.missing.end(), member.name()) != after.missing.end() ||
                       std::find(after.corrupt.begin(), after.corrupt.end(), member.name()) != after.corrupt.end();
      if (bad) {
        throw util::IntegrityFailure("repair of set " + std::to_string(manifest.set_index()) + " left " + member.name() + " damaged");
      }
    }
  }

  if (first_unrecoverable) throw *first_unrecoverable;
  return report;
}

} // namespace optiraid::verify
