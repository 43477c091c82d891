#include "disc_sequencer.hpp"

#include <algorithm>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/naming.hpp"
#include "optiraid/v1.hpp"

namespace optiraid::sequencer {

namespace {

constexpr std::uint64_t kMiB = 1024 * 1024;

std::uint64_t SizeIfPresent(const std::filesystem::path& path) {
  std::error_code ec;
  const auto      size = std::filesystem::file_size(path, ec);
  return ec ? 0 : size;
}

} // namespace

DiscSequencer::DiscSequencer(const optiraid::runtime::config::RuntimeConfig& config, std::uint64_t groups_emitted, std::uint64_t discs_emitted,
                             std::optional<std::filesystem::path> program_copy, std::string invocation)
    : config_(config),
      staging_dir_(config.staging().dir()),
      program_copy_(std::move(program_copy)),
      invocation_(std::move(invocation)),
      data_discs_(config.layout().set_size()),
      discs_(config.layout().set_size() + config.layout().parity()),
      capacity_((config.layout().disc_size_mib() - config.layout().reserve_mib()) * kMiB),
      groups_emitted_(groups_emitted),
      discs_emitted_(discs_emitted),
      members_(discs_),
      disc_sets_(discs_),
      used_(discs_, 0) {
}

std::vector<std::vector<model::DiscFile>> DiscSequencer::Split(const model::RedundancySet& set) const {
  std::vector<std::vector<model::DiscFile>> split(discs_);

  for (std::size_t i = 0; i < set.data.size(); ++i) {
    const auto& slice = set.data[i];
    split[i].push_back({slice.Name(), model::DiscFileKind::kMember, slice.path, slice.size_bytes, {}});
  }

  for (const auto& shard : set.parity) {
    // auxiliary outputs ride with the first parity shard
    const auto disc = shard.role == v1::MEMBER_ROLE_PARITY ? data_discs_ + shard.position : data_discs_;
    if (disc >= discs_) {
      throw util::InvalidState("parity shard " + shard.name + " has no disc in a group of " + std::to_string(discs_));
    }
    split[disc].push_back({shard.name, model::DiscFileKind::kMember, shard.path, shard.size_bytes, {}});
  }
  return split;
}

std::vector<model::DiscBundle> DiscSequencer::Place(const model::RedundancySet& set) {
  if (set.data.size() > data_discs_) {
    throw util::InvalidState("set " + std::to_string(set.index) + " has more data members than data discs");
  }

  const auto split = Split(set);

  std::vector<std::uint64_t> need(discs_, 0);
  for (std::uint32_t disc = 0; disc < discs_; ++disc) {
    for (const auto& file : split[disc]) need[disc] += file.size_bytes;
    if (need[disc] > capacity_) {
      throw util::ConfigurationError("set " + std::to_string(set.index) + " needs " + std::to_string(need[disc]) + " bytes on disc " +
                                     std::to_string(disc + 1) + " but a disc holds " + std::to_string(capacity_));
    }
  }

  std::vector<model::DiscBundle> flushed;
  for (std::uint32_t disc = 0; disc < discs_; ++disc) {
    if (used_[disc] + need[disc] > capacity_) {
      OPTIRAID_LOG_DEBUG("group full", {observability::IntField("group", static_cast<std::int64_t>(GroupIndex())),
                                        observability::IntField("set", static_cast<std::int64_t>(set.index)),
                                        observability::IntField("disc", disc + 1)});
      flushed = Flush();
      break;
    }
  }

  SetSummary summary;
  summary.index    = set.index;
  summary.manifest = set.manifest_name;
  for (const auto& slice : set.data) summary.data.push_back(slice.Name());
  for (const auto& shard : set.parity) summary.parity.push_back(shard.name);
  sets_.push_back(std::move(summary));

  for (std::uint32_t disc = 0; disc < discs_; ++disc) {
    if (split[disc].empty()) continue;
    members_[disc].insert(members_[disc].end(), split[disc].begin(), split[disc].end());
    disc_sets_[disc].push_back(set.index);
    used_[disc] += need[disc];
  }
  return flushed;
}

std::vector<model::DiscBundle> DiscSequencer::Flush() {
  std::vector<model::DiscBundle> bundles;
  if (sets_.empty()) return bundles;

  const auto& layout = config_.layout();
  const auto  group  = GroupIndex();
  const auto  yaml   = config::ConfigLoader::RenderYaml(config_);

  for (std::uint32_t disc = 0; disc < discs_; ++disc) {
    if (members_[disc].empty()) continue;

    model::DiscBundle bundle;
    bundle.disc_index  = ++discs_emitted_;
    bundle.group_index = group;
    bundle.position    = disc + 1;
    bundle.title       = util::DiscTitle(layout.basename(), group, disc + 1);
    bundle.pure_parity = disc >= data_discs_;
    bundle.set_indexes = disc_sets_[disc];
    bundle.total_bytes = used_[disc];
    bundle.files       = members_[disc];

    for (const auto& set : sets_) {
      const auto path = staging_dir_ / set.manifest;
      bundle.files.push_back({set.manifest, model::DiscFileKind::kManifest, path, SizeIfPresent(path), {}});
    }
    bundle.files.push_back({kReadmeName, model::DiscFileKind::kDocument, {}, 0, {}});
    bundle.files.push_back({kConfigName, model::DiscFileKind::kDocument, {}, yaml.size(), yaml});
    if (program_copy_) {
      bundle.files.push_back({program_copy_->filename().string(), model::DiscFileKind::kProgram, *program_copy_, SizeIfPresent(*program_copy_), {}});
    }

    auto readme = RenderReadme(config_, invocation_, bundle, discs_, sets_);
    for (auto& file : bundle.files) {
      if (file.name == kReadmeName && file.kind == model::DiscFileKind::kDocument) {
        file.size_bytes = readme.size();
        file.content    = std::move(readme);
        break;
      }
    }
    bundles.push_back(std::move(bundle));
  }

  OPTIRAID_LOG_INFO("group ready", {observability::IntField("group", static_cast<std::int64_t>(group)),
                                    observability::IntField("discs", static_cast<std::int64_t>(bundles.size())),
                                    observability::IntField("sets", static_cast<std::int64_t>(sets_.size()))});

  ++groups_emitted_;
  for (auto& files : members_) files.clear();
  for (auto& sets : disc_sets_) sets.clear();
  std::fill(used_.begin(), used_.end(), 0);
  sets_.clear();
  return bundles;
}

} // namespace optiraid::sequencer
