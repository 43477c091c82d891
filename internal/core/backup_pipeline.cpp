#include "backup_pipeline.hpp"

#include <algorithm>
#include <set>

#include "internal/burn/bundle_stager.hpp"
#include "internal/burn/burn_verifier.hpp"
#include "internal/intake/slice_intake.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/naming.hpp"
#include "internal/verify/manifest_io.hpp"
#include "optiraid/v1.hpp"

namespace optiraid::core {

namespace {

constexpr std::uint64_t kMiB = 1024 * 1024;

std::int64_t AsInt(std::uint64_t value) {
  return static_cast<std::int64_t>(value);
}

std::string Join(const std::vector<std::string>& parts, const std::string& separator) {
  std::string out;
  for (const auto& part : parts) {
    if (!out.empty()) out += separator;
    out += part;
  }
  return out;
}

db::model::BundleRecord ToRecord(const std::string& run_id, const model::DiscBundle& bundle, v1::BundleState state) {
  db::model::BundleRecord record;
  record.run_id      = run_id;
  record.disc_index  = bundle.disc_index;
  record.group_index = bundle.group_index;
  record.position    = bundle.position;
  record.title       = bundle.title;
  record.pure_parity = bundle.pure_parity;
  record.total_bytes = bundle.total_bytes;
  record.state       = state;
  record.files       = bundle.FileNames();
  record.owned_files = bundle.MemberNames();
  return record;
}

// Enough of a bundle for prompts and burners when only the ledger row is left.
model::DiscBundle FromRecord(const db::model::BundleRecord& record) {
  model::DiscBundle bundle;
  bundle.disc_index  = record.disc_index;
  bundle.group_index = record.group_index;
  bundle.position    = record.position;
  bundle.title       = record.title;
  bundle.pure_parity = record.pure_parity;
  bundle.total_bytes = record.total_bytes;
  for (const auto& name : record.files) {
    const bool owned = std::find(record.owned_files.begin(), record.owned_files.end(), name) != record.owned_files.end();
    bundle.files.push_back({name, owned ? model::DiscFileKind::kMember : model::DiscFileKind::kDocument, {}, 0, {}});
  }
  return bundle;
}

void Advance(db::model::SetRecord& set, v1::SetState to) {
  if (!model::CanTransition(set.state, to)) {
    throw util::InvalidState("set " + std::to_string(set.set_index) + " cannot move from " + v1::SetState_Name(set.state) + " to " +
                             v1::SetState_Name(to));
  }
  set.state = to;
}

} // namespace

BackupPipeline::BackupPipeline(const optiraid::runtime::config::RuntimeConfig& config, PipelineDeps deps)
    : config_(config),
      deps_(std::move(deps)),
      run_id_(std::filesystem::absolute(config.staging().dir()).lexically_normal().string()),
      dry_run_(config.dry_run()),
      scratch_(std::make_unique<scratch::ScratchSpaceManager>(config.staging().dir(), *deps_.probe, config.dry_run())) {
}

// -----------------------------------------------------------------------------
// Fresh run
// -----------------------------------------------------------------------------

void BackupPipeline::Run(encoder::SliceSource& source) {
  const auto& layout      = config_.layout();
  const auto  group_discs = static_cast<std::uint64_t>(layout.set_size()) + layout.parity();

  // checked first so a refused run leaves nothing behind
  scratch_->EnsureCapacity(group_discs * layout.disc_size_mib() * kMiB);
  scratch_->PrepareStaging();
  scratch_->AcquireExclusive();

  {
    auto tx = deps_.ledger->Begin();
    db::ThrowIfDbError(deps_.ledger->DeleteRun(*tx, run_id_), "run reset");
    db::model::RunRecord run;
    run.run_id     = run_id_;
    run.basename   = layout.basename();
    run.state      = v1::RUN_STATE_RUNNING;
    run.invocation = deps_.invocation;
    db::ThrowIfDbError(deps_.ledger->UpsertRun(*tx, run), "run create");
    tx->Commit();
  }

  builder_   = std::make_unique<builder::RedundancySetBuilder>(config_, deps_.codec, *deps_.ledger, run_id_, *scratch_);
  sequencer_ = std::make_unique<sequencer::DiscSequencer>(config_, 0, 0, deps_.program_copy, deps_.invocation);
  intake::SliceIntake intake(config_);

  OPTIRAID_LOG_INFO("backup started", {observability::StringField("staging", run_id_), observability::StringField("basename", layout.basename()),
                                       observability::BoolField("dry_run", dry_run_)});

  try {
    source.Start();
    while (auto event = source.Next()) {
      if (auto slice = intake.Accept(*event)) {
        Deliver(builder_->Admit(*slice));
        UpdateRun([&](db::model::RunRecord& run) { run.last_sequence = slice->sequence; });

        // the encoder waits for this ack before writing into the next set
        if (slice->sequence % layout.set_size() == 0 && !slice->is_final) {
          EnsureRoomForNextSet(slice->set_index + 1);
        }
      }
      source.Acknowledge();
    }
    source.Finish();
  } catch (const std::exception& e) {
    OPTIRAID_LOG_ERROR("backup stream failed", {observability::StringField("error", e.what())});
    source.Abort();
    UpdateRun([](db::model::RunRecord& run) { run.state = v1::RUN_STATE_FAILED; });
    throw;
  }

  if (!intake.SawFinal()) {
    UpdateRun([](db::model::RunRecord& run) { run.state = v1::RUN_STATE_FAILED; });
    throw util::ProtocolViolation("encoder exited after slice " + std::to_string(intake.LastSequence()) + " without reporting its last slice");
  }

  Deliver(builder_->EndOfStream());
  Deliver(builder_->Drain());
  UpdateRun([](db::model::RunRecord& run) { run.state = v1::RUN_STATE_STREAM_DONE; });

  if (auto failure = builder_->FirstFailure()) {
    OPTIRAID_LOG_ERROR("parity missing; run retry-parity for the set, then resume",
                       {observability::IntField("set", AsInt(builder_->FailedSets().front())),
                        observability::IntField("held_sets", AsInt(builder_->HeldCount()))});
    std::rethrow_exception(failure);
  }

  BurnGroup(sequencer_->Flush());
  if (burn_failure_) {
    OPTIRAID_LOG_ERROR("discs failed to burn; run resume to burn them again", {observability::IntField("discs", AsInt(sequencer_->DiscsEmitted()))});
    std::rethrow_exception(burn_failure_);
  }
  UpdateRun([](db::model::RunRecord& run) { run.state = v1::RUN_STATE_COMPLETED; });

  OPTIRAID_LOG_INFO("backup complete", {observability::IntField("slices", AsInt(intake.LastSequence())),
                                        observability::IntField("discs", AsInt(sequencer_->DiscsEmitted())),
                                        observability::IntField("groups", AsInt(sequencer_->GroupsEmitted()))});
}

void BackupPipeline::Deliver(std::vector<model::RedundancySet> sets) {
  const auto digits = config_.layout().digits();
  for (const auto& set : sets) {
    Decide("set " + util::PadNumber(set.index, digits) + " ready: " + std::to_string(set.data.size()) + " data, " +
           std::to_string(set.parity.size()) + " parity, " + std::to_string(set.TotalBytes()) + " bytes");
    BurnGroup(sequencer_->Place(set));
  }
}

void BackupPipeline::EnsureRoomForNextSet(std::uint64_t next_set) {
  const auto& layout = config_.layout();
  const auto  worst  = (static_cast<std::uint64_t>(layout.set_size()) + layout.parity()) * layout.slice_size_mib() * kMiB;
  const auto  label  = util::PadNumber(next_set, layout.digits());

  if (scratch_->CanOpenSet(worst)) return;

  if (builder_->InFlight() > 0) {
    Decide("space gate before set " + label + ": waiting for parity");
    Deliver(builder_->Drain());
    if (scratch_->CanOpenSet(worst)) return;
  }

  if (!sequencer_->Empty()) {
    Decide("space gate before set " + label + ": flushing group " + util::PadNumber(sequencer_->GroupIndex(), layout.digits()) + " early");
    BurnGroup(sequencer_->Flush());
    if (scratch_->CanOpenSet(worst)) return;
  }

  throw util::InsufficientSpace(scratch_->StagingDir().string(), scratch_->Available(), worst);
}

// -----------------------------------------------------------------------------
// Burning
// -----------------------------------------------------------------------------

void BackupPipeline::BurnGroup(std::vector<model::DiscBundle> bundles) {
  if (bundles.empty()) return;

  std::set<std::uint64_t> sets;
  for (const auto& bundle : bundles) {
    sets.insert(bundle.set_indexes.begin(), bundle.set_indexes.end());
    Decide("disc " + bundle.title + " (#" + std::to_string(bundle.disc_index) + (bundle.pure_parity ? ", parity" : "") +
           "): " + Join(bundle.MemberNames(), " ") + " = " + std::to_string(bundle.total_bytes) + " bytes");
  }

  std::vector<std::filesystem::path> dirs;
  if (!dry_run_) {
    for (const auto& bundle : bundles) dirs.push_back(burn::StageBundle(bundle, scratch_->StagingDir()));
  }

  // bundles, set states and disc numbering move together so a resume sees
  // either the whole group or none of it
  std::vector<db::model::BundleRecord> records;
  {
    auto tx = deps_.ledger->Begin();
    for (const auto& bundle : bundles) {
      records.push_back(ToRecord(run_id_, bundle, v1::BUNDLE_STATE_STAGED));
      db::ThrowIfDbError(deps_.ledger->UpsertBundle(*tx, records.back()), "bundle insert");
    }
    for (auto index : sets) {
      auto set = deps_.ledger->GetSet(*tx, run_id_, index);
      if (!set) throw util::InvalidState("set " + std::to_string(index) + " placed on a disc but missing from the ledger");
      Advance(*set, v1::SET_STATE_SEQUENCED);
      db::ThrowIfDbError(deps_.ledger->UpsertSet(*tx, *set), "set update");
    }
    auto run = deps_.ledger->GetRun(*tx, run_id_);
    if (!run) throw util::InvalidState("run " + run_id_ + " missing from the ledger");
    run->discs_emitted  = sequencer_->DiscsEmitted();
    run->groups_emitted = sequencer_->GroupsEmitted();
    db::ThrowIfDbError(deps_.ledger->UpsertRun(*tx, *run), "run update");
    tx->Commit();
  }

  bundles_.insert(bundles_.end(), bundles.begin(), bundles.end());

  if (dry_run_) {
    for (const auto& bundle : bundles) {
      std::uint64_t owned = 0;
      for (const auto& file : bundle.files) {
        if (file.kind == model::DiscFileKind::kMember) owned += file.size_bytes;
      }
      scratch_->Release(owned);
    }
    return;
  }

  // a disc that fails stays FAILED with its directory staged, and the rest
  // of the stream goes on; its sets wait in SEQUENCED until resume
  for (std::size_t i = 0; i < bundles.size(); ++i) {
    try {
      BurnAndVerify(records[i], bundles[i], dirs[i]);
    } catch (const util::ExternalToolFailure&) {
      if (!burn_failure_) burn_failure_ = std::current_exception();
    } catch (const util::IntegrityFailure&) {
      if (!burn_failure_) burn_failure_ = std::current_exception();
    }
  }
  CompleteGroups();
}

void BackupPipeline::BurnAndVerify(db::model::BundleRecord& record, const model::DiscBundle& bundle, const std::filesystem::path& dir) {
  if (config_.burn().prompt_for_media()) deps_.prompt->RequestBlankMedia(bundle);

  try {
    deps_.burner->Burn(bundle, dir);
  } catch (const std::exception& e) {
    record.state = v1::BUNDLE_STATE_FAILED;
    SaveBundle(record);
    OPTIRAID_LOG_ERROR("burn failed; resume burns it again",
                       {observability::StringField("title", record.title), observability::StringField("error", e.what())});
    throw;
  }

  record.state = v1::BUNDLE_STATE_BURNED;
  SaveBundle(record);

  VerifyBurned(record, bundle);
  ReleaseBundle(record);
}

bool BackupPipeline::VerifyBurned(db::model::BundleRecord& record, const model::DiscBundle& bundle) {
  const auto location = deps_.burner->BurnedLocation(record.title);
  if (!location) {
    OPTIRAID_LOG_WARN("disc burned but not read back; set burn.verify_mount_point to verify", {observability::StringField("title", record.title)});
    return false;
  }

  if (config_.burn().mode() == optiraid::runtime::config::BURN_MODE_DEVICE && config_.burn().prompt_for_media()) {
    deps_.prompt->RequestMounted(bundle, *location);
  }

  try {
    burn::VerifyBurnedDisc(*location, record.files);
  } catch (const util::IntegrityFailure&) {
    record.state = v1::BUNDLE_STATE_FAILED;
    SaveBundle(record);
    throw;
  }

  record.state = v1::BUNDLE_STATE_VERIFIED;
  SaveBundle(record);
  return true;
}

void BackupPipeline::ReleaseBundle(const db::model::BundleRecord& record) {
  const auto&   staging = scratch_->StagingDir();
  std::uint64_t freed   = 0;

  for (const auto& name : record.owned_files) {
    std::error_code ec;
    const auto      size = std::filesystem::file_size(staging / name, ec);
    if (ec) continue;
    if (!std::filesystem::remove(staging / name, ec) || ec) {
      OPTIRAID_LOG_WARN("cannot remove burned file from staging", {observability::StringField("file", name), observability::StringField("error", ec.message())});
      continue;
    }
    freed += size;
  }

  std::error_code ec;
  std::filesystem::remove_all(staging / util::BundleDirName(record.disc_index), ec);
  if (ec) {
    OPTIRAID_LOG_WARN("cannot remove disc directory", {observability::StringField("title", record.title), observability::StringField("error", ec.message())});
  }

  scratch_->Release(freed);
  OPTIRAID_LOG_DEBUG("staging space released", {observability::StringField("title", record.title), observability::IntField("bytes", AsInt(freed))});
}

// Sets whose every disc is burned move on; their manifests leave staging.
void BackupPipeline::CompleteGroups() {
  const auto&              layout = config_.layout();
  std::vector<std::string> finished_manifests;
  {
    auto       tx      = deps_.ledger->Begin();
    const auto bundles = deps_.ledger->ListBundles(*tx, run_id_);
    for (auto& set : deps_.ledger->ListSets(*tx, run_id_)) {
      if (set.state != v1::SET_STATE_SEQUENCED) continue;

      const auto manifest = util::ManifestName(layout.basename(), set.set_index, layout.digits());
      bool       any = false, burned = true, verified = true;
      for (const auto& bundle : bundles) {
        if (std::find(bundle.files.begin(), bundle.files.end(), manifest) == bundle.files.end()) continue;
        any = true;
        burned &= bundle.state == v1::BUNDLE_STATE_BURNED || bundle.state == v1::BUNDLE_STATE_VERIFIED;
        verified &= bundle.state == v1::BUNDLE_STATE_VERIFIED;
      }
      if (!any || !burned) continue;

      Advance(set, v1::SET_STATE_BURNED);
      if (verified) Advance(set, v1::SET_STATE_VERIFIED);
      db::ThrowIfDbError(deps_.ledger->UpsertSet(*tx, set), "set update");
      finished_manifests.push_back(manifest);
    }
    tx->Commit();
  }

  for (const auto& name : finished_manifests) {
    std::error_code ec;
    std::filesystem::remove(scratch_->StagingDir() / name, ec);
  }
}

// -----------------------------------------------------------------------------
// Recovery
// -----------------------------------------------------------------------------

model::RedundancySet BackupPipeline::RetryParity(std::uint64_t set_index) {
  scratch_->AttachStaging();
  scratch_->AcquireExclusive();

  builder_ = std::make_unique<builder::RedundancySetBuilder>(config_, deps_.codec, *deps_.ledger, run_id_, *scratch_);
  auto set = builder_->RetryParity(set_index);

  Decide("set " + util::PadNumber(set.index, config_.layout().digits()) + " parity regenerated: " + std::to_string(set.parity.size()) + " parity, " +
         std::to_string(set.ParityBytes()) + " bytes");
  return set;
}

void BackupPipeline::Resume() {
  scratch_->AttachStaging();
  scratch_->AcquireExclusive();

  std::optional<db::model::RunRecord> run;
  {
    auto tx = deps_.ledger->Begin();
    run     = deps_.ledger->GetRun(*tx, run_id_);
    tx->Commit();
  }
  if (!run) {
    throw util::InvalidState("no backup recorded for staging directory " + run_id_);
  }
  if (run->state == v1::RUN_STATE_COMPLETED) {
    OPTIRAID_LOG_INFO("backup already complete, nothing to resume", {observability::StringField("staging", run_id_)});
    return;
  }
  if (run->state != v1::RUN_STATE_STREAM_DONE) {
    throw util::InvalidState("the encoder stream of " + run_id_ + " never completed (" + v1::RunState_Name(run->state) + "); start a new backup");
  }

  sequencer_ = std::make_unique<sequencer::DiscSequencer>(config_, run->groups_emitted, run->discs_emitted, deps_.program_copy, run->invocation);

  std::vector<db::model::BundleRecord> records;
  {
    auto tx = deps_.ledger->Begin();
    records = deps_.ledger->ListBundles(*tx, run_id_);
    tx->Commit();
  }
  for (auto& record : records) ResumeBundle(std::move(record));
  CompleteGroups();

  std::vector<db::model::SetRecord> sets;
  {
    auto tx = deps_.ledger->Begin();
    sets    = deps_.ledger->ListSets(*tx, run_id_);
    tx->Commit();
  }
  for (const auto& set : sets) {
    if (set.state < v1::SET_STATE_CLOSED) {
      throw util::InvalidState("set " + std::to_string(set.set_index) + " is " + v1::SetState_Name(set.state) + "; run retry-parity " +
                               std::to_string(set.set_index) + " first");
    }
  }

  const auto& layout = config_.layout();
  for (const auto& set : sets) {
    if (set.state != v1::SET_STATE_CLOSED) continue;
    const auto name     = util::ManifestName(layout.basename(), set.set_index, layout.digits());
    const auto manifest = verify::ReadManifest(scratch_->StagingDir() / name);
    Deliver({verify::SetFromManifest(manifest, scratch_->StagingDir(), name)});
  }
  BurnGroup(sequencer_->Flush());
  if (burn_failure_) std::rethrow_exception(burn_failure_);

  UpdateRun([](db::model::RunRecord& record) { record.state = v1::RUN_STATE_COMPLETED; });
  OPTIRAID_LOG_INFO("resume complete", {observability::IntField("discs", AsInt(sequencer_->DiscsEmitted()))});
}

void BackupPipeline::ResumeBundle(db::model::BundleRecord record) {
  if (record.state == v1::BUNDLE_STATE_VERIFIED) {
    ReleaseBundle(record);
    return;
  }

  const auto bundle   = FromRecord(record);
  const auto location = deps_.burner->BurnedLocation(record.title);

  if (location && std::filesystem::exists(*location)) {
    try {
      if (VerifyBurned(record, bundle)) {
        ReleaseBundle(record);
        return;
      }
    } catch (const util::IntegrityFailure& e) {
      OPTIRAID_LOG_WARN("disc does not verify, burning it again", {observability::StringField("title", record.title), observability::StringField("error", e.what())});
    }
  } else if (!location && record.state == v1::BUNDLE_STATE_BURNED) {
    OPTIRAID_LOG_WARN("disc recorded as burned, cannot read it back", {observability::StringField("title", record.title)});
    ReleaseBundle(record);
    return;
  }

  const auto dir = burn::BundleDir(bundle, scratch_->StagingDir());
  if (!std::filesystem::is_directory(dir)) {
    throw util::InvalidState("disc " + record.title + " must be burned again but " + dir.string() + " is gone");
  }
  Decide("disc " + record.title + " (#" + std::to_string(record.disc_index) + "): burning again");
  BurnAndVerify(record, bundle, dir);
}

// -----------------------------------------------------------------------------
// Ledger
// -----------------------------------------------------------------------------

void BackupPipeline::SaveBundle(const db::model::BundleRecord& record) {
  auto tx = deps_.ledger->Begin();
  db::ThrowIfDbError(deps_.ledger->UpsertBundle(*tx, record), "bundle update");
  tx->Commit();
}

void BackupPipeline::UpdateRun(const std::function<void(db::model::RunRecord&)>& change) {
  auto tx  = deps_.ledger->Begin();
  auto run = deps_.ledger->GetRun(*tx, run_id_);
  if (!run) throw util::InvalidState("run " + run_id_ + " missing from the ledger");
  change(*run);
  db::ThrowIfDbError(deps_.ledger->UpsertRun(*tx, *run), "run update");
  tx->Commit();
}

void BackupPipeline::Decide(std::string decision) {
  OPTIRAID_LOG_INFO("decision", {observability::StringField("what", decision)});
  decisions_.push_back(std::move(decision));
}

} // namespace optiraid::core
