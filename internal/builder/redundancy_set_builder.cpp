#include "redundancy_set_builder.hpp"

#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/naming.hpp"
#include "internal/verify/manifest_io.hpp"

namespace optiraid::builder {

namespace {

std::uint64_t Total(const parity::ParityResult& result) {
  std::uint64_t total = 0;
  for (const auto& shard : result.outputs) total += shard.size_bytes;
  return total;
}

std::int64_t AsInt(std::uint64_t value) {
  return static_cast<std::int64_t>(value);
}

// Tool failures stay with their set; anything else means the machine is in
// trouble and the whole run stops.
bool IsSetLocal(const std::exception_ptr& error, std::string* message) {
  try {
    std::rethrow_exception(error);
  } catch (const util::ExternalToolFailure& e) {
    *message = e.what();
    return true;
  } catch (const util::IntegrityFailure& e) {
    *message = e.what();
    return true;
  } catch (...) {
    return false;
  }
}

} // namespace

RedundancySetBuilder::RedundancySetBuilder(const optiraid::runtime::config::RuntimeConfig& config, std::shared_ptr<parity::ParityCodec> codec,
                                           db::Repository& ledger, std::string run_id, scratch::ScratchSpaceManager& scratch)
    : config_(config),
      codec_(std::move(codec)),
      ledger_(ledger),
      run_id_(std::move(run_id)),
      scratch_(scratch),
      dry_run_(config.dry_run()) {
  // planning is instant; workers only pay off for real parity
  if (!dry_run_ && config_.parity().workers() > 0) {
    scheduler_   = std::make_shared<parity::ParityScheduler>();
    completions_ = std::make_shared<parity::OrderedCompletionQueue>(0);
    for (std::uint32_t i = 0; i < config_.parity().workers(); ++i) {
      workers_.push_back(std::make_unique<parity::ParityWorker>(scheduler_, codec_, completions_));
      workers_.back()->Start();
    }
  }
}

RedundancySetBuilder::~RedundancySetBuilder() {
  for (auto& worker : workers_) worker->Stop();
}

// -----------------------------------------------------------------------------
// Intake
// -----------------------------------------------------------------------------

std::vector<model::RedundancySet> RedundancySetBuilder::Admit(const model::Slice& slice) {
  if (open_ && open_->index != slice.set_index) {
    throw util::InvalidState("slice " + slice.Name() + " belongs to set " + std::to_string(slice.set_index) + " but set " +
                             std::to_string(open_->index) + " is open");
  }
  if (!open_) {
    model::RedundancySet set;
    set.index         = slice.set_index;
    set.state         = v1::SET_STATE_OPEN;
    set.manifest_name = util::ManifestName(config_.layout().basename(), set.index, config_.layout().digits());
    open_             = std::move(set);
  }

  open_->data.push_back(slice);
  scratch_.Reserve(slice.size_bytes);

  if (open_->data.size() >= config_.layout().set_size() || slice.is_final) {
    CloseOpenSet();
  }
  return Poll();
}

std::vector<model::RedundancySet> RedundancySetBuilder::EndOfStream() {
  if (open_) {
    OPTIRAID_LOG_INFO("closing partial set", {observability::IntField("set", AsInt(open_->index)),
                                              observability::IntField("data", AsInt(open_->data.size()))});
    CloseOpenSet();
  }
  return Poll();
}

std::vector<model::RedundancySet> RedundancySetBuilder::Poll() {
  if (completions_) {
    while (auto completion = completions_->TryPopNext()) {
      Complete(std::move(*completion));
    }
  }
  return TakeReady();
}

std::vector<model::RedundancySet> RedundancySetBuilder::Drain() {
  while (!pending_.empty()) {
    Complete(completions_->WaitNext());
  }
  return TakeReady();
}

// -----------------------------------------------------------------------------
// Parity
// -----------------------------------------------------------------------------

parity::ParityRequest RedundancySetBuilder::RequestFor(const model::RedundancySet& set) const {
  parity::ParityRequest request;
  request.set_index  = set.index;
  request.basename   = config_.layout().basename();
  request.parity     = config_.layout().parity();
  request.digits     = config_.layout().digits();
  request.output_dir = scratch_.StagingDir();
  for (const auto& slice : set.data) {
    request.inputs.push_back(slice.path);
    request.input_sizes.push_back(slice.size_bytes);
  }
  return request;
}

void RedundancySetBuilder::CloseOpenSet() {
  auto set = std::move(*open_);
  open_.reset();

  Transition(set, v1::SET_STATE_CLOSING);
  Persist(set);

  auto       request = RequestFor(set);
  const auto planned = Total(codec_->Plan(request));
  scratch_.Reserve(planned);

  Transition(set, v1::SET_STATE_PARITY_PENDING);
  Persist(set);

  OPTIRAID_LOG_DEBUG("set closed", {observability::IntField("set", AsInt(set.index)), observability::IntField("data", AsInt(set.data.size())),
                                    observability::IntField("planned_parity_bytes", AsInt(planned))});

  if (scheduler_) {
    planned_bytes_[set.index] = planned;
    const auto index          = set.index;
    pending_.emplace(index, std::move(set));
    scheduler_->Enqueue({index, std::move(request)});
    return;
  }

  if (dry_run_) {
    Finalize(std::move(set), codec_->Plan(request), planned);
    return;
  }

  parity::ParityResult result;
  try {
    result = codec_->Generate(request);
  } catch (...) {
    std::string message;
    if (!IsSetLocal(std::current_exception(), &message)) throw;
    scratch_.Release(planned);
    Fail(std::move(set), message, std::current_exception());
    return;
  }
  Finalize(std::move(set), result, planned);
}

void RedundancySetBuilder::Complete(parity::ParityCompletion completion) {
  auto it = pending_.find(completion.set_index);
  if (it == pending_.end()) {
    throw util::InvalidState("parity completion for unknown set " + std::to_string(completion.set_index));
  }
  auto set = std::move(it->second);
  pending_.erase(it);

  const auto planned = planned_bytes_[set.index];
  planned_bytes_.erase(set.index);

  if (completion.error) {
    std::string message;
    if (!IsSetLocal(completion.error, &message)) std::rethrow_exception(completion.error);
    scratch_.Release(planned);
    Fail(std::move(set), message, completion.error);
    return;
  }
  Finalize(std::move(set), completion.result, planned);
}

void RedundancySetBuilder::Finalize(model::RedundancySet set, const parity::ParityResult& result, std::uint64_t planned_bytes) {
  set.parity        = result.outputs;
  const auto actual = set.ParityBytes();
  if (actual > planned_bytes) scratch_.Reserve(actual - planned_bytes);
  if (actual < planned_bytes) scratch_.Release(planned_bytes - actual);

  if (!dry_run_) {
    const auto manifest = verify::BuildManifest(config_, set, codec_->Kind(), result.shard_length, true);
    verify::WriteManifest(scratch_.StagingDir() / set.manifest_name, manifest);
  }

  Transition(set, v1::SET_STATE_CLOSED);
  Persist(set);

  OPTIRAID_LOG_INFO("set ready", {observability::IntField("set", AsInt(set.index)), observability::IntField("data", AsInt(set.data.size())),
                                  observability::IntField("parity", AsInt(set.parity.size())),
                                  observability::IntField("bytes", AsInt(set.TotalBytes()))});

  ready_.push_back(std::move(set));
}

void RedundancySetBuilder::Fail(model::RedundancySet set, const std::string& error, std::exception_ptr cause) {
  Transition(set, v1::SET_STATE_PARITY_PENDING);
  Persist(set, error);
  failed_.push_back(set.index);
  if (!first_failure_) first_failure_ = std::move(cause);
  OPTIRAID_LOG_ERROR("parity failed, set left pending", {observability::IntField("set", AsInt(set.index)), observability::StringField("error", error)});
}

std::vector<model::RedundancySet> RedundancySetBuilder::TakeReady() {
  std::vector<model::RedundancySet> out;
  while (!ready_.empty()) {
    auto set = std::move(ready_.front());
    ready_.pop_front();
    if (!failed_.empty() && set.index > failed_.front()) {
      ++held_;
      OPTIRAID_LOG_WARN("set held behind failed set", {observability::IntField("set", AsInt(set.index)),
                                                       observability::IntField("failed_set", AsInt(failed_.front()))});
      continue;
    }
    out.push_back(std::move(set));
  }
  return out;
}

model::RedundancySet RedundancySetBuilder::RetryParity(std::uint64_t set_index) {
  std::optional<db::model::SetRecord> record;
  {
    auto tx = ledger_.Begin();
    record  = ledger_.GetSet(*tx, run_id_, set_index);
    tx->Commit();
  }
  if (!record) {
    throw util::InvalidState("no set " + std::to_string(set_index) + " recorded for " + run_id_);
  }
  const bool regenerate = record->state == v1::SET_STATE_CLOSED;
  if (record->state != v1::SET_STATE_PARITY_PENDING && !regenerate) {
    throw util::InvalidState("set " + std::to_string(set_index) + " is " + v1::SetState_Name(record->state) +
                             ", parity can only be regenerated before sequencing");
  }

  const auto& staging = scratch_.StagingDir();

  model::RedundancySet set;
  set.index         = set_index;
  set.state         = record->state;
  set.manifest_name = util::ManifestName(config_.layout().basename(), set_index, config_.layout().digits());
  for (const auto& member : record->members) {
    model::Slice slice;
    slice.basename   = config_.layout().basename();
    slice.set_index  = set_index;
    slice.sequence   = member.sequence;
    slice.path       = staging / member.name;
    slice.size_bytes = member.size_bytes;
    const auto dot   = member.name.rfind('.');
    slice.extension  = dot == std::string::npos ? std::string() : member.name.substr(dot + 1);

    std::error_code ec;
    const auto      size = std::filesystem::file_size(slice.path, ec);
    if (ec || size != member.size_bytes) {
      throw util::IntegrityFailure("staged slice " + slice.path.string() + " is missing or changed size");
    }
    set.data.push_back(std::move(slice));
  }

  auto request = RequestFor(set);
  for (const auto& stale : codec_->Plan(request).outputs) {
    std::error_code ec;
    std::filesystem::remove(stale.path, ec);
    std::filesystem::remove(storage::common::TempPathFor(stale.path), ec);
  }
  std::error_code ec;
  std::filesystem::remove(staging / set.manifest_name, ec);

  OPTIRAID_LOG_INFO("retrying parity", {observability::IntField("set", AsInt(set_index)), observability::StringField("previous_error", record->last_error)});

  auto result = codec_->Generate(request);
  set.parity  = result.outputs;
  verify::WriteManifest(staging / set.manifest_name, verify::BuildManifest(config_, set, codec_->Kind(), result.shard_length, true));

  // a CLOSED set keeps its state; only the shards and manifest are rewritten
  if (!regenerate) Transition(set, v1::SET_STATE_CLOSED);
  Persist(set);
  return set;
}

// -----------------------------------------------------------------------------
// Ledger
// -----------------------------------------------------------------------------

void RedundancySetBuilder::Transition(model::RedundancySet& set, v1::SetState to) const {
  if (!model::CanTransition(set.state, to)) {
    throw util::InvalidState("set " + std::to_string(set.index) + " cannot move from " + v1::SetState_Name(set.state) + " to " + v1::SetState_Name(to));
  }
  set.state = to;
}

void RedundancySetBuilder::Persist(const model::RedundancySet& set, const std::string& last_error) const {
  db::model::SetRecord record;
  record.run_id     = run_id_;
  record.set_index  = set.index;
  record.state      = set.state;
  record.last_error = last_error;
  for (const auto& slice : set.data) {
    record.members.push_back({slice.sequence, slice.size_bytes, slice.Name()});
  }

  auto tx = ledger_.Begin();
  db::ThrowIfDbError(ledger_.UpsertSet(*tx, record), "set update");
  tx->Commit();
}

} // namespace optiraid::builder
