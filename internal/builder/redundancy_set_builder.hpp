#pragma once

#include <cstdint>
#include <deque>
#include <exception>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/model/redundancy_set.hpp"
#include "internal/parity/completion_queue.hpp"
#include "internal/parity/parity_codec.hpp"
#include "internal/parity/parity_scheduler.hpp"
#include "internal/parity/parity_worker.hpp"
#include "internal/scratch/scratch_space_manager.hpp"

namespace optiraid::builder {

/*
  Groups admitted slices into redundancy sets and gets parity made for them.

  A set closes when it holds set_size slices or when the stream ends. Parity
  runs inline or, with parity.workers > 0, on background workers; either way
  closed sets are handed out strictly in index order.

  A parity failure stays local to its set: the set is left PARITY_PENDING in
  the ledger, the stream continues, and every later set is held back (closed
  but not handed out) so disc order never skips a set. Held sets are picked
  up by a resume once the failed one has been retried.
*/
class RedundancySetBuilder {
 public:
  RedundancySetBuilder(const optiraid::runtime::config::RuntimeConfig& config, std::shared_ptr<parity::ParityCodec> codec,
                       db::Repository& ledger, std::string run_id, scratch::ScratchSpaceManager& scratch);
  ~RedundancySetBuilder();

  RedundancySetBuilder(const RedundancySetBuilder&)            = delete;
  RedundancySetBuilder& operator=(const RedundancySetBuilder&) = delete;

  // Returns the sets that became ready, in index order.
  std::vector<model::RedundancySet> Admit(const model::Slice& slice);

  // Closes the trailing partial set, if any.
  std::vector<model::RedundancySet> EndOfStream();

  // Non-blocking collection of finished background work.
  std::vector<model::RedundancySet> Poll();

  // Blocks until every queued parity task has finished.
  std::vector<model::RedundancySet> Drain();

  // Regenerates parity for a PARITY_PENDING or CLOSED set from its recorded
  // members. Idempotent: outputs of an earlier attempt are removed first.
  model::RedundancySet RetryParity(std::uint64_t set_index);

  const std::vector<std::uint64_t>& FailedSets() const {
    return failed_;
  }

  // The error of the first failed set, null when none failed.
  std::exception_ptr FirstFailure() const {
    return first_failure_;
  }

  std::size_t InFlight() const {
    return pending_.size();
  }

  bool HasOpenSet() const {
    return open_.has_value();
  }

  // Sets closed after a failure, not handed out.
  std::size_t HeldCount() const {
    return held_;
  }

 private:
  parity::ParityRequest RequestFor(const model::RedundancySet& set) const;

  void CloseOpenSet();
  void Finalize(model::RedundancySet set, const parity::ParityResult& result, std::uint64_t planned_bytes);
  void Fail(model::RedundancySet set, const std::string& error, std::exception_ptr cause);
  void Complete(parity::ParityCompletion completion);

  void Transition(model::RedundancySet& set, v1::SetState to) const;
  void Persist(const model::RedundancySet& set, const std::string& last_error = {}) const;

  std::vector<model::RedundancySet> TakeReady();

  const optiraid::runtime::config::RuntimeConfig& config_;
  std::shared_ptr<parity::ParityCodec>            codec_;
  db::Repository&                                 ledger_;
  std::string                                     run_id_;
  scratch::ScratchSpaceManager&                   scratch_;
  bool                                            dry_run_;

  std::optional<model::RedundancySet>                  open_;
  std::map<std::uint64_t, model::RedundancySet>        pending_;
  std::map<std::uint64_t, std::uint64_t>               planned_bytes_;
  std::deque<model::RedundancySet>                     ready_;
  std::vector<std::uint64_t>                           failed_;
  std::exception_ptr                                   first_failure_;
  std::size_t                                          held_ = 0;

  std::shared_ptr<parity::ParityScheduler>             scheduler_;
  std::shared_ptr<parity::OrderedCompletionQueue>      completions_;
  std::vector<std::unique_ptr<parity::ParityWorker>>   workers_;
};

} // namespace optiraid::builder
