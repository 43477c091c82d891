#pragma once

#include <cstdint>
#include <exception>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/builder/redundancy_set_builder.hpp"
#include "internal/burn/burn_tool.hpp"
#include "internal/burn/media_prompt.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/encoder/slice_source.hpp"
#include "internal/model/disc_bundle.hpp"
#include "internal/parity/parity_codec.hpp"
#include "internal/scratch/scratch_space_manager.hpp"
#include "internal/scratch/space_probe.hpp"
#include "internal/sequencer/disc_sequencer.hpp"

namespace optiraid::core {

struct PipelineDeps {
  std::shared_ptr<db::Repository>          ledger;
  std::shared_ptr<parity::ParityCodec>     codec;
  std::shared_ptr<burn::BurnTool>          burner;
  std::shared_ptr<burn::MediaPrompt>       prompt;
  std::shared_ptr<scratch::FreeSpaceProbe> probe;
  // Copied onto every disc when set.
  std::optional<std::filesystem::path> program_copy;
  // Command lines of this backup, written into every README (see
  // sequencer::RenderInvocation). Resume reuses the one recorded by the run.
  std::string invocation;
};

/*
  Drives one backup from encoder events to verified discs.

    encoder -> intake -> set builder -> sequencer -> stage -> burn -> verify

  Every decision that shapes the output (set closed, disc emitted, space
  gate) is appended to Decisions(). A dry run takes the same decisions
  from planned sizes without touching the filesystem or any tool.
*/
class BackupPipeline {
 public:
  BackupPipeline(const optiraid::runtime::config::RuntimeConfig& config, PipelineDeps deps);

  BackupPipeline(const BackupPipeline&)            = delete;
  BackupPipeline& operator=(const BackupPipeline&) = delete;

  // Fresh run into an empty (or absent) staging directory. A disc that fails
  // to burn does not stop the stream; the run ends STREAM_DONE and the
  // failure is rethrown once everything else is burned.
  void Run(encoder::SliceSource& source);

  // Regenerates parity of a set left PARITY_PENDING, or of a CLOSED set not yet sequenced.
  model::RedundancySet RetryParity(std::uint64_t set_index);

  // Finishes a run whose encoder stream completed: re-verifies or re-burns
  // interrupted discs, then sequences and burns every set still waiting.
  void Resume();

  const std::vector<std::string>& Decisions() const {
    return decisions_;
  }

  // Every disc emitted so far, in order.
  const std::vector<model::DiscBundle>& Bundles() const {
    return bundles_;
  }

  const std::string& RunId() const {
    return run_id_;
  }

 private:
  void Deliver(std::vector<model::RedundancySet> sets);
  void EnsureRoomForNextSet(std::uint64_t next_set);

  void BurnGroup(std::vector<model::DiscBundle> bundles);
  void BurnAndVerify(db::model::BundleRecord& record, const model::DiscBundle& bundle, const std::filesystem::path& dir);
  bool VerifyBurned(db::model::BundleRecord& record, const model::DiscBundle& bundle);
  void ReleaseBundle(const db::model::BundleRecord& record);
  void CompleteGroups();

  void ResumeBundle(db::model::BundleRecord record);

  void SaveBundle(const db::model::BundleRecord& record);
  void UpdateRun(const std::function<void(db::model::RunRecord&)>& change);
  void Decide(std::string decision);

  const optiraid::runtime::config::RuntimeConfig& config_;
  PipelineDeps                                    deps_;
  std::string                                     run_id_;
  bool                                            dry_run_;

  // declared before the builder: its workers report into the scratch ledger
  std::unique_ptr<scratch::ScratchSpaceManager>  scratch_;
  std::unique_ptr<builder::RedundancySetBuilder> builder_;
  std::unique_ptr<sequencer::DiscSequencer>      sequencer_;

  std::vector<std::string>       decisions_;
  std::vector<model::DiscBundle> bundles_;

  // First disc that failed to burn or verify; its directory stays staged.
  std::exception_ptr burn_failure_;
};

} // namespace optiraid::core
