#pragma once

#include <filesystem>
#include <memory>
#include <optional>

#include "config/config.pb.h"
#include "internal/burn/burn_tool.hpp"
#include "internal/burn/media_prompt.hpp"
#include "internal/core/backup_pipeline.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/parity/parity_codec.hpp"
#include "internal/process/process_runner.hpp"
#include "internal/scratch/space_probe.hpp"

namespace optiraid::factory {

/*
  Application

  Owns every long-lived collaborator of one command invocation.
*/
struct Application {
  std::shared_ptr<db::Repository>          ledger;
  std::shared_ptr<process::ProcessRunner>  runner;
  std::shared_ptr<parity::ParityCodec>     codec;
  std::shared_ptr<burn::BurnTool>          burner;
  std::shared_ptr<burn::MediaPrompt>       prompt;
  std::shared_ptr<scratch::FreeSpaceProbe> probe;

  // This executable, as the encoder hook and the on-disc program copy.
  std::filesystem::path                self_program;
  std::optional<std::filesystem::path> program_copy;

  core::PipelineDeps PipelineDependencies() const;
};

/*
  Build

  Constructs the collaborators selected by the config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete ledger, codec and burner types.
*/
Application Build(const optiraid::runtime::config::RuntimeConfig& config);

// Dry runs always get the in-memory ledger.
std::shared_ptr<db::Repository> BuildLedger(const optiraid::runtime::config::RuntimeConfig& config);

std::shared_ptr<parity::ParityCodec> BuildCodec(optiraid::runtime::config::ParityCodec kind, const optiraid::runtime::config::RuntimeConfig& config,
                                                process::ProcessRunner& runner);

// Commands that pick up an earlier run need a ledger that outlived it.
void RequirePersistentLedger(const optiraid::runtime::config::RuntimeConfig& config);

std::filesystem::path SelfProgram();

} // namespace optiraid::factory
