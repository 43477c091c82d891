#include "factory.hpp"

#include <iostream>

#include "internal/burn/directory_burner.hpp"
#include "internal/burn/growisofs_burner.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/parity/par2_codec.hpp"
#include "internal/parity/rs_codec.hpp"
#include "internal/util/errors.hpp"
#if OPTIRAID_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace optiraid::factory {

using optiraid::runtime::config::RuntimeConfig;

std::shared_ptr<db::Repository> BuildLedger(const RuntimeConfig& config) {
  const auto& ledger = config.ledger();
  if (!ledger.sqlite_path().empty() && !config.dry_run()) {
#if OPTIRAID_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(ledger.sqlite_path());
    sqlite_db->EnsureSchema();
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw util::ConfigurationError("sqlite ledger requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<parity::ParityCodec> BuildCodec(optiraid::runtime::config::ParityCodec kind, const RuntimeConfig& config, process::ProcessRunner& runner) {
  switch (kind) {
    case optiraid::runtime::config::PARITY_CODEC_REED_SOLOMON:
      return std::make_shared<parity::ReedSolomonCodec>();
    case optiraid::runtime::config::PARITY_CODEC_PAR2:
      return std::make_shared<parity::Par2Codec>(config.parity().program(), static_cast<std::uint64_t>(config.parity().block_size_kib()) * 1024, runner);
    default:
      throw util::ConfigurationError("unknown parity codec " + optiraid::runtime::config::ParityCodec_Name(kind));
  }
}

void RequirePersistentLedger(const RuntimeConfig& config) {
  if (config.ledger().sqlite_path().empty()) {
    throw util::ConfigurationError("this command needs the run ledger; set ledger.sqlite_path to the file the backup used");
  }
}

std::filesystem::path SelfProgram() {
  std::error_code ec;
  auto            self = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (ec) {
    throw util::ConfigurationError("cannot locate the optiraid executable: " + ec.message());
  }
  return self;
}

core::PipelineDeps Application::PipelineDependencies() const {
  core::PipelineDeps deps;
  deps.ledger       = ledger;
  deps.codec        = codec;
  deps.burner       = burner;
  deps.prompt       = prompt;
  deps.probe        = probe;
  deps.program_copy = program_copy;
  return deps;
}

Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Ledger and tools
  // ------------------------------------------------------------------
  app.ledger = BuildLedger(config);
  app.runner = std::make_shared<process::PosixProcessRunner>();
  app.codec  = BuildCodec(config.parity().codec(), config, *app.runner);
  app.probe  = std::make_shared<scratch::StatvfsProbe>();

  app.self_program = SelfProgram();
  if (config.docs().include_program_copy()) {
    app.program_copy = config.docs().program_path().empty() ? app.self_program : std::filesystem::path(config.docs().program_path());
  }

  // ------------------------------------------------------------------
  // Burning
  // ------------------------------------------------------------------
  const auto& burn = config.burn();
  if (burn.mode() == optiraid::runtime::config::BURN_MODE_DIRECTORY) {
    app.burner = std::make_shared<burn::DirectoryBurner>(burn.output_dir());
  } else {
    app.burner = std::make_shared<burn::GrowisofsBurner>(burn.program(), burn.device(), burn.verify_mount_point(), *app.runner);
  }

  if (burn.prompt_for_media() && !config.dry_run()) {
    // prompts go to stderr; stdout carries command output
    app.prompt = std::make_shared<burn::ConsolePrompt>(std::cin, std::cerr);
  } else {
    app.prompt = std::make_shared<burn::NoPrompt>();
  }

  return app;
}

} // namespace optiraid::factory
