#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/core/backup_pipeline.hpp"
#include "internal/encoder/dar_slice_source.hpp"
#include "internal/encoder/hook_protocol.hpp"
#include "internal/encoder/planned_slice_source.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/sequencer/documentation.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/exit_codes.hpp"
#include "internal/verify/set_verifier.hpp"

using optiraid::runtime::config::RuntimeConfig;

namespace {

constexpr const char* kDefaultConfig = "optiraid.yaml";

void Usage(std::ostream& out) {
  out << "Usage: optiraid [-v] [-n] [--config <file>] <command>\n"
      << "\n"
      << "Commands:\n"
      << "  backup <encoder args...>   archive, protect and burn (dar options, e.g. -R /home)\n"
      << "  verify <dir>               check every set in <dir> and rebuild damaged slices\n"
      << "  check <dir>                report damage in <dir> without repairing\n"
      << "  retry-parity <set>         regenerate parity of a set not yet on disc\n"
      << "  resume                     finish an interrupted backup\n"
      << "  docs                       print the restore documentation and configuration\n"
      << "\n"
      << "Options:\n"
      << "  -v, --verbose              debug logging\n"
      << "  -n, --dry-run              plan discs without writing or burning anything\n"
      << "  --config <file>            configuration (default $OPTIRAID_CONFIG, then ./" << kDefaultConfig << ")\n";
}

struct Invocation {
  bool                     verbose = false;
  bool                     dry_run = false;
  std::string              config_path;
  std::string              command;
  std::vector<std::string> args;
};

bool ParseArgs(int argc, char** argv, Invocation* out) {
  int i = 1;
  for (; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-v" || arg == "--verbose") {
      out->verbose = true;
    } else if (arg == "-n" || arg == "--dry-run") {
      out->dry_run = true;
    } else if (arg == "--config") {
      if (++i >= argc) return false;
      out->config_path = argv[i];
    } else if (!arg.empty() && arg[0] == '-') {
      return false;
    } else {
      break;
    }
  }
  if (i >= argc) return false;

  out->command = argv[i++];
  for (; i < argc; ++i) out->args.emplace_back(argv[i]);
  return true;
}

std::string ResolveConfigPath(const Invocation& invocation) {
  if (!invocation.config_path.empty()) return invocation.config_path;
  if (const char* env = std::getenv("OPTIRAID_CONFIG")) return env;
  return kDefaultConfig;
}

// Restore works from the discs alone, so verify and check run without a
// config file when there is none.
RuntimeConfig LoadConfig(const Invocation& invocation, bool required) {
  const auto    path = ResolveConfigPath(invocation);
  RuntimeConfig config;
  if (required || !invocation.config_path.empty() || std::filesystem::exists(path)) {
    config = optiraid::config::ConfigLoader::LoadFromYaml(path);
  } else {
    optiraid::config::ConfigLoader::ApplyDefaults(&config);
  }

  if (invocation.verbose) config.set_verbose(true);
  if (invocation.dry_run) config.set_dry_run(true);
  return config;
}

std::optional<std::uint64_t> ParseSetIndex(const std::string& text) {
  std::uint64_t value = 0;
  const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || end != text.data() + text.size()) return std::nullopt;
  return value;
}

// The command lines written onto every disc. Options that do not change
// the discs (-v, -n) are left out, so a dry run records the command that
// would burn them.
std::string RecordedInvocation(const Invocation& invocation, const RuntimeConfig& config, const std::filesystem::path& self_program) {
  std::vector<std::string> command = {"optiraid", "--config", ResolveConfigPath(invocation), invocation.command};
  command.insert(command.end(), invocation.args.begin(), invocation.args.end());

  const auto encoder = optiraid::encoder::DarArgv(config, self_program, optiraid::encoder::kControlDirPlaceholder, invocation.args);
  return optiraid::sequencer::RenderInvocation(command, encoder);
}

int Backup(const RuntimeConfig& config, const Invocation& invocation) {
  const auto& encoder_args = invocation.args;

  auto app        = optiraid::factory::Build(config);
  auto deps       = app.PipelineDependencies();
  deps.invocation = RecordedInvocation(invocation, config, app.self_program);
  optiraid::core::BackupPipeline pipeline(config, deps);

  if (config.dry_run()) {
    optiraid::encoder::PlannedSliceSource source(config, optiraid::encoder::EstimateInputBytes(encoder_args));
    pipeline.Run(source);
    for (const auto& decision : pipeline.Decisions()) std::cout << decision << "\n";
    return optiraid::util::kExitOk;
  }

  optiraid::encoder::DarSliceSource source(config, *app.runner, app.self_program, encoder_args);
  pipeline.Run(source);
  std::cout << "backup complete: " << pipeline.Bundles().size() << " disc(s)\n";
  return optiraid::util::kExitOk;
}

optiraid::verify::SetVerifier MakeVerifier(const RuntimeConfig& config, const std::shared_ptr<optiraid::process::ProcessRunner>& runner) {
  return optiraid::verify::SetVerifier([&config, runner](optiraid::runtime::config::ParityCodec kind) {
    return optiraid::factory::BuildCodec(kind, config, *runner);
  });
}

int Verify(const RuntimeConfig& config, const std::filesystem::path& dir) {
  auto runner   = std::make_shared<optiraid::process::PosixProcessRunner>();
  auto verifier = MakeVerifier(config, runner);
  auto report   = verifier.Reconstruct(dir);

  std::cout << "sets checked: " << report.sets.size() << "\n";
  for (const auto& name : report.missing) std::cout << "missing: " << name << "\n";
  for (const auto& name : report.corrupt) std::cout << "corrupt: " << name << "\n";
  for (const auto& name : report.repaired) std::cout << "repaired: " << name << "\n";
  std::cout << (report.all_data_recovered ? "all data present\n" : "data missing\n");
  return optiraid::util::kExitOk;
}

int Check(const RuntimeConfig& config, const std::filesystem::path& dir) {
  auto runner   = std::make_shared<optiraid::process::PosixProcessRunner>();
  auto verifier = MakeVerifier(config, runner);

  std::size_t damaged = 0;
  for (const auto& check : verifier.Check(dir)) {
    std::cout << "set " << check.set_index << ": ";
    if (check.Intact()) {
      std::cout << "ok\n";
      continue;
    }
    ++damaged;
    std::cout << check.missing.size() << " missing, " << check.corrupt.size() << " corrupt, parity " << check.parity << " ("
              << (check.Recoverable() ? "recoverable" : "UNRECOVERABLE") << ")\n";
    for (const auto& name : check.missing) std::cout << "  missing: " << name << "\n";
    for (const auto& name : check.corrupt) std::cout << "  corrupt: " << name << "\n";
    if (!check.Recoverable()) throw optiraid::util::Unrecoverable(check.set_index, check.Damaged(), check.parity);
  }

  if (damaged > 0) {
    throw optiraid::util::IntegrityFailure(std::to_string(damaged) + " damaged set(s) in " + dir.string() + "; run optiraid verify to repair");
  }
  return optiraid::util::kExitOk;
}

int Dispatch(const Invocation& invocation) {
  const auto& command = invocation.command;
  const auto& args    = invocation.args;

  if (command == "verify" || command == "check") {
    if (args.size() != 1) return optiraid::util::kExitUsage;
    const auto config = LoadConfig(invocation, false);
    optiraid::observability::InitializeLogging(config);
    return command == "verify" ? Verify(config, args[0]) : Check(config, args[0]);
  }

  if (command == "docs") {
    if (!args.empty()) return optiraid::util::kExitUsage;
    const auto config = LoadConfig(invocation, true);
    std::cout << optiraid::sequencer::RenderOverview(config, {}) << "\n" << optiraid::sequencer::kConfigName << ":\n"
              << optiraid::config::ConfigLoader::RenderYaml(config);
    return optiraid::util::kExitOk;
  }

  if (command == "backup") {
    const auto config = LoadConfig(invocation, true);
    optiraid::observability::InitializeLogging(config);
    return Backup(config, invocation);
  }

  if (command == "retry-parity" || command == "resume") {
    if (command == "retry-parity" ? args.size() != 1 : !args.empty()) return optiraid::util::kExitUsage;
    const auto set_index = command == "retry-parity" ? ParseSetIndex(args[0]) : std::optional<std::uint64_t>(0);
    if (!set_index) return optiraid::util::kExitUsage;

    const auto config = LoadConfig(invocation, true);
    if (config.dry_run()) throw optiraid::util::ConfigurationError(command + " has no dry run");
    optiraid::observability::InitializeLogging(config);
    optiraid::factory::RequirePersistentLedger(config);

    auto                           app = optiraid::factory::Build(config);
    optiraid::core::BackupPipeline pipeline(config, app.PipelineDependencies());
    if (command == "resume") {
      pipeline.Resume();
      std::cout << "resume complete: " << pipeline.Bundles().size() << " disc(s) burned\n";
    } else {
      const auto set = pipeline.RetryParity(*set_index);
      std::cout << "set " << set.index << " has parity again; run optiraid resume to burn it\n";
    }
    return optiraid::util::kExitOk;
  }

  return optiraid::util::kExitUsage;
}

} // namespace

int main(int argc, char** argv) {
  // dar runs this for every slice; it must not depend on a config file
  if (argc >= 2 && std::string(argv[1]) == "hook") {
    if (argc != 8) {
      std::cerr << "optiraid hook: expected <control-dir> <dir> <basename> <number> <extension> <context>\n";
      return optiraid::util::kExitUsage;
    }
    return optiraid::encoder::RunHook(argv[2], std::vector<std::string>(argv + 3, argv + argc));
  }

  Invocation invocation;
  if (argc >= 2 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
    Usage(std::cout);
    return optiraid::util::kExitOk;
  }
  if (!ParseArgs(argc, argv, &invocation)) {
    Usage(std::cerr);
    return optiraid::util::kExitUsage;
  }

  try {
    const int code = Dispatch(invocation);
    if (code == optiraid::util::kExitUsage) Usage(std::cerr);
    optiraid::observability::ShutdownLogging();
    return code;
  } catch (const std::exception& e) {
    const int code = optiraid::util::ToExitCode(e);
    OPTIRAID_LOG_ERROR("fatal error", {optiraid::observability::StringField("error", e.what()),
                                       optiraid::observability::StringField("exit", optiraid::util::ExitCodeName(code))});
    std::cerr << "optiraid: " << e.what() << "\n";
    optiraid::observability::ShutdownLogging();
    return code;
  }
}
