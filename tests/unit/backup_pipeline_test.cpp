#include "internal/core/backup_pipeline.hpp"

#include <algorithm>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "internal/burn/directory_burner.hpp"
#include "internal/burn/media_prompt.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/encoder/planned_slice_source.hpp"
#include "internal/parity/rs_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/naming.hpp"
#include "internal/verify/set_verifier.hpp"

#if OPTIRAID_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

namespace v1 = optiraid::core::v1;

using optiraid::core::BackupPipeline;
using optiraid::core::PipelineDeps;
using optiraid::runtime::config::RuntimeConfig;

constexpr std::uint64_t kMiB = 1024 * 1024;

struct Layout {
  std::uint32_t set_size       = 4;
  std::uint32_t parity         = 1;
  std::uint64_t disc_size_mib  = 3;
  std::uint64_t reserve_mib    = 1;
  std::uint64_t slice_size_mib = 1;
};

std::filesystem::path TestRoot(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "optiraid_pipeline_tests" / name;
  std::filesystem::remove_all(root);
  std::filesystem::create_directories(root);
  return root;
}

RuntimeConfig MakeConfig(const std::filesystem::path& root, const Layout& layout, bool dry_run = false) {
  std::ostringstream yaml;
  yaml << "staging:\n  dir: \"" << (root / "staging").string() << "\"\n"
       << "layout:\n  basename: home\n"
       << "  set_size: " << layout.set_size << "\n  parity: " << layout.parity << "\n"
       << "  disc_size_mib: " << layout.disc_size_mib << "\n  reserve_mib: " << layout.reserve_mib << "\n"
       << "  slice_size_mib: " << layout.slice_size_mib << "\n"
       << "burn:\n  mode: BURN_MODE_DIRECTORY\n  output_dir: \"" << (root / "discs").string() << "\"\n";
  auto config = optiraid::config::ConfigLoader::LoadFromYamlString(yaml.str());
  config.set_dry_run(dry_run);
  return config;
}

std::string Contents(std::uint64_t sequence, std::uint64_t size) {
  std::string data(size, '\0');
  for (std::uint64_t i = 0; i < size; ++i) data[i] = static_cast<char>((i * 7 + sequence * 13) & 0xff);
  return data;
}

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream      in(path, std::ios::binary);
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

// Free space of a pretend filesystem: everything under the staging
// directory plus whatever other writers took.
class StagingProbe final : public optiraid::scratch::FreeSpaceProbe {
 public:
  explicit StagingProbe(std::uint64_t total) : total_(total) {
  }

  std::uint64_t FreeBytes(const std::filesystem::path& path) override {
    std::uint64_t used = external_;
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
      for (const auto& entry : std::filesystem::recursive_directory_iterator(path)) {
        if (entry.is_regular_file()) used += entry.file_size();
      }
    }
    return used >= total_ ? 0 : total_ - used;
  }

  void SetExternal(std::uint64_t bytes) {
    external_ = bytes;
  }

 private:
  std::uint64_t total_;
  std::uint64_t external_ = 0;
};

// Encoder stand-in: writes each slice into staging before reporting it.
class ScriptedSource final : public optiraid::encoder::SliceSource {
 public:
  ScriptedSource(std::filesystem::path dir, std::vector<std::uint64_t> sizes) : dir_(std::move(dir)), sizes_(std::move(sizes)) {
  }

  void Start() override {
    started_ = true;
  }

  std::optional<optiraid::encoder::SliceEvent> Next() override {
    assert(started_);
    assert(acknowledged_ == next_ && "the encoder must wait for the ack");
    if (next_ >= sizes_.size()) return std::nullopt;

    const auto sequence = next_ + 1;
    if (auto it = external_before_.find(sequence); it != external_before_.end()) probe_->SetExternal(it->second);

    std::ofstream(dir_ / optiraid::util::DataSliceName("home", sequence, 4, "dar"), std::ios::binary) << Contents(sequence, sizes_[next_]);

    optiraid::encoder::SliceEvent event;
    event.dir          = dir_;
    event.basename     = "home";
    event.slice_number = sequence;
    event.extension    = "dar";
    event.context      = sequence == sizes_.size() && report_last_ ? "last_slice" : "operation";
    ++next_;
    return event;
  }

  void Acknowledge() override {
    ++acknowledged_;
  }

  void Finish() override {
    finished_ = true;
  }

  void Abort() override {
    aborted_ = true;
  }

  // Other writers claim `bytes` just before slice `sequence` is written.
  void ClaimSpaceBefore(std::uint64_t sequence, std::shared_ptr<StagingProbe> probe, std::uint64_t bytes) {
    probe_                     = std::move(probe);
    external_before_[sequence] = bytes;
  }

  bool finished_    = false;
  bool aborted_     = false;
  bool report_last_ = true;

 private:
  std::filesystem::path                   dir_;
  std::vector<std::uint64_t>              sizes_;
  std::size_t                             next_         = 0;
  std::size_t                             acknowledged_ = 0;
  bool                                    started_      = false;
  std::shared_ptr<StagingProbe>           probe_;
  std::map<std::uint64_t, std::uint64_t>  external_before_;
};

// Reed-Solomon that fails one set's first attempt.
class FlakyCodec final : public optiraid::parity::ParityCodec {
 public:
  explicit FlakyCodec(std::uint64_t failing_set) : failing_set_(failing_set) {
  }

  optiraid::runtime::config::ParityCodec Kind() const override {
    return inner_.Kind();
  }
  optiraid::parity::ParityResult Plan(const optiraid::parity::ParityRequest& request) const override {
    return inner_.Plan(request);
  }
  optiraid::parity::ParityResult Generate(const optiraid::parity::ParityRequest& request) override {
    if (request.set_index == failing_set_ && !failed_) {
      failed_ = true;
      throw optiraid::util::ExternalToolFailure("fake-parity", 1, "interrupted", request.set_index);
    }
    return inner_.Generate(request);
  }
  void Repair(const optiraid::parity::RepairRequest& request) override {
    inner_.Repair(request);
  }

 private:
  optiraid::parity::ReedSolomonCodec inner_;
  std::uint64_t                      failing_set_;
  bool                               failed_ = false;
};

// Directory burner whose first attempt at one disc fails.
class FlakyBurner final : public optiraid::burn::BurnTool {
 public:
  FlakyBurner(std::filesystem::path output, std::string failing_title) : inner_(std::move(output)), failing_title_(std::move(failing_title)) {
  }

  std::string Describe() const override {
    return inner_.Describe();
  }
  void Burn(const optiraid::model::DiscBundle& bundle, const std::filesystem::path& dir) override {
    ++attempts_[bundle.title];
    if (bundle.title == failing_title_ && attempts_[bundle.title] == 1) {
      throw optiraid::util::ExternalToolFailure("fake-burn", 254, "no medium found");
    }
    inner_.Burn(bundle, dir);
  }
  std::optional<std::filesystem::path> BurnedLocation(const std::string& title) const override {
    return inner_.BurnedLocation(title);
  }

  int Attempts(const std::string& title) {
    return attempts_[title];
  }

 private:
  optiraid::burn::DirectoryBurner inner_;
  std::string                     failing_title_;
  std::map<std::string, int>      attempts_;
};

PipelineDeps MakeDeps(const RuntimeConfig& config, std::shared_ptr<optiraid::db::Repository> ledger) {
  PipelineDeps deps;
  deps.ledger = std::move(ledger);
  deps.codec  = std::make_shared<optiraid::parity::ReedSolomonCodec>();
  deps.burner = std::make_shared<optiraid::burn::DirectoryBurner>(config.burn().output_dir());
  deps.prompt = std::make_shared<optiraid::burn::NoPrompt>();
  deps.probe  = std::make_shared<optiraid::scratch::FixedSpaceProbe>(1ull << 40);
  return deps;
}

std::shared_ptr<optiraid::db::Repository> MakeLedger(const std::filesystem::path& root) {
#if OPTIRAID_DB_SQLITE
  auto db = std::make_shared<optiraid::db::sqlite::SqliteDB>((root / "ledger.sqlite").string());
  db->EnsureSchema();
  return std::make_shared<optiraid::db::sqlite::SqliteRepository>(db);
#else
  (void)root;
  return std::make_shared<optiraid::db::memory::MemoryRepository>();
#endif
}

optiraid::db::model::RunRecord RunOf(optiraid::db::Repository& ledger, const std::string& run_id) {
  auto tx  = ledger.Begin();
  auto run = ledger.GetRun(*tx, run_id);
  tx->Commit();
  assert(run.has_value());
  return *run;
}

std::vector<optiraid::db::model::SetRecord> SetsOf(optiraid::db::Repository& ledger, const std::string& run_id) {
  auto tx   = ledger.Begin();
  auto sets = ledger.ListSets(*tx, run_id);
  tx->Commit();
  return sets;
}

std::vector<optiraid::db::model::BundleRecord> BundlesOf(optiraid::db::Repository& ledger, const std::string& run_id) {
  auto tx      = ledger.Begin();
  auto bundles = ledger.ListBundles(*tx, run_id);
  tx->Commit();
  return bundles;
}

bool Contains(const std::vector<std::string>& decisions, const std::string& decision) {
  return std::find(decisions.begin(), decisions.end(), decision) != decisions.end();
}

// Ten slices, four per set: sets of 4, 4 and 2 slices over two groups.
std::vector<std::uint64_t> TenSlices() {
  std::vector<std::uint64_t> sizes(9, kMiB);
  sizes.push_back(1000);
  return sizes;
}

void TestBackupBurnsVerifiesAndRestores() {
  const auto root   = TestRoot("full");
  const auto config = MakeConfig(root, Layout{});
  auto       ledger = std::make_shared<optiraid::db::memory::MemoryRepository>();

  BackupPipeline pipeline(config, MakeDeps(config, ledger));
  ScriptedSource source(root / "staging", TenSlices());
  pipeline.Run(source);
  assert(source.finished_ && !source.aborted_);

  const auto& decisions = pipeline.Decisions();
  assert(decisions.size() == 11);
  assert(decisions[0] == "set 0000 ready: 4 data, 1 parity, 5242880 bytes");
  assert(decisions[2] == "set 0002 ready: 2 data, 1 parity, 2098152 bytes");
  assert(decisions[3] == "disc home-0001-001 (#1): home.0001.dar home.0005.dar = 2097152 bytes");
  assert(decisions[7] == "disc home-0001-005 (#5, parity): home.set-0000.par-0001 home.set-0001.par-0001 = 2097152 bytes");
  assert(decisions[9] == "disc home-0002-002 (#7): home.0010.dar = 1000 bytes");
  assert(decisions[10] == "disc home-0002-005 (#8, parity): home.set-0002.par-0001 = 1048576 bytes");

  const auto run = RunOf(*ledger, pipeline.RunId());
  assert(run.state == v1::RUN_STATE_COMPLETED);
  assert(run.last_sequence == 10);
  assert(run.discs_emitted == 8 && run.groups_emitted == 2);
  for (const auto& set : SetsOf(*ledger, pipeline.RunId())) assert(set.state == v1::SET_STATE_VERIFIED);
  for (const auto& bundle : BundlesOf(*ledger, pipeline.RunId())) assert(bundle.state == v1::BUNDLE_STATE_VERIFIED);

  // everything burned has left staging
  assert(std::filesystem::is_empty(root / "staging"));

  const auto disc = root / "discs" / "home-0001-003";
  assert(std::filesystem::exists(disc / "home.0003.dar"));
  assert(std::filesystem::exists(disc / "home.set-0000.manifest"));
  assert(std::filesystem::exists(disc / "home.set-0001.manifest"));
  assert(ReadFile(disc / "README.txt").find("disc 3 of 5 in group 1") != std::string::npos);
  auto carried = optiraid::config::ConfigLoader::LoadFromYaml((disc / "optiraid.yaml").string());
  assert(carried.layout().set_size() == 4);

  // lose disc 2 of group 1, restore from the other four
  const auto restore = root / "restore";
  std::filesystem::create_directories(restore);
  for (int position : {1, 3, 4, 5}) {
    const auto source_disc = root / "discs" / ("home-0001-00" + std::to_string(position));
    for (const auto& entry : std::filesystem::directory_iterator(source_disc)) {
      std::filesystem::copy_file(entry.path(), restore / entry.path().filename(), std::filesystem::copy_options::overwrite_existing);
    }
  }

  optiraid::verify::SetVerifier verifier([](optiraid::runtime::config::ParityCodec) -> std::shared_ptr<optiraid::parity::ParityCodec> {
    return std::make_shared<optiraid::parity::ReedSolomonCodec>();
  });
  auto report = verifier.Reconstruct(restore);
  assert(report.all_data_recovered);
  assert((report.repaired == std::vector<std::string>{"home.0002.dar", "home.0006.dar"}));
  assert(ReadFile(restore / "home.0002.dar") == Contents(2, kMiB));
  assert(ReadFile(restore / "home.0006.dar") == Contents(6, kMiB));
}

void TestDryRunTakesTheSameDecisions() {
  const auto root       = TestRoot("dry");
  const auto invocation = "optiraid backup -R /home/alice\ndar -c " + (root / "staging" / "home").string() + " -R /home/alice\n";

  // the dry run goes first; it must leave nothing for the real run to trip over
  const auto dry_config = MakeConfig(root, Layout{}, true);
  auto       dry_deps   = MakeDeps(dry_config, std::make_shared<optiraid::db::memory::MemoryRepository>());
  dry_deps.invocation   = invocation;
  BackupPipeline                        dry(dry_config, dry_deps);
  optiraid::encoder::PlannedSliceSource planned(dry_config, 9 * kMiB + 1000);
  dry.Run(planned);
  assert(!std::filesystem::exists(root / "staging"));
  assert(!std::filesystem::exists(root / "discs"));

  const auto real_config = MakeConfig(root, Layout{});
  auto       real_deps   = MakeDeps(real_config, std::make_shared<optiraid::db::memory::MemoryRepository>());
  real_deps.invocation   = invocation;
  BackupPipeline real(real_config, real_deps);
  ScriptedSource source(root / "staging", TenSlices());
  real.Run(source);

  assert(dry.Decisions() == real.Decisions());
  assert(dry.Bundles().size() == 8);
  assert(real.Bundles().size() == 8);
  for (std::size_t i = 0; i < real.Bundles().size(); ++i) {
    const auto& planned_bundle = dry.Bundles()[i];
    const auto& burned_bundle  = real.Bundles()[i];
    assert(planned_bundle.FileNames() == burned_bundle.FileNames());

    std::size_t documents = 0;
    for (const auto& file : burned_bundle.files) {
      if (file.kind != optiraid::model::DiscFileKind::kDocument) continue;
      ++documents;
      const auto planned_file = std::find_if(planned_bundle.files.begin(), planned_bundle.files.end(),
                                             [&](const optiraid::model::DiscFile& candidate) { return candidate.name == file.name; });
      assert(planned_file != planned_bundle.files.end());
      assert(planned_file->content == file.content);
      assert(ReadFile(root / "discs" / burned_bundle.title / file.name) == file.content);
    }
    assert(documents == 2);
  }
  assert(ReadFile(root / "discs" / "home-0001-001" / "README.txt").find("  optiraid backup -R /home/alice\n") != std::string::npos);
  assert(RunOf(*real_deps.ledger, real.RunId()).invocation == invocation);
}

void TestSpaceGateFlushesGroupEarly() {
  const auto root = TestRoot("gate");
  Layout     layout;
  layout.set_size      = 2;
  layout.disc_size_mib = 4;
  const auto config    = MakeConfig(root, layout);
  auto       ledger    = std::make_shared<optiraid::db::memory::MemoryRepository>();
  auto       probe     = std::make_shared<StagingProbe>(12 * kMiB);

  auto deps  = MakeDeps(config, ledger);
  deps.probe = probe;
  BackupPipeline pipeline(config, deps);

  ScriptedSource source(root / "staging", std::vector<std::uint64_t>(6, 700000));
  source.ClaimSpaceBefore(4, probe, 7000000);
  pipeline.Run(source);

  assert(Contains(pipeline.Decisions(), "space gate before set 0002: flushing group 0001 early"));
  assert(pipeline.Bundles().size() == 6);
  assert(pipeline.Bundles()[3].title == "home-0002-001");
  assert(RunOf(*ledger, pipeline.RunId()).state == v1::RUN_STATE_COMPLETED);
}

void TestSpaceGateGivesUp() {
  const auto root = TestRoot("gate_full");
  Layout     layout;
  layout.set_size      = 2;
  layout.disc_size_mib = 4;
  const auto config    = MakeConfig(root, layout);
  auto       ledger    = std::make_shared<optiraid::db::memory::MemoryRepository>();
  auto       probe     = std::make_shared<StagingProbe>(12 * kMiB);

  auto deps  = MakeDeps(config, ledger);
  deps.probe = probe;
  BackupPipeline pipeline(config, deps);

  ScriptedSource source(root / "staging", std::vector<std::uint64_t>(6, 700000));
  source.ClaimSpaceBefore(4, probe, 10000000);

  bool threw = false;
  try {
    pipeline.Run(source);
  } catch (const optiraid::util::InsufficientSpace&) {
    threw = true;
  }
  assert(threw);
  assert(source.aborted_);
  assert(RunOf(*ledger, pipeline.RunId()).state == v1::RUN_STATE_FAILED);
}

void TestStagingMustBeEmpty() {
  const auto root   = TestRoot("conflict");
  const auto config = MakeConfig(root, Layout{});
  std::filesystem::create_directories(root / "staging");
  std::ofstream(root / "staging" / "stray") << "x";

  BackupPipeline pipeline(config, MakeDeps(config, std::make_shared<optiraid::db::memory::MemoryRepository>()));
  ScriptedSource source(root / "staging", TenSlices());
  bool           threw = false;
  try {
    pipeline.Run(source);
  } catch (const optiraid::util::StagingConflict&) {
    threw = true;
  }
  assert(threw);
}

void TestParityFailureRetryAndResume() {
  const auto root = TestRoot("retry");
  Layout     layout;
  layout.set_size      = 2;
  layout.disc_size_mib = 4;
  const auto config    = MakeConfig(root, layout);
  auto       codec     = std::make_shared<FlakyCodec>(1);
  auto       ledger    = MakeLedger(root);
  std::string run_id;

  {
    auto deps  = MakeDeps(config, ledger);
    deps.codec = codec;
    BackupPipeline pipeline(config, deps);
    ScriptedSource source(root / "staging", std::vector<std::uint64_t>(6, 700000));

    bool threw = false;
    try {
      pipeline.Run(source);
    } catch (const optiraid::util::ExternalToolFailure& e) {
      threw = e.set_index() == 1;
    }
    assert(threw && "the failed set is reported once the stream is done");
    assert(source.finished_ && "a parity failure does not stop the encoder");
    run_id = pipeline.RunId();
  }

  // a later invocation, with only the ledger and staging left
  auto deps   = MakeDeps(config, ledger);
  deps.codec  = codec;

  assert(RunOf(*ledger, run_id).state == v1::RUN_STATE_STREAM_DONE);
  auto sets = SetsOf(*ledger, run_id);
  assert(sets.size() == 3);
  assert(sets[0].state == v1::SET_STATE_CLOSED);
  assert(sets[1].state == v1::SET_STATE_PARITY_PENDING && !sets[1].last_error.empty());
  assert(sets[2].state == v1::SET_STATE_CLOSED);
  assert(BundlesOf(*ledger, run_id).empty());

  {
    BackupPipeline early(config, deps);
    bool           threw = false;
    try {
      early.Resume();
    } catch (const optiraid::util::InvalidState& e) {
      threw = std::string(e.what()).find("retry-parity 1") != std::string::npos;
    }
    assert(threw && "resume refuses to skip a set without parity");
  }

  BackupPipeline pipeline(config, deps);
  auto           retried = pipeline.RetryParity(1);
  assert(retried.parity.size() == 1);
  assert(Contains(pipeline.Decisions(), "set 0001 parity regenerated: 1 parity, 700000 bytes"));

  pipeline.Resume();
  assert(pipeline.Bundles().size() == 3);
  assert(RunOf(*ledger, run_id).state == v1::RUN_STATE_COMPLETED);
  for (const auto& set : SetsOf(*ledger, run_id)) assert(set.state == v1::SET_STATE_VERIFIED);
  assert(std::filesystem::is_empty(root / "staging"));

  // nothing left to do
  BackupPipeline again(config, deps);
  again.Resume();
  assert(again.Bundles().empty());
}

void TestFailedBurnIsRetriedOnResume() {
  const auto root   = TestRoot("reburn");
  Layout     layout;
  layout.set_size      = 2;
  layout.disc_size_mib = 4;
  const auto config    = MakeConfig(root, layout);
  auto       ledger    = std::make_shared<optiraid::db::memory::MemoryRepository>();
  auto       burner    = std::make_shared<FlakyBurner>(root / "discs", "home-0001-002");
  std::string run_id;

  {
    auto deps   = MakeDeps(config, ledger);
    deps.burner = burner;
    BackupPipeline pipeline(config, deps);
    ScriptedSource source(root / "staging", std::vector<std::uint64_t>(4, 700000));

    bool threw = false;
    try {
      pipeline.Run(source);
    } catch (const optiraid::util::ExternalToolFailure&) {
      threw = true;
    }
    assert(threw);
    run_id = pipeline.RunId();
  }

  auto bundles = BundlesOf(*ledger, run_id);
  assert(bundles.size() == 3);
  assert(bundles[0].state == v1::BUNDLE_STATE_VERIFIED);
  assert(bundles[1].state == v1::BUNDLE_STATE_FAILED);
  assert(bundles[2].state == v1::BUNDLE_STATE_VERIFIED && "the other discs of the group are still burned");
  assert(RunOf(*ledger, run_id).state == v1::RUN_STATE_STREAM_DONE);

  auto deps   = MakeDeps(config, ledger);
  deps.burner = burner;
  BackupPipeline pipeline(config, deps);
  pipeline.Resume();

  assert(Contains(pipeline.Decisions(), "disc home-0001-002 (#2): burning again"));
  assert(burner->Attempts("home-0001-001") == 1);
  assert(burner->Attempts("home-0001-002") == 2);
  assert(burner->Attempts("home-0001-003") == 1);
  for (const auto& bundle : BundlesOf(*ledger, run_id)) assert(bundle.state == v1::BUNDLE_STATE_VERIFIED);
  for (const auto& set : SetsOf(*ledger, run_id)) assert(set.state == v1::SET_STATE_VERIFIED);
  assert(RunOf(*ledger, run_id).state == v1::RUN_STATE_COMPLETED);
}

void TestBurnFailureMidStreamKeepsGoing() {
  const auto root   = TestRoot("reburn_stream");
  const auto config = MakeConfig(root, Layout{});
  auto       ledger = std::make_shared<optiraid::db::memory::MemoryRepository>();
  auto       burner = std::make_shared<FlakyBurner>(root / "discs", "home-0001-002");
  std::string run_id;

  // four sets over two groups; group 1 burns while slices 13 and 14 are still to come
  std::vector<std::uint64_t> sizes(13, kMiB);
  sizes.push_back(1000);

  {
    auto deps   = MakeDeps(config, ledger);
    deps.burner = burner;
    BackupPipeline pipeline(config, deps);
    ScriptedSource source(root / "staging", sizes);

    bool threw = false;
    try {
      pipeline.Run(source);
    } catch (const optiraid::util::ExternalToolFailure& e) {
      threw = std::string(e.what()).find("no medium found") != std::string::npos;
    }
    assert(threw && "the failed disc is reported once everything else is burned");
    assert(source.finished_ && !source.aborted_);
    assert(pipeline.Bundles().size() == 10);
    run_id = pipeline.RunId();
  }

  assert(RunOf(*ledger, run_id).state == v1::RUN_STATE_STREAM_DONE);
  for (const auto& bundle : BundlesOf(*ledger, run_id)) {
    assert(bundle.state == (bundle.disc_index == 2 ? v1::BUNDLE_STATE_FAILED : v1::BUNDLE_STATE_VERIFIED));
  }
  for (const auto& set : SetsOf(*ledger, run_id)) {
    assert(set.state == (set.set_index < 2 ? v1::SET_STATE_SEQUENCED : v1::SET_STATE_VERIFIED));
  }
  // the failed disc's directory and members wait in staging
  assert(std::filesystem::is_directory(root / "staging" / optiraid::util::BundleDirName(2)));
  assert(std::filesystem::exists(root / "staging" / "home.0002.dar"));
  assert(std::filesystem::exists(root / "staging" / "home.0006.dar"));
  assert(!std::filesystem::exists(root / "staging" / "home.0001.dar"));

  auto deps   = MakeDeps(config, ledger);
  deps.burner = burner;
  BackupPipeline pipeline(config, deps);
  pipeline.Resume();

  assert(Contains(pipeline.Decisions(), "disc home-0001-002 (#2): burning again"));
  assert(burner->Attempts("home-0001-002") == 2);
  assert(burner->Attempts("home-0002-002") == 1);
  for (const auto& bundle : BundlesOf(*ledger, run_id)) assert(bundle.state == v1::BUNDLE_STATE_VERIFIED);
  for (const auto& set : SetsOf(*ledger, run_id)) assert(set.state == v1::SET_STATE_VERIFIED);
  assert(RunOf(*ledger, run_id).state == v1::RUN_STATE_COMPLETED);
  assert(std::filesystem::is_empty(root / "staging"));
}

void TestMissingLastSliceFailsTheRun() {
  const auto root   = TestRoot("no_last");
  const auto config = MakeConfig(root, Layout{});
  auto       ledger = std::make_shared<optiraid::db::memory::MemoryRepository>();

  BackupPipeline pipeline(config, MakeDeps(config, ledger));
  ScriptedSource source(root / "staging", std::vector<std::uint64_t>(3, 1000));
  source.report_last_ = false;

  bool threw = false;
  try {
    pipeline.Run(source);
  } catch (const optiraid::util::ProtocolViolation&) {
    threw = true;
  }
  assert(threw && "an encoder that never reports its last slice is a broken stream");
  assert(RunOf(*ledger, pipeline.RunId()).state == v1::RUN_STATE_FAILED);
  assert(pipeline.Bundles().empty());
}

void TestRefusedRunLeavesNothingBehind() {
  const auto root   = TestRoot("too_small");
  const auto config = MakeConfig(root, Layout{});
  auto       ledger = std::make_shared<optiraid::db::memory::MemoryRepository>();

  auto deps  = MakeDeps(config, ledger);
  deps.probe = std::make_shared<optiraid::scratch::FixedSpaceProbe>(4 * kMiB);
  BackupPipeline pipeline(config, deps);
  ScriptedSource source(root / "staging", TenSlices());

  bool threw = false;
  try {
    pipeline.Run(source);
  } catch (const optiraid::util::InsufficientSpace&) {
    threw = true;
  }
  assert(threw);
  assert(!std::filesystem::exists(root / "staging"));
  assert(!std::filesystem::exists(root / "staging.lock"));
  auto tx = ledger->Begin();
  assert(!ledger->GetRun(*tx, pipeline.RunId()).has_value());
  tx->Commit();
}

} // namespace

int main() {
  TestBackupBurnsVerifiesAndRestores();
  TestDryRunTakesTheSameDecisions();
  TestSpaceGateFlushesGroupEarly();
  TestSpaceGateGivesUp();
  TestStagingMustBeEmpty();
  TestParityFailureRetryAndResume();
  TestFailedBurnIsRetriedOnResume();
  TestBurnFailureMidStreamKeepsGoing();
  TestMissingLastSliceFailsTheRun();
  TestRefusedRunLeavesNothingBehind();

  std::cout << "optiraid_unit_backup_pipeline: pass\n";
  return 0;
}
