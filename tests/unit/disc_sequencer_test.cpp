#include "internal/sequencer/disc_sequencer.hpp"

#include <cassert>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/encoder/dar_slice_source.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/naming.hpp"

namespace {

namespace v1 = optiraid::core::v1;

using optiraid::model::DiscBundle;
using optiraid::model::DiscFileKind;
using optiraid::model::RedundancySet;
using optiraid::sequencer::DiscSequencer;

constexpr std::uint64_t kMiB = 1024 * 1024;

optiraid::runtime::config::RuntimeConfig MakeConfig() {
  // two data discs and one parity disc, 3 MiB usable per disc
  return optiraid::config::ConfigLoader::LoadFromYamlString(R"(staging:
  dir: "/var/tmp/optiraid-sequencer"
layout:
  basename: "home"
  disc_size_mib: 4
  reserve_mib: 1
  slice_size_mib: 1
  set_size: 2
  parity: 1
)");
}

RedundancySet MakeSet(std::uint64_t index, std::size_t data, std::uint64_t slice_bytes = kMiB) {
  RedundancySet set;
  set.index         = index;
  set.state         = v1::SET_STATE_CLOSED;
  set.manifest_name = optiraid::util::ManifestName("home", index, 4);
  for (std::size_t i = 0; i < data; ++i) {
    optiraid::model::Slice slice;
    slice.basename   = "home";
    slice.set_index  = index;
    slice.sequence   = index * 2 + i + 1;
    slice.extension  = "dar";
    slice.path       = "/var/tmp/optiraid-sequencer/" + optiraid::util::DataSliceName("home", slice.sequence, 4, "dar");
    slice.size_bytes = slice_bytes;
    set.data.push_back(slice);
  }
  optiraid::model::ParityShard shard;
  shard.name       = optiraid::util::ParityShardName("home", index, 1, 4);
  shard.path       = "/var/tmp/optiraid-sequencer/" + shard.name;
  shard.size_bytes = slice_bytes;
  shard.position   = 0;
  shard.role       = v1::MEMBER_ROLE_PARITY;
  set.parity.push_back(shard);
  return set;
}

void TestMembersSpreadAcrossGroup() {
  auto          config = MakeConfig();
  DiscSequencer sequencer(config);
  assert(sequencer.Capacity() == 3 * kMiB);

  for (std::uint64_t index = 0; index < 3; ++index) {
    assert(sequencer.Place(MakeSet(index, 2)).empty());
  }
  assert((sequencer.Used() == std::vector<std::uint64_t>{3 * kMiB, 3 * kMiB, 3 * kMiB}));

  // the fourth set no longer fits and displaces the full group
  auto bundles = sequencer.Place(MakeSet(3, 2));
  assert(bundles.size() == 3);
  assert(sequencer.GroupsEmitted() == 1);
  assert(sequencer.GroupIndex() == 2);

  for (std::size_t disc = 0; disc < bundles.size(); ++disc) {
    const auto& bundle = bundles[disc];
    assert(bundle.disc_index == disc + 1);
    assert(bundle.group_index == 1);
    assert(bundle.position == disc + 1);
    assert(bundle.title == "home-0001-00" + std::to_string(disc + 1));
    assert(bundle.pure_parity == (disc == 2));
    assert(bundle.total_bytes == 3 * kMiB);
    assert((bundle.set_indexes == std::vector<std::uint64_t>{0, 1, 2}));

    // three members, three manifests, README, configuration
    assert(bundle.files.size() == 8);
    assert(bundle.MemberNames().size() == 3);
    assert(bundle.files[3].kind == DiscFileKind::kManifest);
    assert(bundle.files[3].name == "home.set-0000.manifest");
    assert(bundle.files[6].name == "README.txt");
    assert(bundle.files[7].name == "optiraid.yaml");
    assert(bundle.files[6].content.find("Disc " + bundle.title) == 0);
    assert(bundle.files[6].size_bytes == bundle.files[6].content.size());
  }
  assert(bundles[0].files[0].name == "home.0001.dar");
  assert(bundles[1].files[0].name == "home.0002.dar");
  assert(bundles[2].files[0].name == "home.set-0000.par-0001");
  assert(bundles[2].files[6].content.find("a parity disc") != std::string::npos);

  auto rest = sequencer.Flush();
  assert(rest.size() == 3);
  assert(rest[0].disc_index == 4 && rest[0].title == "home-0002-001");
  assert(sequencer.Empty());
  assert(sequencer.Flush().empty());
}

void TestShortSetLeavesDiscEmpty() {
  auto          config = MakeConfig();
  DiscSequencer sequencer(config, 5, 14);

  assert(sequencer.Place(MakeSet(0, 1, 100)).empty());
  auto bundles = sequencer.Flush();
  assert(bundles.size() == 2 && "the second data disc holds nothing");
  assert(bundles[0].position == 1 && bundles[0].disc_index == 15);
  assert(bundles[1].position == 3 && bundles[1].disc_index == 16);
  assert(bundles[1].group_index == 6);
  assert(sequencer.DiscsEmitted() == 16);
}

void TestAuxiliaryOutputsRideWithFirstParityShard() {
  auto config = MakeConfig();
  config.mutable_layout()->set_parity(2);
  DiscSequencer sequencer(config);

  auto set = MakeSet(0, 2, 1000);
  auto second     = set.parity[0];
  second.name     = optiraid::util::ParityShardName("home", 0, 2, 4);
  second.position = 1;
  set.parity.push_back(second);
  optiraid::model::ParityShard index;
  index.name       = "home.set-0000.par2";
  index.size_bytes = 40;
  index.role       = v1::MEMBER_ROLE_INDEX;
  set.parity.push_back(index);

  (void)sequencer.Place(set);
  auto bundles = sequencer.Flush();
  assert(bundles.size() == 4);
  assert((bundles[2].MemberNames() == std::vector<std::string>{"home.set-0000.par-0001", "home.set-0000.par2"}));
  assert((bundles[3].MemberNames() == std::vector<std::string>{"home.set-0000.par-0002"}));
}

void TestProgramCopyAndOversizedSet() {
  auto          config = MakeConfig();
  DiscSequencer sequencer(config, 0, 0, std::filesystem::path("/usr/local/bin/optiraid"));
  (void)sequencer.Place(MakeSet(0, 2, 10));
  auto bundles = sequencer.Flush();
  assert(bundles[0].files.back().kind == DiscFileKind::kProgram);
  assert(bundles[0].files.back().name == "optiraid");

  bool threw = false;
  try {
    (void)sequencer.Place(MakeSet(1, 2, 3 * kMiB + 1));
  } catch (const optiraid::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw && "a member larger than a disc can never be placed");
  assert(sequencer.Empty());
}

void TestReadmeRecordsInvocation() {
  auto       config     = MakeConfig();
  const auto invocation = optiraid::sequencer::RenderInvocation(
      {"optiraid", "--config", "/etc/optiraid.yaml", "backup", "-R", "/home/alice"},
      optiraid::encoder::DarArgv(config, "/usr/local/bin/optiraid", optiraid::encoder::kControlDirPlaceholder, {"-R", "/home/alice"}));
  DiscSequencer sequencer(config, 0, 0, std::nullopt, invocation);
  (void)sequencer.Place(MakeSet(0, 2));
  auto bundles = sequencer.Flush();
  assert(bundles.size() == 3);

  for (const auto& bundle : bundles) {
    std::string readme;
    for (const auto& file : bundle.files) {
      if (file.name == optiraid::sequencer::kReadmeName) readme = file.content;
    }
    assert(readme.find("Invocation:\n  optiraid --config /etc/optiraid.yaml backup -R /home/alice\n") != std::string::npos);
    assert(readme.find("  dar -c /var/tmp/optiraid-sequencer/home -Q -s 1048576 --min-digits 4") != std::string::npos);
    assert(readme.find("-E ") != std::string::npos && readme.find(" hook ") != std::string::npos);
    assert(readme.rfind(" -R /home/alice\n") > readme.find("  dar -c ") && "the encoder line ends with the backup root");
  }

  // the overview printed by `docs` has no invocation to show
  assert(optiraid::sequencer::RenderOverview(config, {}).find("Invocation:") == std::string::npos);
}

} // namespace

int main() {
  TestMembersSpreadAcrossGroup();
  TestShortSetLeavesDiscEmpty();
  TestAuxiliaryOutputsRideWithFirstParityShard();
  TestProgramCopyAndOversizedSet();
  TestReadmeRecordsInvocation();

  std::cout << "optiraid_unit_disc_sequencer: pass\n";
  return 0;
}
