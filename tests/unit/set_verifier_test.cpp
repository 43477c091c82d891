#include "internal/verify/set_verifier.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/parity/rs_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/naming.hpp"
#include "internal/verify/manifest_io.hpp"

namespace {

namespace v1 = optiraid::core::v1;

using optiraid::model::RedundancySet;
using optiraid::parity::ReedSolomonCodec;
using optiraid::verify::SetVerifier;

std::string Contents(std::uint64_t sequence) {
  std::string data;
  for (std::uint64_t i = 0; i < 900 + sequence * 37; ++i) data.push_back(static_cast<char>((i * 31 + sequence) & 0xff));
  return data;
}

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream      in(path, std::ios::binary);
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

class RestoreDir {
 public:
  explicit RestoreDir(const std::string& name) {
    dir_ = std::filesystem::temp_directory_path() / "optiraid_verifier_tests" / name;
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);
    config_ = optiraid::config::ConfigLoader::LoadFromYamlString("staging:\n  dir: \"" + dir_.string() +
                                                                 "\"\nlayout:\n  basename: r\n  set_size: 3\n  parity: 1\n");
  }

  // Writes a set of `data` slices with its parity and manifest.
  void AddSet(std::uint64_t index, std::size_t data) {
    RedundancySet set;
    set.index         = index;
    set.manifest_name = optiraid::util::ManifestName("r", index, 4);

    optiraid::parity::ParityRequest request;
    request.set_index  = index;
    request.basename   = "r";
    request.parity     = 1;
    request.digits     = 4;
    request.output_dir = dir_;

    for (std::size_t i = 0; i < data; ++i) {
      optiraid::model::Slice slice;
      slice.basename   = "r";
      slice.set_index  = index;
      slice.sequence   = index * 3 + i + 1;
      slice.extension  = "dar";
      slice.path       = dir_ / optiraid::util::DataSliceName("r", slice.sequence, 4, "dar");
      const auto bytes = Contents(slice.sequence);
      slice.size_bytes = bytes.size();
      std::ofstream(slice.path, std::ios::binary) << bytes;
      request.inputs.push_back(slice.path);
      request.input_sizes.push_back(slice.size_bytes);
      set.data.push_back(slice);
    }

    auto result = codec_.Generate(request);
    set.parity  = result.outputs;
    optiraid::verify::WriteManifest(dir_ / set.manifest_name,
                                    optiraid::verify::BuildManifest(config_, set, codec_.Kind(), result.shard_length, true));
  }

  std::filesystem::path Path(std::uint64_t sequence) const {
    return dir_ / optiraid::util::DataSliceName("r", sequence, 4, "dar");
  }

  const std::filesystem::path& Dir() const {
    return dir_;
  }

 private:
  std::filesystem::path                    dir_;
  optiraid::runtime::config::RuntimeConfig config_;
  ReedSolomonCodec                         codec_;
};

SetVerifier MakeVerifier() {
  return SetVerifier([](optiraid::runtime::config::ParityCodec kind) -> std::shared_ptr<optiraid::parity::ParityCodec> {
    if (kind == optiraid::runtime::config::PARITY_CODEC_REED_SOLOMON) return std::make_shared<ReedSolomonCodec>();
    return nullptr;
  });
}

void TestIntactSetsPass() {
  RestoreDir restore("intact");
  restore.AddSet(0, 3);
  restore.AddSet(1, 2);

  auto checks = MakeVerifier().Check(restore.Dir());
  assert(checks.size() == 2);
  assert(checks[0].set_index == 0 && checks[0].Intact());
  assert(checks[1].manifest == "r.set-0001.manifest");

  auto report = MakeVerifier().Reconstruct(restore.Dir());
  assert(report.all_data_recovered);
  assert(report.repaired.empty());
  assert((report.sets == std::vector<std::uint64_t>{0, 1}));
}

void TestMissingAndCorruptMembersAreRebuilt() {
  RestoreDir restore("damaged");
  restore.AddSet(0, 3);
  restore.AddSet(1, 3);

  std::filesystem::remove(restore.Path(2));
  {
    std::fstream corrupt(restore.Path(5), std::ios::in | std::ios::out | std::ios::binary);
    corrupt.seekp(100);
    corrupt.put('\x7f');
  }

  auto checks = MakeVerifier().Check(restore.Dir());
  assert(checks[0].missing.size() == 1 && checks[0].Recoverable());
  assert(checks[1].corrupt.size() == 1 && checks[1].missing.empty());

  auto report = MakeVerifier().Reconstruct(restore.Dir());
  assert(report.all_data_recovered);
  assert(report.missing.size() == 1 && report.corrupt.size() == 1);
  assert(report.repaired.size() == 2);
  assert(ReadFile(restore.Path(2)) == Contents(2));
  assert(ReadFile(restore.Path(5)) == Contents(5));
}

void TestDamageBeyondParityIsReportedAfterOtherRepairs() {
  RestoreDir restore("unrecoverable");
  restore.AddSet(0, 3);
  restore.AddSet(1, 3);

  std::filesystem::remove(restore.Path(1));
  std::filesystem::remove(restore.Path(2));
  std::filesystem::remove(restore.Path(6));

  bool threw = false;
  try {
    (void)MakeVerifier().Reconstruct(restore.Dir());
  } catch (const optiraid::util::Unrecoverable& e) {
    threw = e.set_index() == 0 && e.damaged() == 2 && e.parity() == 1;
  }
  assert(threw);
  assert(ReadFile(restore.Path(6)) == Contents(6) && "set 1 is still repaired");
}

void TestDirectoryWithoutManifests() {
  RestoreDir restore("empty");
  bool       threw = false;
  try {
    (void)MakeVerifier().Reconstruct(restore.Dir());
  } catch (const optiraid::util::IntegrityFailure&) {
    threw = true;
  }
  assert(threw);
  assert(MakeVerifier().Check(restore.Dir()).empty());
}

void TestManifestFormatIsChecked() {
  RestoreDir restore("format");
  restore.AddSet(0, 1);
  const auto path     = restore.Dir() / "r.set-0000.manifest";
  auto       manifest = optiraid::verify::ReadManifest(path);
  assert(manifest.members_size() == 2);
  assert(manifest.members(0).sequence() == 1);
  assert(manifest.members(1).role() == v1::MEMBER_ROLE_PARITY);

  manifest.set_format_version(99);
  optiraid::verify::WriteManifest(path, manifest);
  bool threw = false;
  try {
    (void)optiraid::verify::ReadManifest(path);
  } catch (const optiraid::util::IntegrityFailure&) {
    threw = true;
  }
  assert(threw && "unknown manifest versions are refused");

  threw = false;
  try {
    (void)optiraid::verify::ParseManifest("format_version: 1 set_index: 0 members { name: \"../etc/passwd\" }", "tampered");
  } catch (const optiraid::util::IntegrityFailure&) {
    threw = true;
  }
  assert(threw && "member names must stay inside the restore directory");

  auto set = optiraid::verify::SetFromManifest(optiraid::verify::ParseManifest("format_version: 1 set_index: 4 basename: \"r\"", "inline"),
                                               restore.Dir(), "r.set-0004.manifest");
  assert(set.index == 4 && set.state == v1::SET_STATE_CLOSED);
}

} // namespace

int main() {
  TestIntactSetsPass();
  TestMissingAndCorruptMembersAreRebuilt();
  TestDamageBeyondParityIsReportedAfterOtherRepairs();
  TestDirectoryWithoutManifests();
  TestManifestFormatIsChecked();

  std::cout << "optiraid_unit_set_verifier: pass\n";
  return 0;
}
