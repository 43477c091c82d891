#include "internal/parity/rs_codec.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "internal/parity/gf256.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/naming.hpp"

namespace {

namespace gf256 = optiraid::parity::gf256;
namespace v1    = optiraid::v1;

using optiraid::parity::ParityRequest;
using optiraid::parity::ReedSolomonCodec;
using optiraid::parity::RepairRequest;

std::filesystem::path FreshDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "optiraid_rs_codec_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

std::string Pattern(std::size_t length, unsigned seed) {
  std::string data(length, '\0');
  unsigned    state = seed;
  for (auto& c : data) {
    state = state * 1103515245u + 12345u;
    c     = static_cast<char>(state >> 16);
  }
  return data;
}

void WriteFile(const std::filesystem::path& path, const std::string& data) {
  std::ofstream out(path, std::ios::binary);
  out << data;
}

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream      in(path, std::ios::binary);
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

void TestFieldArithmetic() {
  assert(gf256::Mul(0, 77) == 0);
  assert(gf256::Mul(1, 77) == 77);
  assert(gf256::Mul(2, 0x80) == 0x1d);
  for (int a = 1; a < 256; ++a) {
    const auto value = static_cast<std::uint8_t>(a);
    assert(gf256::Mul(value, gf256::Inv(value)) == 1);
    assert(gf256::Div(gf256::Mul(value, 9), 9) == value);
  }

  gf256::Matrix m = {{2, 3}, {4, 5}};
  auto          inv = gf256::Invert(m);
  for (int r = 0; r < 2; ++r) {
    for (int c = 0; c < 2; ++c) {
      std::uint8_t sum = 0;
      for (int k = 0; k < 2; ++k) sum ^= gf256::Mul(m[r][k], inv[k][c]);
      assert(sum == (r == c ? 1 : 0));
    }
  }

  bool threw = false;
  try {
    (void)gf256::Invert({{1, 1}, {1, 1}});
  } catch (const std::domain_error&) {
    threw = true;
  }
  assert(threw && "a singular matrix has no inverse");
}

struct Fixture {
  std::filesystem::path    dir;
  std::vector<std::string> contents;
  v1::SetManifest          manifest;
};

// Three data members of unequal length, two parity shards.
Fixture Generate(const std::string& name, ReedSolomonCodec& codec) {
  Fixture fixture;
  fixture.dir      = FreshDir(name);
  fixture.contents = {Pattern(1000, 1), Pattern(733, 2), Pattern(1000, 3)};

  ParityRequest request;
  request.set_index  = 1;
  request.basename   = "t";
  request.parity     = 2;
  request.digits     = 4;
  request.output_dir = fixture.dir;

  fixture.manifest.set_basename("t");
  fixture.manifest.set_set_index(1);
  fixture.manifest.set_set_size(3);
  fixture.manifest.set_parity(2);
  fixture.manifest.set_digits(4);

  for (std::size_t i = 0; i < fixture.contents.size(); ++i) {
    const auto member = optiraid::util::DataSliceName("t", i + 1, 4, "dar");
    WriteFile(fixture.dir / member, fixture.contents[i]);
    request.inputs.push_back(fixture.dir / member);
    request.input_sizes.push_back(fixture.contents[i].size());

    auto* entry = fixture.manifest.add_members();
    entry->set_name(member);
    entry->set_role(v1::MEMBER_ROLE_DATA);
    entry->set_position(static_cast<std::uint32_t>(i));
    entry->set_size_bytes(fixture.contents[i].size());
  }

  auto result = codec.Generate(request);
  assert(result.shard_length == 1000);
  assert(result.outputs.size() == 2);
  fixture.manifest.set_shard_length(result.shard_length);
  for (const auto& shard : result.outputs) {
    assert(std::filesystem::file_size(shard.path) == 1000);
    assert(!std::filesystem::exists(shard.path.string() + ".tmp"));
    auto* entry = fixture.manifest.add_members();
    entry->set_name(shard.name);
    entry->set_role(v1::MEMBER_ROLE_PARITY);
    entry->set_position(shard.position);
    entry->set_size_bytes(shard.size_bytes);
  }
  return fixture;
}

void TestPlanMatchesGenerate() {
  ReedSolomonCodec codec(64);
  ParityRequest    request;
  request.set_index   = 1;
  request.basename    = "t";
  request.parity      = 2;
  request.digits      = 4;
  request.input_sizes = {1000, 733, 1000};
  request.output_dir  = "/nonexistent";

  auto plan = codec.Plan(request);
  assert(plan.outputs.size() == 2);
  assert(plan.outputs[0].name == "t.set-0001.par-0001");
  assert(plan.outputs[1].name == "t.set-0001.par-0002");
  assert(plan.outputs[1].position == 1);
  assert(plan.outputs[0].size_bytes == 1000);
}

void TestRepairRebuildsLostDataWithinParity() {
  ReedSolomonCodec codec(64);
  auto             fixture = Generate("repair", codec);

  // lose the short member and one parity shard, corrupt another member
  std::filesystem::remove(fixture.dir / fixture.manifest.members(1).name());
  std::filesystem::remove(fixture.dir / fixture.manifest.members(4).name());

  RepairRequest repair;
  repair.manifest = &fixture.manifest;
  repair.dir      = fixture.dir;
  repair.damaged  = {fixture.manifest.members(1).name(), fixture.manifest.members(4).name()};
  codec.Repair(repair);

  assert(ReadFile(fixture.dir / fixture.manifest.members(1).name()) == fixture.contents[1]);
  assert(std::filesystem::file_size(fixture.dir / fixture.manifest.members(4).name()) == 1000);

  // two data members gone, both parity rows intact
  std::filesystem::remove(fixture.dir / fixture.manifest.members(0).name());
  WriteFile(fixture.dir / fixture.manifest.members(2).name(), Pattern(1000, 99));
  repair.damaged = {fixture.manifest.members(0).name(), fixture.manifest.members(2).name()};
  codec.Repair(repair);
  assert(ReadFile(fixture.dir / fixture.manifest.members(0).name()) == fixture.contents[0]);
  assert(ReadFile(fixture.dir / fixture.manifest.members(2).name()) == fixture.contents[2]);
}

void TestDamageBeyondParityIsUnrecoverable() {
  ReedSolomonCodec codec(64);
  auto             fixture = Generate("unrecoverable", codec);

  RepairRequest repair;
  repair.manifest = &fixture.manifest;
  repair.dir      = fixture.dir;
  repair.damaged  = {fixture.manifest.members(0).name(), fixture.manifest.members(1).name(), fixture.manifest.members(3).name()};

  bool threw = false;
  try {
    codec.Repair(repair);
  } catch (const optiraid::util::Unrecoverable& e) {
    threw = e.set_index() == 1 && e.damaged() == 3 && e.parity() == 2;
  }
  assert(threw && "two parity shards cannot rebuild three losses");
  // nothing was rewritten
  assert(ReadFile(fixture.dir / fixture.manifest.members(0).name()) == fixture.contents[0]);
}

void TestTooManyColumnsIsAConfigurationError() {
  bool threw = false;
  try {
    (void)ReedSolomonCodec::CauchyMatrix(250, 6);
  } catch (const optiraid::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFieldArithmetic();
  TestPlanMatchesGenerate();
  TestRepairRebuildsLostDataWithinParity();
  TestDamageBeyondParityIsUnrecoverable();
  TestTooManyColumnsIsAConfigurationError();

  std::cout << "optiraid_unit_rs_codec: pass\n";
  return 0;
}
