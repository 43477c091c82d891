#include "internal/intake/slice_intake.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/encoder/planned_slice_source.hpp"
#include "internal/util/errors.hpp"

namespace {

using optiraid::encoder::SliceEvent;
using optiraid::intake::SliceIntake;
using optiraid::util::ProtocolViolation;

optiraid::runtime::config::RuntimeConfig MakeConfig() {
  return optiraid::config::ConfigLoader::LoadFromYamlString(R"(staging:
  dir: "/var/tmp/optiraid-intake"
layout:
  basename: "home"
  disc_size_mib: 10
  reserve_mib: 1
  slice_size_mib: 2
  set_size: 3
  parity: 1
)");
}

SliceEvent Event(std::uint64_t number, const std::string& context = "operation", std::uint64_t size = 100) {
  SliceEvent event;
  event.dir          = "/var/tmp/optiraid-intake";
  event.basename     = "home";
  event.slice_number = number;
  event.extension    = "dar";
  event.context      = context;
  event.size_bytes   = size;
  return event;
}

bool Violates(SliceIntake& intake, const SliceEvent& event) {
  try {
    (void)intake.Accept(event);
  } catch (const ProtocolViolation&) {
    return true;
  }
  return false;
}

void TestSlicesMapToSets() {
  auto        config = MakeConfig();
  SliceIntake intake(config);

  for (std::uint64_t n = 1; n <= 7; ++n) {
    auto slice = intake.Accept(Event(n, n == 7 ? "last_slice" : "operation"));
    assert(slice);
    assert(slice->sequence == n);
    assert(slice->set_index == (n - 1) / 3);
    assert(slice->Name() == "home.000" + std::to_string(n) + ".dar");
    assert(slice->is_final == (n == 7));
  }
  assert(intake.SawFinal());
  assert(intake.LastSequence() == 7);
}

void TestDuplicateIsDroppedAndGapsRejected() {
  auto        config = MakeConfig();
  SliceIntake intake(config);

  assert(intake.Accept(Event(1)));
  assert(!intake.Accept(Event(1)) && "redelivered slice is ignored");
  assert(Violates(intake, Event(3)));
  assert(intake.Accept(Event(2)));
  assert(Violates(intake, Event(1)));
}

void TestForeignOrOversizedSlices() {
  auto        config = MakeConfig();
  SliceIntake intake(config);

  auto foreign     = Event(1);
  foreign.basename = "other";
  assert(Violates(intake, foreign));

  assert(Violates(intake, Event(1, "operation", 2 * 1024 * 1024 + 1)));
  assert(Violates(intake, Event(1, "sleeping")));

  assert(intake.Accept(Event(1, "last_slice")));
  assert(Violates(intake, Event(2)) && "nothing may follow the final slice");
}

void TestSizeIsReadFromDisk() {
  auto       config = MakeConfig();
  const auto dir    = std::filesystem::temp_directory_path() / "optiraid_intake_tests";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  std::ofstream(dir / "home.0001.dar") << std::string(1234, 'a');

  SliceIntake intake(config);
  auto        event = Event(1);
  event.dir         = dir;
  event.size_bytes.reset();
  auto slice = intake.Accept(event);
  assert(slice && slice->size_bytes == 1234);

  auto missing = Event(2);
  missing.dir  = dir;
  missing.size_bytes.reset();
  assert(Violates(intake, missing));
}

void TestPlannedSourceCoversEstimate() {
  auto                                 config = MakeConfig();
  const std::uint64_t                  slice  = 2 * 1024 * 1024;
  optiraid::encoder::PlannedSliceSource source(config, 2 * slice + 5);
  source.Start();
  assert(source.SliceCount() == 3);

  std::uint64_t total = 0;
  int           count = 0;
  while (auto event = source.Next()) {
    ++count;
    total += *event->size_bytes;
    assert(event->IsFinal() == (count == 3));
  }
  assert(count == 3);
  assert(total == 2 * slice + 5);

  optiraid::encoder::PlannedSliceSource empty(config, 0);
  auto                                  only = empty.Next();
  assert(only && only->IsFinal() && *only->size_bytes == 0);
  assert(!empty.Next());
}

} // namespace

int main() {
  TestSlicesMapToSets();
  TestDuplicateIsDroppedAndGapsRejected();
  TestForeignOrOversizedSlices();
  TestSizeIsReadFromDisk();
  TestPlannedSourceCoversEstimate();

  std::cout << "optiraid_unit_slice_intake: pass\n";
  return 0;
}
