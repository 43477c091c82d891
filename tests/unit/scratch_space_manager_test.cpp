#include "internal/scratch/scratch_space_manager.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "internal/util/errors.hpp"

namespace {

using optiraid::scratch::FixedSpaceProbe;
using optiraid::scratch::ScratchSpaceManager;

std::filesystem::path FreshDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "optiraid_scratch_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir.parent_path());
  return dir;
}

void TestPrepareCreatesAndRejectsNonEmpty() {
  const auto      dir = FreshDir("prepare");
  FixedSpaceProbe probe(1 << 20);
  {
    ScratchSpaceManager scratch(dir, probe, false);
    scratch.PrepareStaging();
    assert(std::filesystem::is_directory(dir));
    // an empty existing directory is accepted
    scratch.PrepareStaging();
  }

  std::ofstream(dir / "leftover") << "x";
  ScratchSpaceManager scratch(dir, probe, false);
  bool                threw = false;
  try {
    scratch.PrepareStaging();
  } catch (const optiraid::util::StagingConflict&) {
    threw = true;
  }
  assert(threw && "non-empty staging must be refused");
}

void TestDryRunNeverCreatesDirectory() {
  const auto          dir = FreshDir("dry");
  FixedSpaceProbe     probe(1 << 20);
  ScratchSpaceManager scratch(dir, probe, true);
  scratch.PrepareStaging();
  scratch.AcquireExclusive();
  assert(!std::filesystem::exists(dir));
  assert(!std::filesystem::exists(scratch.LockPath()));
}

void TestExclusiveLockRefusesSecondRun() {
  const auto      dir = FreshDir("lock");
  FixedSpaceProbe probe(1 << 20);

  ScratchSpaceManager first(dir, probe, false);
  first.PrepareStaging();
  first.AcquireExclusive();
  assert(std::filesystem::exists(first.LockPath()));

  ScratchSpaceManager second(dir, probe, false);
  bool                threw = false;
  try {
    second.AcquireExclusive();
  } catch (const optiraid::util::StagingConflict&) {
    threw = true;
  }
  assert(threw && "a held staging lock must be exclusive");
}

void TestLedgerArithmetic() {
  const auto          dir = FreshDir("ledger");
  FixedSpaceProbe     probe(1000);
  ScratchSpaceManager scratch(dir, probe, true);

  scratch.EnsureCapacity(900);
  scratch.Reserve(300);
  assert(scratch.Staged() == 300);
  assert(scratch.Available() == 700);
  assert(scratch.CanOpenSet(700));
  assert(!scratch.CanOpenSet(701));

  scratch.Release(500);
  assert(scratch.Staged() == 0);
  assert(scratch.Available() == 1000);
}

void TestRealRunUsesTheSmallerFigure() {
  const auto          dir = FreshDir("real");
  FixedSpaceProbe     probe(1000);
  ScratchSpaceManager scratch(dir, probe, false);
  scratch.PrepareStaging();
  scratch.EnsureCapacity(100);

  scratch.Reserve(100);
  assert(scratch.Available() == 900);
  // another writer consumed space
  probe.Set(400);
  assert(scratch.Available() == 400);
}

void TestInsufficientCapacity() {
  const auto          dir = FreshDir("small");
  FixedSpaceProbe     probe(10);
  ScratchSpaceManager scratch(dir, probe, true);

  bool threw = false;
  try {
    scratch.EnsureCapacity(11);
  } catch (const optiraid::util::InsufficientSpace& e) {
    threw = e.have() == 10 && e.need() == 11;
  }
  assert(threw);
}

} // namespace

int main() {
  TestPrepareCreatesAndRejectsNonEmpty();
  TestDryRunNeverCreatesDirectory();
  TestExclusiveLockRefusesSecondRun();
  TestLedgerArithmetic();
  TestRealRunUsesTheSmallerFigure();
  TestInsufficientCapacity();

  std::cout << "optiraid_unit_scratch_space_manager: pass\n";
  return 0;
}
