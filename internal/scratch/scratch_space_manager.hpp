#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>

#include "internal/scratch/space_probe.hpp"

namespace optiraid::scratch {

/*
  Owns the staging directory and the ledger of bytes staged in it.

  A dry run never touches the filesystem: no directory, no lock, and the
  available figure is pure ledger arithmetic from the first probe.
*/
class ScratchSpaceManager {
 public:
  ScratchSpaceManager(std::filesystem::path staging_dir, FreeSpaceProbe& probe, bool dry_run);
  ~ScratchSpaceManager();

  ScratchSpaceManager(const ScratchSpaceManager&)            = delete;
  ScratchSpaceManager& operator=(const ScratchSpaceManager&) = delete;

  // Creates the staging directory; throws util::StagingConflict when it
  // exists and is not an empty directory.
  void PrepareStaging();

  // Attaches to an existing staging directory (resume, retry-parity).
  void AttachStaging();

  // Non-blocking exclusive lock on <staging>.lock held until destruction.
  void AcquireExclusive();

  // Throws util::InsufficientSpace when fewer than required bytes are free.
  void EnsureCapacity(std::uint64_t required_bytes);

  void Reserve(std::uint64_t bytes);
  void Release(std::uint64_t bytes);

  std::uint64_t Available();
  std::uint64_t Staged() const;

  bool CanOpenSet(std::uint64_t worst_case_bytes);

  const std::filesystem::path& StagingDir() const {
    return staging_dir_;
  }

  std::filesystem::path LockPath() const;

 private:
  std::filesystem::path staging_dir_;
  FreeSpaceProbe&       probe_;
  bool                  dry_run_;

  mutable std::mutex mutex_;
  std::uint64_t      baseline_free_ = 0;
  bool               has_baseline_  = false;
  std::uint64_t      staged_        = 0;
  int                lock_fd_       = -1;
};

} // namespace optiraid::scratch
