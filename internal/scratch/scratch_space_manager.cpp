#include "scratch_space_manager.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace optiraid::scratch {

using util::StagingConflict;

ScratchSpaceManager::ScratchSpaceManager(std::filesystem::path staging_dir, FreeSpaceProbe& probe, bool dry_run)
    : staging_dir_(std::move(staging_dir)), probe_(probe), dry_run_(dry_run) {
}

ScratchSpaceManager::~ScratchSpaceManager() {
  if (lock_fd_ >= 0) {
    ::flock(lock_fd_, LOCK_UN);
    ::close(lock_fd_);
    std::error_code ec;
    std::filesystem::remove(LockPath(), ec);
  }
}

std::filesystem::path ScratchSpaceManager::LockPath() const {
  auto normalized = staging_dir_.lexically_normal();
  if (!normalized.has_filename()) normalized = normalized.parent_path();
  return normalized.string() + ".lock";
}

void ScratchSpaceManager::PrepareStaging() {
  std::error_code ec;
  const auto      status = std::filesystem::status(staging_dir_, ec);

  if (std::filesystem::exists(status)) {
    if (!std::filesystem::is_directory(status)) {
      throw StagingConflict("staging path " + staging_dir_.string() + " exists and is not a directory");
    }
    if (!std::filesystem::is_empty(staging_dir_)) {
      throw StagingConflict("staging directory " + staging_dir_.string() + " is not empty");
    }
    return;
  }

  if (dry_run_) {
    OPTIRAID_LOG_INFO("dry run: would create staging directory", {observability::StringField("path", staging_dir_.string())});
    return;
  }

  std::filesystem::create_directories(staging_dir_);
}

void ScratchSpaceManager::AttachStaging() {
  if (!std::filesystem::is_directory(staging_dir_)) {
    throw StagingConflict("staging directory " + staging_dir_.string() + " does not exist");
  }
}

void ScratchSpaceManager::AcquireExclusive() {
  if (dry_run_ || lock_fd_ >= 0) {
    return;
  }

  const auto path = LockPath();
  const int  fd   = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
  if (fd < 0) {
    throw StagingConflict("cannot open lock file " + path.string() + ": " + std::strerror(errno));
  }
  if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
    const int err = errno;
    ::close(fd);
    if (err == EWOULDBLOCK) {
      throw StagingConflict("staging directory " + staging_dir_.string() + " is in use by another run");
    }
    throw StagingConflict("cannot lock " + path.string() + ": " + std::strerror(err));
  }
  lock_fd_ = fd;
}

void ScratchSpaceManager::EnsureCapacity(std::uint64_t required_bytes) {
  const auto have = probe_.FreeBytes(staging_dir_);
  {
    std::scoped_lock lock(mutex_);
    if (!has_baseline_) {
      baseline_free_ = have;
      has_baseline_  = true;
    }
  }

  if (have < required_bytes) {
    throw util::InsufficientSpace(staging_dir_.string(), have, required_bytes);
  }
  OPTIRAID_LOG_INFO("scratch capacity ok", {observability::IntField("free_bytes", static_cast<std::int64_t>(have)),
                                           observability::IntField("required_bytes", static_cast<std::int64_t>(required_bytes))});
}

void ScratchSpaceManager::Reserve(std::uint64_t bytes) {
  std::scoped_lock lock(mutex_);
  staged_ += bytes;
}

void ScratchSpaceManager::Release(std::uint64_t bytes) {
  std::scoped_lock lock(mutex_);
  staged_ -= std::min(bytes, staged_);
}

std::uint64_t ScratchSpaceManager::Available() {
  std::uint64_t ledger = 0;
  {
    std::scoped_lock lock(mutex_);
    if (!has_baseline_) {
      baseline_free_ = probe_.FreeBytes(staging_dir_);
      has_baseline_  = true;
    }
    ledger = baseline_free_ > staged_ ? baseline_free_ - staged_ : 0;
  }

  if (dry_run_) {
    return ledger;
  }
  return std::min(ledger, probe_.FreeBytes(staging_dir_));
}

std::uint64_t ScratchSpaceManager::Staged() const {
  std::scoped_lock lock(mutex_);
  return staged_;
}

bool ScratchSpaceManager::CanOpenSet(std::uint64_t worst_case_bytes) {
  return Available() >= worst_case_bytes;
}

} // namespace optiraid::scratch
