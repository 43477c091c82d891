#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace optiraid::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), writer_(repo.writer_, std::try_to_lock) {
  if (!writer_.owns_lock()) {
    throw util::InvalidState("memory ledger already has an open transaction");
  }
  working_ = repo_.committed_;
}

void MemoryTransaction::Commit() {
  if (!writer_.owns_lock()) {
    throw util::InvalidState("commit of a finished ledger transaction");
  }
  repo_.committed_ = std::move(working_);
  committed_       = true;
  writer_.unlock();
}

void MemoryTransaction::Rollback() {
  if (writer_.owns_lock()) writer_.unlock();
}

} // namespace optiraid::db::memory
