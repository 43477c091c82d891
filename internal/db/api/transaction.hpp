#pragma once

namespace optiraid::db {

/*
  Ledger transaction.

  A ledger has at most one open transaction at a time, the way a single
  SQLite connection does. Writes become visible to the next Begin() only
  after Commit(); a transaction destroyed without Commit() rolls back.

  A set's state change and the bundles that carry it are written in one
  transaction, so a crash never leaves a set SEQUENCED without its discs.
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace optiraid::db
