#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/bundle_record.hpp"
#include "internal/db/model/run_record.hpp"
#include "internal/db/model/set_record.hpp"

namespace optiraid::db {

/*
  Run ledger.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Set and bundle rows belong to exactly one run

  The ledger is the source of truth for:
    set lifecycle states
    which discs were staged, burned and verified
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Runs
  // ---------------------------------------------------------------------

  virtual Result UpsertRun(Transaction&, const model::RunRecord&) = 0;

  virtual std::optional<model::RunRecord> GetRun(Transaction&, const std::string& run_id) = 0;

  // Removes the run and all of its sets and bundles.
  virtual Result DeleteRun(Transaction&, const std::string& run_id) = 0;

  // ---------------------------------------------------------------------
  // Redundancy sets
  // ---------------------------------------------------------------------

  virtual Result UpsertSet(Transaction&, const model::SetRecord&) = 0;

  virtual std::optional<model::SetRecord> GetSet(Transaction&, const std::string& run_id, std::uint64_t set_index) = 0;

  // Ordered by set index.
  virtual std::vector<model::SetRecord> ListSets(Transaction&, const std::string& run_id) = 0;

  // ---------------------------------------------------------------------
  // Disc bundles
  // ---------------------------------------------------------------------

  virtual Result UpsertBundle(Transaction&, const model::BundleRecord&) = 0;

  // Ordered by disc index.
  virtual std::vector<model::BundleRecord> ListBundles(Transaction&, const std::string& run_id) = 0;
};

} // namespace optiraid::db
