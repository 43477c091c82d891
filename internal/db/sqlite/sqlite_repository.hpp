#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace optiraid::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                          UpsertRun(Transaction&, const model::RunRecord&) override;
  std::optional<model::RunRecord> GetRun(Transaction&, const std::string&) override;
  Result                          DeleteRun(Transaction&, const std::string&) override;

  Result                          UpsertSet(Transaction&, const model::SetRecord&) override;
  std::optional<model::SetRecord> GetSet(Transaction&, const std::string&, std::uint64_t) override;
  std::vector<model::SetRecord>   ListSets(Transaction&, const std::string&) override;

  Result                           UpsertBundle(Transaction&, const model::BundleRecord&) override;
  std::vector<model::BundleRecord> ListBundles(Transaction&, const std::string&) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace optiraid::db::sqlite
