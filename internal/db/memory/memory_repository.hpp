#pragma once

#include <map>
#include <mutex>
#include <string>
#include <utility>

#include "internal/db/api/repository.hpp"

namespace optiraid::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                           UpsertRun(Transaction&, const model::RunRecord&) override;
  std::optional<model::RunRecord>  GetRun(Transaction&, const std::string&) override;
  Result                           DeleteRun(Transaction&, const std::string&) override;

  Result                          UpsertSet(Transaction&, const model::SetRecord&) override;
  std::optional<model::SetRecord> GetSet(Transaction&, const std::string&, std::uint64_t) override;
  std::vector<model::SetRecord>   ListSets(Transaction&, const std::string&) override;

  Result                           UpsertBundle(Transaction&, const model::BundleRecord&) override;
  std::vector<model::BundleRecord> ListBundles(Transaction&, const std::string&) override;

 private:
  friend class MemoryTransaction;

  using Key = std::pair<std::string, std::uint64_t>;

  // ordered maps give the per-run ordering ListSets/ListBundles promise
  struct State {
    std::map<std::string, model::RunRecord> runs;
    std::map<Key, model::SetRecord>         sets;
    std::map<Key, model::BundleRecord>      bundles;
  };

  // one open transaction at a time, released at commit or rollback
  std::mutex writer_;
  State      committed_;
};

} // namespace optiraid::db::memory
