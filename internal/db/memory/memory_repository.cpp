#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace optiraid::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Runs
// ------------------------------------------------------------------

Result MemoryRepository::UpsertRun(Transaction& t, const model::RunRecord& r) {
  if (r.run_id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "run id must not be empty");
  TX(t).Mutable().runs[r.run_id] = r;
  return Result::Ok();
}

std::optional<model::RunRecord> MemoryRepository::GetRun(Transaction& t, const std::string& run_id) {
  const auto& s  = TX(t).View();
  auto        it = s.runs.find(run_id);
  if (it == s.runs.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeleteRun(Transaction& t, const std::string& run_id) {
  auto& s = TX(t).Mutable();
  s.runs.erase(run_id);
  std::erase_if(s.sets, [&](const auto& entry) { return entry.first.first == run_id; });
  std::erase_if(s.bundles, [&](const auto& entry) { return entry.first.first == run_id; });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Sets
// ------------------------------------------------------------------

Result MemoryRepository::UpsertSet(Transaction& t, const model::SetRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.runs.contains(r.run_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown run " + r.run_id);
  s.sets[{r.run_id, r.set_index}] = r;
  return Result::Ok();
}

std::optional<model::SetRecord> MemoryRepository::GetSet(Transaction& t, const std::string& run_id, std::uint64_t set_index) {
  const auto& s  = TX(t).View();
  auto        it = s.sets.find({run_id, set_index});
  if (it == s.sets.end()) return std::nullopt;
  return it->second;
}

std::vector<model::SetRecord> MemoryRepository::ListSets(Transaction& t, const std::string& run_id) {
  std::vector<model::SetRecord> out;
  for (const auto& [key, record] : TX(t).View().sets) {
    if (key.first == run_id) out.push_back(record);
  }
  return out;
}

// ------------------------------------------------------------------
// Bundles
// ------------------------------------------------------------------

Result MemoryRepository::UpsertBundle(Transaction& t, const model::BundleRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.runs.contains(r.run_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown run " + r.run_id);
  s.bundles[{r.run_id, r.disc_index}] = r;
  return Result::Ok();
}

std::vector<model::BundleRecord> MemoryRepository::ListBundles(Transaction& t, const std::string& run_id) {
  std::vector<model::BundleRecord> out;
  for (const auto& [key, record] : TX(t).View().bundles) {
    if (key.first == run_id) out.push_back(record);
  }
  return out;
}

} // namespace optiraid::db::memory
