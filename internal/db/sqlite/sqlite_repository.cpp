#include "sqlite_repository.hpp"

#include <charconv>
#include <sstream>

namespace optiraid::db::sqlite {

using optiraid::db::ErrorCode;
using optiraid::db::Result;

namespace v1 = ::optiraid::core::v1;

namespace {

// Lists are stored as newline separated text; names never contain newlines.
std::string JoinLines(const std::vector<std::string>& items) {
  std::string out;
  for (const auto& item : items) {
    out += item;
    out += '\n';
  }
  return out;
}

std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> out;
  std::istringstream       in(text);
  std::string              line;
  while (std::getline(in, line)) {
    if (!line.empty()) out.push_back(line);
  }
  return out;
}

std::string EncodeMembers(const std::vector<model::SetMemberRecord>& members) {
  std::vector<std::string> lines;
  for (const auto& m : members) {
    lines.push_back(std::to_string(m.sequence) + '\t' + std::to_string(m.size_bytes) + '\t' + m.name);
  }
  return JoinLines(lines);
}

std::vector<model::SetMemberRecord> DecodeMembers(const std::string& text) {
  std::vector<model::SetMemberRecord> members;
  for (const auto& line : SplitLines(text)) {
    const auto first  = line.find('\t');
    const auto second = first == std::string::npos ? std::string::npos : line.find('\t', first + 1);
    if (second == std::string::npos) continue;

    model::SetMemberRecord m;
    std::from_chars(line.data(), line.data() + first, m.sequence);
    std::from_chars(line.data() + first + 1, line.data() + second, m.size_bytes);
    m.name = line.substr(second + 1);
    members.push_back(std::move(m));
  }
  return members;
}

model::SetRecord ReadSet(const Statement& st) {
  model::SetRecord r;
  r.run_id     = st.ColText(0);
  r.set_index  = st.ColU64(1);
  r.state      = static_cast<v1::SetState>(st.ColI32(2));
  r.members    = DecodeMembers(st.ColText(3));
  r.last_error = st.ColText(4);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Runs
// ------------------------------------------------------------------

Result SqliteRepository::UpsertRun(Transaction& t, const model::RunRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO run(run_id,basename,state,last_sequence,discs_emitted,groups_emitted,invocation) VALUES(?,?,?,?,?,?,?) "
               "ON CONFLICT(run_id) DO UPDATE SET basename=excluded.basename,state=excluded.state,last_sequence=excluded.last_sequence,"
               "discs_emitted=excluded.discs_emitted,groups_emitted=excluded.groups_emitted,invocation=excluded.invocation;");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  st.BindText(1, r.run_id);
  st.BindText(2, r.basename);
  st.BindI32(3, static_cast<int>(r.state));
  st.BindU64(4, r.last_sequence);
  st.BindU64(5, r.discs_emitted);
  st.BindU64(6, r.groups_emitted);
  st.BindText(7, r.invocation);

  return Translate(db, st.Step());
}

std::optional<model::RunRecord> SqliteRepository::GetRun(Transaction& t, const std::string& run_id) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT run_id,basename,state,last_sequence,discs_emitted,groups_emitted,invocation FROM run WHERE run_id=?;");
  if (!st.ok()) return std::nullopt;

  st.BindText(1, run_id);
  if (st.Step() != SQLITE_ROW) return std::nullopt;

  model::RunRecord r;
  r.run_id         = st.ColText(0);
  r.basename       = st.ColText(1);
  r.state          = static_cast<v1::RunState>(st.ColI32(2));
  r.last_sequence  = st.ColU64(3);
  r.discs_emitted  = st.ColU64(4);
  r.groups_emitted = st.ColU64(5);
  r.invocation     = st.ColText(6);
  return r;
}

Result SqliteRepository::DeleteRun(Transaction& t, const std::string& run_id) {
  auto* db = TX(t).Handle();

  // ON DELETE CASCADE removes sets and bundles
  Statement st(db, "DELETE FROM run WHERE run_id=?;");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  st.BindText(1, run_id);
  return Translate(db, st.Step());
}

// ------------------------------------------------------------------
// Sets
// ------------------------------------------------------------------

Result SqliteRepository::UpsertSet(Transaction& t, const model::SetRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO redundancy_set(run_id,set_index,state,members,last_error) VALUES(?,?,?,?,?) "
               "ON CONFLICT(run_id,set_index) DO UPDATE SET state=excluded.state,members=excluded.members,last_error=excluded.last_error;");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  st.BindText(1, r.run_id);
  st.BindU64(2, r.set_index);
  st.BindI32(3, static_cast<int>(r.state));
  st.BindText(4, EncodeMembers(r.members));
  st.BindText(5, r.last_error);

  return Translate(db, st.Step());
}

std::optional<model::SetRecord> SqliteRepository::GetSet(Transaction& t, const std::string& run_id, std::uint64_t set_index) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT run_id,set_index,state,members,last_error FROM redundancy_set WHERE run_id=? AND set_index=?;");
  if (!st.ok()) return std::nullopt;

  st.BindText(1, run_id);
  st.BindU64(2, set_index);
  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadSet(st);
}

std::vector<model::SetRecord> SqliteRepository::ListSets(Transaction& t, const std::string& run_id) {
  auto* db = TX(t).Handle();

  std::vector<model::SetRecord> out;
  Statement st(db, "SELECT run_id,set_index,state,members,last_error FROM redundancy_set WHERE run_id=? ORDER BY set_index;");
  if (!st.ok()) return out;

  st.BindText(1, run_id);
  while (st.Step() == SQLITE_ROW) {
    out.push_back(ReadSet(st));
  }
  return out;
}

// ------------------------------------------------------------------
// Bundles
// ------------------------------------------------------------------

Result SqliteRepository::UpsertBundle(Transaction& t, const model::BundleRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO disc_bundle(run_id,disc_index,group_index,position,title,pure_parity,total_bytes,state,files,owned_files) "
               "VALUES(?,?,?,?,?,?,?,?,?,?) ON CONFLICT(run_id,disc_index) DO UPDATE SET group_index=excluded.group_index,"
               "position=excluded.position,title=excluded.title,pure_parity=excluded.pure_parity,total_bytes=excluded.total_bytes,"
               "state=excluded.state,files=excluded.files,owned_files=excluded.owned_files;");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  st.BindText(1, r.run_id);
  st.BindU64(2, r.disc_index);
  st.BindU64(3, r.group_index);
  st.BindI32(4, static_cast<int>(r.position));
  st.BindText(5, r.title);
  st.BindI32(6, r.pure_parity ? 1 : 0);
  st.BindU64(7, r.total_bytes);
  st.BindI32(8, static_cast<int>(r.state));
  st.BindText(9, JoinLines(r.files));
  st.BindText(10, JoinLines(r.owned_files));

  return Translate(db, st.Step());
}

std::vector<model::BundleRecord> SqliteRepository::ListBundles(Transaction& t, const std::string& run_id) {
  auto* db = TX(t).Handle();

  std::vector<model::BundleRecord> out;
  Statement st(db,
               "SELECT run_id,disc_index,group_index,position,title,pure_parity,total_bytes,state,files,owned_files "
               "FROM disc_bundle WHERE run_id=? ORDER BY disc_index;");
  if (!st.ok()) return out;

  st.BindText(1, run_id);
  while (st.Step() == SQLITE_ROW) {
    model::BundleRecord r;
    r.run_id      = st.ColText(0);
    r.disc_index  = st.ColU64(1);
    r.group_index = st.ColU64(2);
    r.position    = static_cast<std::uint32_t>(st.ColI32(3));
    r.title       = st.ColText(4);
    r.pure_parity = st.ColI32(5) != 0;
    r.total_bytes = st.ColU64(6);
    r.state       = static_cast<v1::BundleState>(st.ColI32(7));
    r.files       = SplitLines(st.ColText(8));
    r.owned_files = SplitLines(st.ColText(9));
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace optiraid::db::sqlite
