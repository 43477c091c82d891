#include "sqlite_db.hpp"

#include <stdexcept>
#include <vector>

namespace optiraid::db::sqlite {

namespace {

constexpr int kSchemaVersion = 1;

const std::vector<std::string> kSchema = {
    "CREATE TABLE IF NOT EXISTS run (run_id TEXT PRIMARY KEY, basename TEXT NOT NULL, state INTEGER NOT NULL, last_sequence INTEGER NOT NULL, discs_emitted INTEGER NOT NULL, groups_emitted INTEGER NOT NULL, invocation TEXT NOT NULL);",
    "CREATE TABLE IF NOT EXISTS redundancy_set (run_id TEXT NOT NULL REFERENCES run(run_id) ON DELETE CASCADE, set_index INTEGER NOT NULL, state INTEGER NOT NULL, members TEXT NOT NULL, last_error TEXT NOT NULL, PRIMARY KEY (run_id, set_index));",
    "CREATE TABLE IF NOT EXISTS disc_bundle (run_id TEXT NOT NULL REFERENCES run(run_id) ON DELETE CASCADE, disc_index INTEGER NOT NULL, group_index INTEGER NOT NULL, position INTEGER NOT NULL, title TEXT NOT NULL, pure_parity INTEGER NOT NULL, total_bytes INTEGER NOT NULL, state INTEGER NOT NULL, files TEXT NOT NULL, owned_files TEXT NOT NULL, PRIMARY KEY (run_id, disc_index));"};

void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(path_ + ": " + msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

void SqliteDB::EnsureSchema() {
  Statement version(db_, "PRAGMA user_version;");
  if (!version.ok() || version.Step() != SQLITE_ROW) {
    throw std::runtime_error(std::string("cannot read ledger schema version: ") + sqlite3_errmsg(db_));
  }
  const int current = version.ColI32(0);
  if (current > kSchemaVersion) {
    throw std::runtime_error("ledger " + path_ + " was written by a newer release (schema " + std::to_string(current) + ")");
  }

  Exec("BEGIN IMMEDIATE;");
  try {
    for (const auto& sql : kSchema) Exec(sql);
    Exec("PRAGMA user_version=" + std::to_string(kSchemaVersion) + ";");
    Exec("COMMIT;");
  } catch (const std::exception&) {
    sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    throw;
  }
}

void SqliteDB::Configure() {
  // IMPORTANT: WAL enables concurrent readers while writer holds lock
  Exec("PRAGMA journal_mode=WAL;");

  // the ledger must survive a crash between two discs
  Exec("PRAGMA synchronous=FULL;");

  // foreign keys are OFF by default in sqlite
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");
}

// ------------------------------------------------------------------
// Statement
// ------------------------------------------------------------------

Statement::Statement(sqlite3* db, const char* sql) {
  if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

Statement::~Statement() {
  if (stmt_) sqlite3_finalize(stmt_);
}

void Statement::BindText(int idx, const std::string& s) {
  sqlite3_bind_text(stmt_, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void Statement::BindU64(int idx, std::uint64_t v) {
  sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(v));
}

void Statement::BindI32(int idx, int v) {
  sqlite3_bind_int(stmt_, idx, v);
}

int Statement::Step() {
  return sqlite3_step(stmt_);
}

std::string Statement::ColText(int col) const {
  const unsigned char* t = sqlite3_column_text(stmt_, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::uint64_t Statement::ColU64(int col) const {
  return static_cast<std::uint64_t>(sqlite3_column_int64(stmt_, col));
}

int Statement::ColI32(int col) const {
  return sqlite3_column_int(stmt_, col);
}

} // namespace optiraid::db::sqlite
