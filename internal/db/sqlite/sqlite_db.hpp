#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

namespace optiraid::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Creates the ledger tables when missing and checks the schema version.
  void EnsureSchema();

 private:
  // Configure PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
};

/*
  Prepared statement; finalized on destruction.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool ok() const {
    return stmt_ != nullptr;
  }

  void BindText(int idx, const std::string& s);
  void BindU64(int idx, std::uint64_t v);
  void BindI32(int idx, int v);

  int Step();

  std::string   ColText(int col) const;
  std::uint64_t ColU64(int col) const;
  int           ColI32(int col) const;

 private:
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace optiraid::db::sqlite
