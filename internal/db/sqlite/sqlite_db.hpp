#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

namespace claims::db::sqlite {

// Carries the sqlite extended result code of the failed call.
class SqliteError : public std::runtime_error {
 public:
  SqliteError(int code, const std::string& message) : std::runtime_error(message), code_(code) {
  }

  int Code() const {
    return code_;
  }

  // SQLITE_BUSY / SQLITE_LOCKED: another connection holds the lock past the busy timeout.
  bool IsBusy() const {
    const int primary = code_ & 0xff;
    return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
  }

  bool IsConstraint() const {
    return (code_ & 0xff) == SQLITE_CONSTRAINT;
  }

 private:
  int code_;
};

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure(bool wal_mode);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

/*
  Prepared statement, finalized on destruction.
  Bind indexes are 1-based, column indexes 0-based (sqlite convention).
*/
class SqliteStatement {
 public:
  SqliteStatement(sqlite3* db, const char* sql);
  ~SqliteStatement();

  SqliteStatement(const SqliteStatement&)            = delete;
  SqliteStatement& operator=(const SqliteStatement&) = delete;

  void BindText(int idx, const std::string& value);
  void BindU64(int idx, uint64_t value);
  void BindI64(int idx, int64_t value);
  void BindNull(int idx);

  // true while a row is available
  bool Step();
  // Runs a statement that returns no rows.
  void Run();

  std::string ColText(int col) const;
  uint64_t    ColU64(int col) const;
  bool        ColIsNull(int col) const;

 private:
  sqlite3*      db_;
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace claims::db::sqlite
