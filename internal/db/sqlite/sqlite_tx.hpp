#pragma once

#include "sqlite_db.hpp"

namespace claims::db::sqlite {

/*
  BEGIN IMMEDIATE scope for one claim store call.

  The reserved lock is taken up front, so the version read and the guarded
  UPDATE of a compare-and-set cannot interleave with another writer, even
  one in a different process. Rolled back on destruction unless committed.
*/
class SqliteTransaction {
 public:
  explicit SqliteTransaction(SqliteDB& db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  void Commit();

 private:
  SqliteDB& db_;
  bool      open_ = false;
};

} // namespace claims::db::sqlite
