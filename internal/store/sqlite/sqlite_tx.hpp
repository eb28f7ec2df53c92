#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace workbundle::store::sqlite {

/*
  SQLite transaction guard.

  Uses BEGIN IMMEDIATE so the write lock is taken before the version check
  that guards conditional updates. Rolls back on destruction unless
  committed.
*/
class SqliteTransaction final {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit();
  void Rollback();
  bool IsCommitted() const {
    return committed_;
  }

 private:
  std::shared_ptr<SqliteDB> db_;
  bool                      committed_ = false;
  bool                      finished_  = false;
};

} // namespace workbundle::store::sqlite
