#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace taskgate::db::sqlite {

/*
  SQLite transaction wrapper.

  Holds the connection lock for its whole lifetime and uses BEGIN IMMEDIATE
  so the write lock is taken up front.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  const SqliteDB* Owner() const { return db_.get(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB> db_;
  std::unique_lock<std::recursive_mutex> lock_;
  bool committed_ = false;
  bool finished_  = false;
};

}
