#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace taskgate::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every caller; Mutex() serializes statement
  sequences (prepare, bind, step, finalize) and whole transactions.
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

  std::recursive_mutex& Mutex() {
    return mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

 private:
  sqlite3*             db_ = nullptr;
  std::string          path_;
  std::recursive_mutex mutex_;
};

} // namespace taskgate::db::sqlite
