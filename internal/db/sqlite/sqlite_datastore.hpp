#pragma once

#include <memory>

#include "internal/db/api/datastore.hpp"
#include "sqlite_db.hpp"

namespace taskgate::db::sqlite {

class SqliteDatastore final : public db::Datastore {
 public:
  explicit SqliteDatastore(std::shared_ptr<SqliteDB> db);

  Result Execute(std::string_view query, const sql::Params& params, ResultSet& out) override;

  std::unique_ptr<Transaction> Begin() override;

  Result Execute(Transaction& tx, std::string_view query, const sql::Params& params, ResultSet& out) override;

  void ExecScript(const std::string& sql) override;

  static Result Translate(sqlite3* db, int rc);

 private:
  std::shared_ptr<SqliteDB> db_;
};

} // namespace taskgate::db::sqlite
