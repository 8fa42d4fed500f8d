#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "internal/db/api/datastore.hpp"
#include "pg_pool.hpp"

namespace taskgate::db::postgres {

class PgDatastore final : public db::Datastore {
 public:
  explicit PgDatastore(std::shared_ptr<PgPool> pool);

  Result Execute(std::string_view query, const sql::Params& params, ResultSet& out) override;

  std::unique_ptr<Transaction> Begin() override;

  Result Execute(Transaction& tx, std::string_view query, const sql::Params& params, ResultSet& out) override;

  void ExecScript(const std::string& sql) override;

  // `?` placeholders outside quoted literals become $1, $2, ...
  static std::string RewritePlaceholders(std::string_view query);

 private:
  static Result Run(pqxx::transaction_base& tx, std::string_view query, const sql::Params& params, ResultSet& out);
  static Result Translate(const std::exception& e);

  std::shared_ptr<PgPool> pool_;
};

} // namespace taskgate::db::postgres
