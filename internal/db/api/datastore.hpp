#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/sql/sql_params.hpp"

namespace taskgate::db {

struct ResultSet {
  std::vector<std::string>             columns;
  std::vector<std::vector<sql::Value>> rows;
  std::uint64_t                        affected_rows = 0;
};

/*
  Datastore driver contract: execute(query, params) -> rows.

  Execute never throws for backend failures; it reports a portable Result.
  The transactional overload runs the statement inside a transaction
  obtained from Begin() on the same datastore.
*/
class Datastore {
 public:
  virtual ~Datastore() = default;

  virtual Result Execute(std::string_view query, const sql::Params& params, ResultSet& out) = 0;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual Result Execute(Transaction& tx, std::string_view query, const sql::Params& params, ResultSet& out) = 0;

  // Statements that create schema. Throws on failure.
  virtual void ExecScript(const std::string& sql) = 0;
};

} // namespace taskgate::db
