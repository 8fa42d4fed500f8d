#pragma once

#include <cstdint>
#include <string>

#include "internal/db/sql/sql_params.hpp"
#include "internal/router/request.hpp"
#include "internal/router/route_table.hpp"

namespace taskgate::router {

struct Statement {
  std::string     sql;
  db::sql::Params params;
};

inline constexpr std::uint32_t kDefaultPageSize = 50;
inline constexpr std::uint32_t kMaxPageSize     = 1000;

/*
  Parameterized statements for the direct datastore pattern.

  Values are always bound. Table and column names cannot be bound, so they
  are checked against [A-Za-z_][A-Za-z0-9_]* and quoted; anything else throws
  util::InvalidArgument.
*/
Statement SelectByKey(const DatastoreRoute& route, const Key& key);
Statement SelectPage(const DatastoreRoute& route, const Page& page);
Statement Insert(const DatastoreRoute& route, const Record& record);
Statement DeleteByKey(const DatastoreRoute& route, const Key& key);

} // namespace taskgate::router
