#include "internal/router/datastore_statements.hpp"

#include <algorithm>
#include <set>

#include "internal/util/errors.hpp"

namespace taskgate::router {

namespace {

std::string Quote(std::string_view name) {
  if (!IsIdentifier(name)) {
    throw util::InvalidArgument("invalid identifier '" + std::string(name) + "'");
  }
  return "\"" + std::string(name) + "\"";
}

void RequireKey(const Key& key) {
  if (std::holds_alternative<std::nullptr_t>(key.value)) {
    throw util::InvalidArgument("key must not be null");
  }
}

} // namespace

Statement SelectByKey(const DatastoreRoute& route, const Key& key) {
  RequireKey(key);
  return {"SELECT * FROM " + Quote(route.table) + " WHERE " + Quote(route.key_column) + " = ?", {key.value}};
}

Statement SelectPage(const DatastoreRoute& route, const Page& page) {
  const auto limit = page.limit == 0 ? kDefaultPageSize : std::min(page.limit, kMaxPageSize);
  return {"SELECT * FROM " + Quote(route.table) + " ORDER BY " + Quote(route.key_column) + " LIMIT ? OFFSET ?",
          {static_cast<int64_t>(limit), static_cast<int64_t>(page.offset)}};
}

Statement Insert(const DatastoreRoute& route, const Record& record) {
  if (record.empty()) {
    throw util::InvalidArgument("record has no columns");
  }

  std::set<std::string_view> seen;
  std::string                columns;
  std::string                placeholders;
  db::sql::Params            params;
  params.reserve(record.size());

  for (const auto& [name, value] : record) {
    if (!seen.insert(name).second) {
      throw util::InvalidArgument("duplicate column '" + name + "'");
    }
    if (!columns.empty()) {
      columns += ", ";
      placeholders += ", ";
    }
    columns += Quote(name);
    placeholders += "?";
    params.push_back(value);
  }

  return {"INSERT INTO " + Quote(route.table) + " (" + columns + ") VALUES (" + placeholders + ")", std::move(params)};
}

Statement DeleteByKey(const DatastoreRoute& route, const Key& key) {
  RequireKey(key);
  return {"DELETE FROM " + Quote(route.table) + " WHERE " + Quote(route.key_column) + " = ?", {key.value}};
}

} // namespace taskgate::router
