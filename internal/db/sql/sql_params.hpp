#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace taskgate::db::sql {

/*
  Parameter abstraction.

  Queries are written with SQLite style `?` placeholders.
  Postgres drivers rewrite them to $1 $2 $3 before execution.

  Both use ordered binding, so the same Params work for either.
*/

struct Blob {
  std::string bytes;

  bool operator==(const Blob&) const = default;
};

using Param = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    Blob
>;

using Params = std::vector<Param>;

// Column values read back use the same shape as parameters.
using Value = Param;

}
