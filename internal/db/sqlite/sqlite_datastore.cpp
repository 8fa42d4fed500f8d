#include "sqlite_datastore.hpp"

#include <type_traits>

#include "sqlite_tx.hpp"

namespace taskgate::db::sqlite {

namespace {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

int Bind(sqlite3_stmt* st, int idx, const sql::Param& param) {
  return std::visit(
      [&](const auto& v) -> int {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          return sqlite3_bind_null(st, idx);
        } else if constexpr (std::is_same_v<T, int64_t>) {
          return sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
        } else if constexpr (std::is_same_v<T, double>) {
          return sqlite3_bind_double(st, idx, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
          return sqlite3_bind_text(st, idx, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        } else {
          return sqlite3_bind_blob(st, idx, v.bytes.data(), static_cast<int>(v.bytes.size()), SQLITE_TRANSIENT);
        }
      },
      param);
}

sql::Value Column(sqlite3_stmt* st, int col) {
  switch (sqlite3_column_type(st, col)) {
    case SQLITE_INTEGER:
      return static_cast<int64_t>(sqlite3_column_int64(st, col));
    case SQLITE_FLOAT:
      return sqlite3_column_double(st, col);
    case SQLITE_TEXT: {
      const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(st, col));
      return std::string(text ? text : "", static_cast<std::size_t>(sqlite3_column_bytes(st, col)));
    }
    case SQLITE_BLOB: {
      const auto* data = static_cast<const char*>(sqlite3_column_blob(st, col));
      return sql::Blob{std::string(data ? data : "", static_cast<std::size_t>(sqlite3_column_bytes(st, col)))};
    }
    default:
      return nullptr;
  }
}

} // namespace

SqliteDatastore::SqliteDatastore(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

Result SqliteDatastore::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE)
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_CANTOPEN:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    case SQLITE_ERROR:
    case SQLITE_RANGE:
    case SQLITE_MISMATCH:
      return Result::Err(ErrorCode::InvalidQuery, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

Result SqliteDatastore::Execute(std::string_view query, const sql::Params& params, ResultSet& out) {
  std::lock_guard lock(db_->Mutex());
  auto*           db = db_->Handle();

  sqlite3_stmt* raw = nullptr;
  int rc = sqlite3_prepare_v2(db, query.data(), static_cast<int>(query.size()), &raw, nullptr);
  Statement st(raw);
  if (rc != SQLITE_OK) return Translate(db, sqlite3_extended_errcode(db));
  if (!st) return Result::Err(ErrorCode::InvalidQuery, "empty statement");

  if (static_cast<std::size_t>(sqlite3_bind_parameter_count(st.get())) != params.size()) {
    return Result::Err(ErrorCode::InvalidQuery, "parameter count mismatch");
  }
  for (std::size_t i = 0; i < params.size(); ++i) {
    rc = Bind(st.get(), static_cast<int>(i + 1), params[i]);
    if (rc != SQLITE_OK) return Translate(db, rc);
  }

  out = ResultSet{};
  const int columns = sqlite3_column_count(st.get());
  out.columns.reserve(columns);
  for (int c = 0; c < columns; ++c) {
    out.columns.emplace_back(sqlite3_column_name(st.get(), c));
  }

  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    std::vector<sql::Value> row;
    row.reserve(columns);
    for (int c = 0; c < columns; ++c) {
      row.push_back(Column(st.get(), c));
    }
    out.rows.push_back(std::move(row));
  }
  if (rc != SQLITE_DONE) return Translate(db, sqlite3_extended_errcode(db));

  out.affected_rows = columns == 0 ? static_cast<std::uint64_t>(sqlite3_changes(db)) : out.rows.size();
  return Result::Ok();
}

std::unique_ptr<Transaction> SqliteDatastore::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

Result SqliteDatastore::Execute(Transaction& tx, std::string_view query, const sql::Params& params, ResultSet& out) {
  auto* sqlite_tx = dynamic_cast<SqliteTransaction*>(&tx);
  if (!sqlite_tx || sqlite_tx->Owner() != db_.get()) {
    return Result::Err(ErrorCode::Unsupported, "transaction does not belong to this datastore");
  }
  // the transaction already holds the (recursive) connection lock
  return Execute(query, params, out);
}

void SqliteDatastore::ExecScript(const std::string& sql) {
  db_->Exec(sql);
}

} // namespace taskgate::db::sqlite
