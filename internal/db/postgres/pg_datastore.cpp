#include "pg_datastore.hpp"

#include <cstddef>
#include <type_traits>

#include "pg_tx.hpp"

namespace taskgate::db::postgres {

namespace {

// pg_type oids used for typed column reads
constexpr pqxx::oid kBoolOid   = 16;
constexpr pqxx::oid kByteaOid  = 17;
constexpr pqxx::oid kInt8Oid   = 20;
constexpr pqxx::oid kInt2Oid   = 21;
constexpr pqxx::oid kInt4Oid   = 23;
constexpr pqxx::oid kFloat4Oid = 700;
constexpr pqxx::oid kFloat8Oid = 701;

using Bytes = std::basic_string<std::byte>;

pqxx::params ToParams(const sql::Params& params) {
  pqxx::params out;
  for (const auto& param : params) {
    std::visit(
        [&](const auto& v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out.append();
          } else if constexpr (std::is_same_v<T, sql::Blob>) {
            Bytes bytes(reinterpret_cast<const std::byte*>(v.bytes.data()), v.bytes.size());
            out.append(bytes);
          } else {
            out.append(v);
          }
        },
        param);
  }
  return out;
}

sql::Value ToValue(const pqxx::field& field) {
  if (field.is_null()) return nullptr;

  switch (field.type()) {
    case kBoolOid:
      return static_cast<int64_t>(field.as<bool>() ? 1 : 0);
    case kInt2Oid:
    case kInt4Oid:
    case kInt8Oid:
      return field.as<int64_t>();
    case kFloat4Oid:
    case kFloat8Oid:
      return field.as<double>();
    case kByteaOid: {
      auto bytes = field.as<Bytes>();
      return sql::Blob{std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size())};
    }
    default:
      return std::string(field.c_str(), field.size());
  }
}

} // namespace

PgDatastore::PgDatastore(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::string PgDatastore::RewritePlaceholders(std::string_view query) {
  std::string out;
  out.reserve(query.size() + 8);

  int  index    = 0;
  char in_quote = 0;
  for (char c : query) {
    if (in_quote) {
      if (c == in_quote) in_quote = 0;
      out.push_back(c);
      continue;
    }
    if (c == '\'' || c == '"') {
      in_quote = c;
      out.push_back(c);
      continue;
    }
    if (c == '?') {
      out += "$" + std::to_string(++index);
      continue;
    }
    out.push_back(c);
  }
  return out;
}

Result PgDatastore::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  if (dynamic_cast<const pqxx::syntax_error*>(&e) || dynamic_cast<const pqxx::undefined_table*>(&e) ||
      dynamic_cast<const pqxx::undefined_column*>(&e)) {
    return Result::Err(ErrorCode::InvalidQuery, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgDatastore::Run(pqxx::transaction_base& tx, std::string_view query, const sql::Params& params, ResultSet& out) {
  auto res = tx.exec_params(RewritePlaceholders(query), ToParams(params));

  out = ResultSet{};
  for (pqxx::row_size_type c = 0; c < res.columns(); ++c) {
    out.columns.emplace_back(res.column_name(c));
  }
  out.rows.reserve(res.size());
  for (const auto& row : res) {
    std::vector<sql::Value> values;
    values.reserve(row.size());
    for (const auto& field : row) {
      values.push_back(ToValue(field));
    }
    out.rows.push_back(std::move(values));
  }
  out.affected_rows = res.columns() == 0 ? static_cast<std::uint64_t>(res.affected_rows()) : out.rows.size();
  return Result::Ok();
}

Result PgDatastore::Execute(std::string_view query, const sql::Params& params, ResultSet& out) {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work tx(*conn);
    auto       result = Run(tx, query, params, out);
    tx.commit();
    return result;
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::unique_ptr<Transaction> PgDatastore::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

Result PgDatastore::Execute(Transaction& tx, std::string_view query, const sql::Params& params, ResultSet& out) {
  auto* pg_tx = dynamic_cast<PgTransaction*>(&tx);
  if (!pg_tx || pg_tx->Owner() != pool_.get()) {
    return Result::Err(ErrorCode::Unsupported, "transaction does not belong to this datastore");
  }
  try {
    return Run(pg_tx->Work(), query, params, out);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

void PgDatastore::ExecScript(const std::string& sql) {
  auto       conn = pool_->Acquire();
  pqxx::work tx(*conn);
  tx.exec(sql);
  tx.commit();
}

} // namespace taskgate::db::postgres
