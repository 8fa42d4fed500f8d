#include "internal/db/sqlite/sqlite_datastore.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

using taskgate::db::ErrorCode;
using taskgate::db::ResultSet;
using taskgate::db::sqlite::SqliteDatastore;
using taskgate::db::sqlite::SqliteDB;
namespace sql = taskgate::db::sql;

std::shared_ptr<SqliteDatastore> MakeStore(const std::string& path = "") {
  auto store = std::make_shared<SqliteDatastore>(std::make_shared<SqliteDB>(path));
  store->ExecScript(R"(
    CREATE TABLE IF NOT EXISTS projects (
      id     TEXT PRIMARY KEY,
      name   TEXT NOT NULL,
      budget REAL,
      seats  INTEGER,
      logo   BLOB
    );
  )");
  return store;
}

ResultSet Run(SqliteDatastore& store, std::string_view query, const sql::Params& params = {}) {
  ResultSet  rows;
  const auto result = store.Execute(query, params, rows);
  assert(result);
  return rows;
}

void TestValuesRoundTripThroughColumns() {
  auto store = MakeStore();

  auto inserted = Run(*store, "INSERT INTO projects (id, name, budget, seats, logo) VALUES (?, ?, ?, ?, ?)",
                      {std::string("p-1"), std::string("apollo"), 12.5, int64_t{7}, sql::Blob{std::string("\x00\x01", 2)}});
  assert(inserted.affected_rows == 1);
  assert(inserted.columns.empty());

  Run(*store, "INSERT INTO projects (id, name) VALUES (?, ?)", {std::string("p-2"), std::string("gemini")});

  auto rows = Run(*store, "SELECT id, name, budget, seats, logo FROM projects ORDER BY id");
  assert(rows.columns == (std::vector<std::string>{"id", "name", "budget", "seats", "logo"}));
  assert(rows.rows.size() == 2);
  assert(rows.affected_rows == 2);

  const auto& first = rows.rows[0];
  assert(std::get<std::string>(first[0]) == "p-1");
  assert(std::get<double>(first[2]) == 12.5);
  assert(std::get<int64_t>(first[3]) == 7);
  assert(std::get<sql::Blob>(first[4]).bytes == std::string("\x00\x01", 2));

  const auto& second = rows.rows[1];
  assert(std::holds_alternative<std::nullptr_t>(second[2]));
  assert(std::holds_alternative<std::nullptr_t>(second[4]));

  auto removed = Run(*store, "DELETE FROM projects WHERE id = ?", {std::string("nope")});
  assert(removed.affected_rows == 0);
}

void TestDriverErrorsAreTranslated() {
  auto store = MakeStore();
  Run(*store, "INSERT INTO projects (id, name) VALUES ('p-1', 'apollo')");

  ResultSet rows;
  assert(store->Execute("INSERT INTO projects (id, name) VALUES ('p-1', 'again')", {}, rows).code == ErrorCode::AlreadyExists);
  assert(store->Execute("INSERT INTO projects (id) VALUES ('p-2')", {}, rows).code == ErrorCode::ConstraintViolation);
  assert(store->Execute("SELEC nonsense", {}, rows).code == ErrorCode::InvalidQuery);
  assert(store->Execute("SELECT * FROM missing_table", {}, rows).code == ErrorCode::InvalidQuery);

  const auto mismatch = store->Execute("SELECT * FROM projects WHERE id = ?", {}, rows);
  assert(mismatch.code == ErrorCode::InvalidQuery);
  assert(!mismatch.message.empty());

  assert(store->Execute("", {}, rows).code == ErrorCode::InvalidQuery);
}

void TestTransactions() {
  auto store = MakeStore();

  {
    auto      tx = store->Begin();
    ResultSet rows;
    assert(store->Execute(*tx, "INSERT INTO projects (id, name) VALUES ('p-1', 'rolled back')", {}, rows));
    tx->Rollback();
    assert(!tx->IsCommitted());
  }
  assert(Run(*store, "SELECT * FROM projects").rows.empty());

  {
    auto      tx = store->Begin();
    ResultSet rows;
    assert(store->Execute(*tx, "INSERT INTO projects (id, name) VALUES ('p-1', 'dropped')", {}, rows));
    // destructor rolls back
  }
  assert(Run(*store, "SELECT * FROM projects").rows.empty());

  {
    auto      tx = store->Begin();
    ResultSet rows;
    assert(store->Execute(*tx, "INSERT INTO projects (id, name) VALUES ('p-1', 'kept')", {}, rows));
    tx->Commit();
    assert(tx->IsCommitted());
  }
  assert(Run(*store, "SELECT * FROM projects").rows.size() == 1);

  auto      other = MakeStore();
  auto      foreign = other->Begin();
  ResultSet rows;
  assert(store->Execute(*foreign, "SELECT 1", {}, rows).code == ErrorCode::Unsupported);
}

void TestScriptsThrow() {
  auto store = MakeStore();

  bool threw = false;
  try {
    store->ExecScript("CREATE TABLE projects (id TEXT);");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestFileDatabasePersists() {
  const auto path = std::filesystem::temp_directory_path() / "taskgate_sqlite_datastore_test.db";
  std::filesystem::remove(path);

  {
    auto store = MakeStore(path.string());
    Run(*store, "INSERT INTO projects (id, name) VALUES ('p-1', 'durable')");
  }
  {
    auto store = MakeStore(path.string());
    auto rows  = Run(*store, "SELECT name FROM projects WHERE id = 'p-1'");
    assert(rows.rows.size() == 1);
    assert(std::get<std::string>(rows.rows[0][0]) == "durable");
  }

  std::filesystem::remove(path);
}

} // namespace

int main() {
  TestValuesRoundTripThroughColumns();
  TestDriverErrorsAreTranslated();
  TestTransactions();
  TestScriptsThrow();
  TestFileDatabasePersists();

  std::cout << "taskgate_unit_sqlite_datastore: pass\n";
  return 0;
}
