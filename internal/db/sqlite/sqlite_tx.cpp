#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace taskgate::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)), lock_(db_->Mutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      TASKGATE_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  finished_ = true;
}

} // namespace taskgate::db::sqlite
