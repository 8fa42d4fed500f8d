#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace taskgate::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
  conn_ = pool_->Acquire();
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!committed_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      TASKGATE_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
  // the work must be gone before its connection returns to the pool
  tx_.reset();
}

void PgTransaction::Commit() {
  tx_->commit();
  committed_ = true;
}

void PgTransaction::Rollback() {
  tx_->abort();
  committed_ = true;
}

}
