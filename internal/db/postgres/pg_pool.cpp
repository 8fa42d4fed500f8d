#include "pg_pool.hpp"

namespace taskgate::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [this] {
    return !idle_.empty() || live_connections_ < max_connections_;
  });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    return Wrap(new pqxx::connection(conninfo_));
  } catch (const std::exception&) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      delete conn;
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace taskgate::db::postgres
