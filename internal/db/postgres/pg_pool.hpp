#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace taskgate::db::postgres {

/*
  PgPool

  Bounded pool of libpqxx connections used by PgDatastore.

  libpqxx connections are NOT thread-safe, so each statement or transaction
  borrows one exclusively. The returned shared_ptr hands the connection back
  to the pool when the last reference goes away.
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  std::shared_ptr<pqxx::connection> Acquire();

 private:
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace taskgate::db::postgres
