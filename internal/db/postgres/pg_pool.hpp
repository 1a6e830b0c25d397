#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace routebid::db::postgres {

/*
  Bounded set of libpqxx connections behind PgRepository.

  A connection serves one PgTx at a time. When the PgTx drops its
  shared_ptr the connection returns to the idle list, or is closed if the
  pool is already gone. Acquire() blocks while max_connections are checked
  out (config: database.postgres.max_connections).

  New connections get the package, bid and route statements prepared
  before first use.
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  // Idle connection if any, else a new one while under the cap.
  std::shared_ptr<pqxx::connection> Acquire();

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace routebid::db::postgres
