#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace upload::db::postgres {

/*
  PgPool

  Bounded connection pool used by PgRepository.

  - Each transaction holds one connection for its lifetime.
  - libpqxx connections are not thread-safe; a connection is never shared
    by two live transactions.
  - Prepared statements are installed once per connection.

  Lifetime:
    Repository owns shared_ptr<PgPool>
    Transaction holds shared_ptr<pqxx::connection>; dropping it returns
    the connection to the idle list
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 4);

  // Blocks while max_connections are checked out.
  std::shared_ptr<pqxx::connection> Acquire();

  // Creates the tables and indexes if they are missing.
  void BootstrapSchema();

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

} // namespace upload::db::postgres
