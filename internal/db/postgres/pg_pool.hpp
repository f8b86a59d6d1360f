#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace reconciler::db::postgres {

/*
  PgPool

  Connection pool used by PgMetadataStore.

  Design notes:
  -------------
  - Each metadata call gets its own connection.
  - libpqxx connections are NOT thread-safe -> do not share.
  - Prepared statements are installed per connection.
  - At most max_connections are open; callers block for an idle one.

  Lifetime:
    PgMetadataStore owns shared_ptr<PgPool>
    each call acquires shared_ptr<pqxx::connection>
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  // Acquire a new ready-to-use connection
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

} // namespace reconciler::db::postgres
