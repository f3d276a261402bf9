#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace flotilla::db::postgres {

// Bounded pool of libpqxx connections, each with the repository's
// statements prepared. A connection is used by one transaction at a time.
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  // Exclusive use of one connection; returns it to the pool on destruction.
  // A connection that has gone bad is dropped instead.
  class Lease {
   public:
    Lease(std::shared_ptr<PgPool> pool, std::unique_ptr<pqxx::connection> conn);
    ~Lease();

    Lease(Lease&&) noexcept            = default;
    Lease& operator=(Lease&&)          = delete;

    pqxx::connection& operator*() const {
      return *conn_;
    }

    pqxx::connection* operator->() const {
      return conn_.get();
    }

   private:
    std::shared_ptr<PgPool>           pool_;
    std::unique_ptr<pqxx::connection> conn_;
  };

  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  // Blocks while max_connections are leased. Throws pqxx errors when a new
  // connection can not be opened.
  Lease Acquire();

 private:
  void Return(std::unique_ptr<pqxx::connection> conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        released_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    open_ = 0;
};

} // namespace flotilla::db::postgres
