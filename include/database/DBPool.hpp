#pragma once

#include "DBConnection.hpp"
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>

namespace mg::database {

// Fixed set of connections handed out one at a time. acquire() blocks while
// all of them are leased.
class DBPool {
  public:
    class Lease {
      public:
        Lease(DBPool& pool, std::unique_ptr<DBConnection> conn) : pool_(&pool), conn_(std::move(conn)) {}
        Lease(Lease&& o) noexcept : pool_(o.pool_), conn_(std::move(o.conn_)) {}
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease& operator=(Lease&&) = delete;
        ~Lease() { if (conn_) pool_->release(std::move(conn_)); }

        DBConnection* operator->() const { return conn_.get(); }
        DBConnection& operator*() const { return *conn_; }

      private:
        DBPool* pool_;
        std::unique_ptr<DBConnection> conn_;
    };

    explicit DBPool(const config::DatabaseConfig& cfg) {
        const size_t size = cfg.pool_size == 0 ? 1 : cfg.pool_size;
        for (size_t i = 0; i < size; ++i) idle_.push(std::make_unique<DBConnection>(cfg));
    }

    // The returned connection is open; a dropped session is re-established first.
    Lease acquire() {
        std::unique_ptr<DBConnection> conn;
        {
            std::unique_lock lock(mtx_);
            cv_.wait(lock, [this] { return !idle_.empty(); });
            conn = std::move(idle_.front());
            idle_.pop();
        }

        Lease lease(*this, std::move(conn));
        if (!lease->isOpen()) lease->reconnect();
        return lease;
    }

  private:
    std::queue<std::unique_ptr<DBConnection>> idle_;
    std::mutex mtx_;
    std::condition_variable cv_;

    void release(std::unique_ptr<DBConnection> conn) {
        {
            std::lock_guard lock(mtx_);
            idle_.push(std::move(conn));
        }
        cv_.notify_one();
    }
};

} // namespace mg::database
