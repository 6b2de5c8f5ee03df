#pragma once

#include "DBPool.hpp"
#include "log/Registry.hpp"

#include <memory>
#include <pqxx/pqxx>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace mg::database {

class Transactions {
  public:
    static inline std::shared_ptr<DBPool> dbPool_;

    static void init(const config::DatabaseConfig& cfg) { dbPool_ = std::make_shared<DBPool>(cfg); }

    [[nodiscard]] static bool isInitialized() { return dbPool_ != nullptr; }

    // Runs func inside one pqxx::work and commits it. Any exception rolls the
    // transaction back and propagates; the connection always returns to the pool.
    template <typename Func>
    static auto exec(const std::string& ctx, Func&& func) -> decltype(func(std::declval<pqxx::work&>())) {
        if (!dbPool_) throw std::runtime_error("Transactions not initialized");

        const auto conn = dbPool_->acquire();
        log::Registry::db()->trace("[Transactions] begin {}", ctx);

        try {
            pqxx::work txn(conn->get());
            if constexpr (std::is_void_v<decltype(func(txn))>) {
                func(txn);
                txn.commit();
                log::Registry::db()->trace("[Transactions] commit {}", ctx);
            } else {
                auto result = func(txn);
                txn.commit();
                log::Registry::db()->trace("[Transactions] commit {}", ctx);
                return result;
            }
        } catch (const std::exception& e) {
            log::Registry::db()->error("[Transactions] {} rolled back: {}", ctx, e.what());
            throw;
        }
    }
};

} // namespace mg::database
