#include "database/DBConnection.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <stdexcept>

namespace mg::database {

DBConnection::DBConnection(const config::DatabaseConfig& cfg)
    : connStr_(cfg.connectionString()),
      label_(fmt::format("{}@{}:{}/{}", cfg.user, cfg.host, cfg.port, cfg.name)),
      conn_(std::make_unique<pqxx::connection>(connStr_)) {
    log::Registry::db()->debug("[DBConnection] Connected to {}", label_);
    initPrepared();
}

DBConnection::~DBConnection() { if (conn_ && conn_->is_open()) conn_->close(); }

pqxx::connection& DBConnection::get() const { return *conn_; }

bool DBConnection::isOpen() const { return conn_ && conn_->is_open(); }

void DBConnection::reconnect() {
    log::Registry::db()->warn("[DBConnection] Session to {} was lost, reconnecting", label_);
    conn_ = std::make_unique<pqxx::connection>(connStr_);
    initPrepared();
}

void DBConnection::initPrepared() const {
    if (!isOpen()) throw std::runtime_error("Database connection is not open");

    initPreparedMoveIntents();
}

} // namespace mg::database
