#pragma once

#include "config/Config.hpp"

#include <memory>
#include <string>
#include <pqxx/connection>

namespace mg::database {

class DBConnection {
  public:
    explicit DBConnection(const config::DatabaseConfig& cfg);
    ~DBConnection();

    [[nodiscard]] pqxx::connection& get() const;
    [[nodiscard]] bool isOpen() const;

    // Opens a fresh session after the server dropped this one. Prepared
    // statements are per session, so they are registered again.
    void reconnect();

    void initPrepared() const;

  private:
    std::string connStr_;
    std::string label_;
    std::unique_ptr<pqxx::connection> conn_;

    void initPreparedMoveIntents() const;
};

} // namespace mg::database
