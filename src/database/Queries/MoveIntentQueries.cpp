#include "database/Queries/MoveIntentQueries.hpp"
#include "database/Transactions.hpp"
#include "storage/Errors.hpp"

#include <pqxx/pqxx>

using namespace mg::database;
using namespace mg::move;

MoveIntent MoveIntentQueries::fromRow(const pqxx::row& row) {
    MoveIntent intent;
    intent.id = row["id"].as<std::string>();
    intent.entityId = row["entity_id"].as<std::string>();
    intent.pathKind = pathKindFromString(row["path_kind"].as<std::string>());
    intent.oldPath = row["old_path"].as<std::string>();
    intent.newPath = row["new_path"].as<std::string>();
    intent.createdAt = std::chrono::system_clock::time_point(std::chrono::milliseconds(row["created_at_ms"].as<int64_t>()));
    return intent;
}

MoveIntent MoveIntentQueries::create(const std::string& entityId, const PathKind kind,
                                     const std::string& oldPath, const std::string& newPath) {
    try {
        return Transactions::exec("MoveIntentQueries::create", [&](pqxx::work& txn) {
            const auto res = txn.exec(pqxx::prepped{"insert_move_intent"},
                                      pqxx::params{entityId, std::string(to_string(kind)), oldPath, newPath});
            return fromRow(res.one_row());
        });
    } catch (const pqxx::unique_violation&) {
        throw storage::AlreadyExistsError("Move intent already exists for " + entityId + " (" +
                                          std::string(to_string(kind)) + ")");
    }
}

std::optional<MoveIntent> MoveIntentQueries::getByEntity(const std::string& entityId, const PathKind kind) {
    return Transactions::exec("MoveIntentQueries::getByEntity", [&](pqxx::work& txn) -> std::optional<MoveIntent> {
        const auto res = txn.exec(pqxx::prepped{"get_move_intent_by_entity"},
                                  pqxx::params{entityId, std::string(to_string(kind))});
        if (res.empty()) return std::nullopt;
        return fromRow(res[0]);
    });
}

MoveIntent MoveIntentQueries::update(const std::string& id, const std::string& oldPath, const std::string& newPath) {
    return Transactions::exec("MoveIntentQueries::update", [&](pqxx::work& txn) {
        const auto res = txn.exec(pqxx::prepped{"update_move_intent_paths"}, pqxx::params{id, oldPath, newPath});
        if (res.empty()) throw storage::NotFoundError("Move intent not found: " + id);
        return fromRow(res[0]);
    });
}

void MoveIntentQueries::remove(const std::string& id) {
    Transactions::exec("MoveIntentQueries::remove", [&](pqxx::work& txn) {
        txn.exec(pqxx::prepped{"delete_move_intent"}, pqxx::params{id});
    });
}
