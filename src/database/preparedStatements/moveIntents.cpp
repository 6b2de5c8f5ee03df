#include "database/DBConnection.hpp"

using namespace mg::database;

void DBConnection::initPreparedMoveIntents() const {
    conn_->prepare("insert_move_intent",
                   "INSERT INTO move_intents (entity_id, path_kind, old_path, new_path) "
                   "VALUES ($1, $2, $3, $4) "
                   "RETURNING id, entity_id, path_kind, old_path, new_path, "
                   "  (EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS created_at_ms");

    conn_->prepare("get_move_intent_by_entity",
                   "SELECT id, entity_id, path_kind, old_path, new_path, "
                   "  (EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS created_at_ms "
                   "FROM move_intents WHERE entity_id = $1 AND path_kind = $2");

    conn_->prepare("update_move_intent_paths",
                   "UPDATE move_intents SET old_path = $2, new_path = $3 WHERE id = $1 "
                   "RETURNING id, entity_id, path_kind, old_path, new_path, "
                   "  (EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT AS created_at_ms");

    conn_->prepare("delete_move_intent", "DELETE FROM move_intents WHERE id = $1");
}
