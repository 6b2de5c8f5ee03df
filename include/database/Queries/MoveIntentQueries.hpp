#pragma once

#include "move/IntentStore.hpp"

namespace pqxx { class row; }

namespace mg::database {

// move_intents table access through the pooled prepared statements.
// Requires Transactions::init to have been called.
class MoveIntentQueries final : public move::IntentStore {
public:
    move::MoveIntent create(const std::string& entityId, move::PathKind kind,
                            const std::string& oldPath, const std::string& newPath) override;

    [[nodiscard]] std::optional<move::MoveIntent> getByEntity(const std::string& entityId, move::PathKind kind) override;

    move::MoveIntent update(const std::string& id, const std::string& oldPath, const std::string& newPath) override;

    void remove(const std::string& id) override;

private:
    static move::MoveIntent fromRow(const pqxx::row& row);
};

}
