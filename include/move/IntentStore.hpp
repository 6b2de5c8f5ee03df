#pragma once

#include "move/MoveIntent.hpp"

#include <optional>
#include <string>

namespace mg::move {

// Durable storage for MoveIntent records. The record's existence is the only
// lock a relocation holds, so implementations must persist before returning.
class IntentStore {
public:
    virtual ~IntentStore() = default;

    // Throws storage::AlreadyExistsError if an intent for (entityId, kind) exists.
    virtual MoveIntent create(const std::string& entityId, PathKind kind,
                              const std::string& oldPath, const std::string& newPath) = 0;

    [[nodiscard]] virtual std::optional<MoveIntent> getByEntity(const std::string& entityId, PathKind kind) = 0;

    virtual MoveIntent update(const std::string& id, const std::string& oldPath, const std::string& newPath) = 0;

    virtual void remove(const std::string& id) = 0;
};

}
