#pragma once

#include "move/IntentStore.hpp"
#include "storage/Errors.hpp"

#include <map>
#include <mutex>
#include <stdexcept>

namespace mg::test {

class MemoryIntentStore final : public move::IntentStore {
public:
    bool failRemove = false;

    move::MoveIntent create(const std::string& entityId, const move::PathKind kind,
                            const std::string& oldPath, const std::string& newPath) override {
        std::lock_guard lock(mutex_);
        const auto key = keyOf(entityId, kind);
        if (byEntity_.contains(key)) throw storage::AlreadyExistsError("intent exists for " + key);

        move::MoveIntent intent{std::to_string(++nextId_), entityId, kind, oldPath, newPath,
                                std::chrono::system_clock::now()};
        byEntity_[key] = intent;
        return intent;
    }

    std::optional<move::MoveIntent> getByEntity(const std::string& entityId, const move::PathKind kind) override {
        std::lock_guard lock(mutex_);
        const auto it = byEntity_.find(keyOf(entityId, kind));
        if (it == byEntity_.end()) return std::nullopt;
        return it->second;
    }

    move::MoveIntent update(const std::string& id, const std::string& oldPath, const std::string& newPath) override {
        std::lock_guard lock(mutex_);
        for (auto& [_, intent] : byEntity_) {
            if (intent.id != id) continue;
            intent.oldPath = oldPath;
            intent.newPath = newPath;
            return intent;
        }
        throw storage::NotFoundError("no intent " + id);
    }

    void remove(const std::string& id) override {
        std::lock_guard lock(mutex_);
        if (failRemove) throw std::runtime_error("intent store unavailable");
        std::erase_if(byEntity_, [&](const auto& kv) { return kv.second.id == id; });
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard lock(mutex_);
        return byEntity_.size();
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, move::MoveIntent> byEntity_;
    unsigned nextId_ = 0;

    static std::string keyOf(const std::string& entityId, const move::PathKind kind) {
        return entityId + "/" + std::string(move::to_string(kind));
    }
};

}
