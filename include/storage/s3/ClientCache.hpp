#pragma once

#include "storage/s3/ObjectClient.hpp"

#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace mg::storage::s3 {

// One client per endpoint host, built on first use and kept for the lifetime of
// the cache. Entries are never replaced.
class ClientCache {
public:
    using Factory = std::function<std::shared_ptr<ObjectClient>(const std::string& host)>;

    explicit ClientCache(Factory factory);

    // Factory exceptions propagate and leave nothing cached.
    [[nodiscard]] std::shared_ptr<ObjectClient> get(const std::string& host);

    [[nodiscard]] size_t size() const;

private:
    Factory factory_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<ObjectClient>> clients_;
};

}
