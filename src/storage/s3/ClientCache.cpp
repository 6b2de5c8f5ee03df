#include "storage/s3/ClientCache.hpp"
#include "log/Registry.hpp"

#include <mutex>
#include <stdexcept>

namespace mg::storage::s3 {

ClientCache::ClientCache(Factory factory) : factory_(std::move(factory)) {
    if (!factory_) throw std::invalid_argument("ClientCache requires a client factory");
}

std::shared_ptr<ObjectClient> ClientCache::get(const std::string& host) {
    {
        std::shared_lock lock(mutex_);
        if (const auto it = clients_.find(host); it != clients_.end()) return it->second;
    }

    std::unique_lock lock(mutex_);
    if (const auto it = clients_.find(host); it != clients_.end()) return it->second;

    auto client = factory_(host);
    if (!client) throw std::runtime_error("Client factory returned null for host " + host);

    clients_.emplace(host, client);
    log::Registry::cloud()->info("[ClientCache] Object store client created for endpoint: {}", host);
    return client;
}

size_t ClientCache::size() const {
    std::shared_lock lock(mutex_);
    return clients_.size();
}

}
