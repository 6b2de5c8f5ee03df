#pragma once

#include "config/Config.hpp"
#include "storage/s3/Credentials.hpp"

#include <string>

namespace mg::storage::s3 {

// Maps an endpoint host to credentials using the configured provider table.
// Exact hosts are tried before suffixes, in table order.
class CredentialResolver {
public:
    explicit CredentialResolver(config::ObjectStoreConfig cfg);

    // Throws ConfigurationError for unknown hosts or a missing key pair.
    [[nodiscard]] Credentials resolve(const std::string& host) const;

private:
    config::ObjectStoreConfig cfg_;

    [[nodiscard]] const config::ProviderConfig* match(const std::string& host) const;
};

}
