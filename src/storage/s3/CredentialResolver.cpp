#include "storage/s3/CredentialResolver.hpp"
#include "storage/Errors.hpp"

#include <cstdlib>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <regex>

namespace mg::storage::s3 {

namespace {

std::string envOr(const std::string& inlineValue, const std::string& envName) {
    if (!inlineValue.empty()) return inlineValue;
    if (envName.empty()) return {};
    const char* v = std::getenv(envName.c_str());
    return v ? std::string(v) : std::string();
}

}

CredentialResolver::CredentialResolver(config::ObjectStoreConfig cfg) : cfg_(std::move(cfg)) {}

const config::ProviderConfig* CredentialResolver::match(const std::string& host) const {
    for (const auto& p : cfg_.providers)
        for (const auto& h : p.hosts)
            if (host == h) return &p;

    for (const auto& p : cfg_.providers)
        for (const auto& suffix : p.host_suffixes)
            if (host.size() > suffix.size() && host.ends_with(suffix)) return &p;

    return nullptr;
}

Credentials CredentialResolver::resolve(const std::string& host) const {
    const auto* provider = match(host);
    if (!provider) {
        std::vector<std::string> names;
        for (const auto& p : cfg_.providers) names.push_back(p.name);
        throw ConfigurationError(fmt::format("Unsupported S3 endpoint: {}. Supported providers: {}",
                                             host, fmt::join(names, ", ")));
    }

    std::string region = provider->region;
    if (!provider->region_pattern.empty()) {
        std::smatch m;
        const std::regex re(provider->region_pattern);
        if (std::regex_match(host, m, re) && m.size() > 1) region = m[1].str();
    }

    Credentials creds{
        .accessKey = envOr(provider->access_key, provider->access_key_env),
        .secretKey = envOr(provider->secret_key, provider->secret_key_env),
        .region = std::move(region),
        .endpoint = cfg_.scheme + "://" + host
    };

    if (creds.accessKey.empty() || creds.secretKey.empty())
        throw ConfigurationError(fmt::format(
            "{} credentials not found for endpoint: {}. Set {} and {} for this storage provider.",
            provider->name, host, provider->access_key_env, provider->secret_key_env));

    return creds;
}

}
