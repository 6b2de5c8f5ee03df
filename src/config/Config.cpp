#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <cstdlib>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace mg::config {

std::vector<ProviderConfig> ObjectStoreConfig::defaultProviders() {
    return {
        {
            .name = "Tigris",
            .hosts = {"fly.storage.tigris.dev", "t3.storage.dev"},
            .region = "auto",
            .access_key_env = "TIGRIS_ACCESS_KEY_ID",
            .secret_key_env = "TIGRIS_SECRET_ACCESS_KEY"
        },
        {
            .name = "Wasabi",
            .host_suffixes = {".wasabisys.com"},
            .region_pattern = R"(^s3\.([^.]+)\.wasabisys\.com$)",
            .access_key_env = "WASABI_ACCESS_KEY_ID",
            .secret_key_env = "WASABI_SECRET_ACCESS_KEY"
        },
        {
            .name = "AWS",
            .host_suffixes = {".amazonaws.com"},
            .region_pattern = R"(^s3\.([^.]+)\.amazonaws\.com$)",
            .access_key_env = "AWS_ACCESS_KEY_ID",
            .secret_key_env = "AWS_SECRET_ACCESS_KEY"
        }
    };
}

std::string DatabaseConfig::connectionString() const {
    std::string pass = password;
    if (pass.empty() && !password_env.empty())
        if (const char* env = std::getenv(password_env.c_str())) pass = env;

    return "postgresql://" + user + (pass.empty() ? "" : ":" + pass) + "@" + host + ":" + std::to_string(port) + "/" + name;
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config file " + path.string() + ": " + e.what());
    }

    if (auto node = root["storage"]) YAML::convert<StorageConfig>::decode(node, cfg.storage);
    if (auto node = root["object_store"]) YAML::convert<ObjectStoreConfig>::decode(node, cfg.object_store);
    if (auto node = root["database"]) YAML::convert<DatabaseConfig>::decode(node, cfg.database);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

} // namespace mg::config
