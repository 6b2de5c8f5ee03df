#pragma once

#include "config/Config.hpp"

#include <algorithm>
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace mg::config;

template<>
struct convert<ProviderConfig> {
    static Node encode(const ProviderConfig& rhs) {
        Node node;
        node["name"] = rhs.name;
        node["hosts"] = rhs.hosts;
        node["host_suffixes"] = rhs.host_suffixes;
        node["region"] = rhs.region;
        node["region_pattern"] = rhs.region_pattern;
        node["access_key_env"] = rhs.access_key_env;
        node["secret_key_env"] = rhs.secret_key_env;
        return node;
    }

    static bool decode(const Node& node, ProviderConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.name = node["name"].as<std::string>("");
        if (node["hosts"]) rhs.hosts = node["hosts"].as<std::vector<std::string>>();
        if (node["host_suffixes"]) rhs.host_suffixes = node["host_suffixes"].as<std::vector<std::string>>();
        rhs.region = node["region"].as<std::string>("us-east-1");
        rhs.region_pattern = node["region_pattern"].as<std::string>("");
        rhs.access_key_env = node["access_key_env"].as<std::string>("");
        rhs.secret_key_env = node["secret_key_env"].as<std::string>("");
        rhs.access_key = node["access_key"].as<std::string>("");
        rhs.secret_key = node["secret_key"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<ObjectStoreConfig> {
    static Node encode(const ObjectStoreConfig& rhs) {
        Node node;
        node["scheme"] = rhs.scheme;
        node["multipart_part_size_mb"] = rhs.multipart_part_size / (1024 * 1024);
        node["connect_timeout_seconds"] = rhs.connect_timeout_seconds;
        node["providers"] = rhs.providers;
        return node;
    }

    static bool decode(const Node& node, ObjectStoreConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.scheme = node["scheme"].as<std::string>("https");
        rhs.multipart_part_size = std::max<uintmax_t>(
            node["multipart_part_size_mb"].as<uintmax_t>(5) * 1024 * 1024, MIN_MULTIPART_PART_SIZE);
        rhs.connect_timeout_seconds = node["connect_timeout_seconds"].as<long>(10);

        // configured providers are tried before the built-in ones
        if (const auto providers = node["providers"]) {
            auto merged = providers.as<std::vector<ProviderConfig>>();
            for (auto& p : ObjectStoreConfig::defaultProviders()) merged.push_back(std::move(p));
            rhs.providers = std::move(merged);
        }
        return true;
    }
};

template<>
struct convert<StorageConfig> {
    static Node encode(const StorageConfig& rhs) {
        Node node;
        node["media_location"] = rhs.media_location;
        node["temp_dir"] = rhs.temp_dir.string();
        node["hash_verification_enabled"] = rhs.hash_verification_enabled;
        node["supported_extensions"] = rhs.supported_extensions;
        return node;
    }

    static bool decode(const Node& node, StorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.media_location = node["media_location"].as<std::string>("/data");
        if (node["temp_dir"]) rhs.temp_dir = node["temp_dir"].as<std::string>();
        rhs.hash_verification_enabled = node["hash_verification_enabled"].as<bool>(true);
        if (node["supported_extensions"])
            rhs.supported_extensions = node["supported_extensions"].as<std::vector<std::string>>();
        return true;
    }
};

template<>
struct convert<DatabaseConfig> {
    static Node encode(const DatabaseConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["name"] = rhs.name;
        node["user"] = rhs.user;
        node["password_env"] = rhs.password_env;
        node["pool_size"] = rhs.pool_size;
        return node;
    }

    static bool decode(const Node& node, DatabaseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("localhost");
        rhs.port = node["port"].as<uint16_t>(5432);
        rhs.name = node["name"].as<std::string>("mediagate");
        rhs.user = node["user"].as<std::string>("mediagate");
        rhs.password = node["password"].as<std::string>("");
        rhs.password_env = node["password_env"].as<std::string>("MEDIAGATE_DB_PASSWORD");
        rhs.pool_size = node["pool_size"].as<unsigned int>(4);
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

static spdlog::level::level_enum levelOr(const Node& node, const spdlog::level::level_enum def) {
    if (!node) return def;
    return spdlog::level::from_str(node.as<std::string>());
}

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["mediagate"] = to_std_string(spdlog::level::to_string_view(rhs.mediagate));
        node["storage"] = to_std_string(spdlog::level::to_string_view(rhs.storage));
        node["cloud"] = to_std_string(spdlog::level::to_string_view(rhs.cloud));
        node["move"] = to_std_string(spdlog::level::to_string_view(rhs.move));
        node["scan"] = to_std_string(spdlog::level::to_string_view(rhs.scan));
        node["db"] = to_std_string(spdlog::level::to_string_view(rhs.db));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.mediagate = levelOr(node["mediagate"], spdlog::level::info);
        rhs.storage = levelOr(node["storage"], spdlog::level::warn);
        rhs.cloud = levelOr(node["cloud"], spdlog::level::warn);
        rhs.move = levelOr(node["move"], spdlog::level::info);
        rhs.scan = levelOr(node["scan"], spdlog::level::warn);
        rhs.db = levelOr(node["db"], spdlog::level::err);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"] = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["log_dir"]) rhs.log_dir = node["log_dir"].as<std::string>();
        rhs.console_log_level = levelOr(node["console_log_level"], spdlog::level::info);
        rhs.file_log_level = levelOr(node["file_log_level"], spdlog::level::warn);
        if (node["subsystem_levels"]) convert<SubsystemLogLevelsConfig>::decode(node["subsystem_levels"], rhs.subsystem_levels);
        return true;
    }
};

}
