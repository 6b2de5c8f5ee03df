#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace mg::config {

constexpr static uintmax_t MIN_MULTIPART_PART_SIZE = 5 * 1024 * 1024; // 5 MiB, S3 lower bound

struct ProviderConfig {
    std::string name;
    std::vector<std::string> hosts;          // exact host matches
    std::vector<std::string> host_suffixes;  // e.g. ".wasabisys.com"
    std::string region = "us-east-1";        // used when region_pattern is empty or does not match
    std::string region_pattern;              // regex, first capture group is the region
    std::string access_key_env;
    std::string secret_key_env;
    std::string access_key;                  // inline keys win over the environment
    std::string secret_key;
};

struct ObjectStoreConfig {
    std::string scheme = "https";
    uintmax_t multipart_part_size = MIN_MULTIPART_PART_SIZE;
    long connect_timeout_seconds = 10;
    std::vector<ProviderConfig> providers = defaultProviders();

    static std::vector<ProviderConfig> defaultProviders();
};

struct StorageConfig {
    std::string media_location = "/data";
    std::filesystem::path temp_dir = std::filesystem::temp_directory_path();
    bool hash_verification_enabled = true;
    std::vector<std::string> supported_extensions = {
        ".jpg", ".jpeg", ".png", ".webp", ".heic", ".heif", ".gif", ".tif", ".tiff", ".avif",
        ".dng", ".raw", ".nef", ".cr2", ".cr3", ".arw", ".mp4", ".mov", ".m4v", ".webm", ".mkv",
        ".3gp", ".avi", ".mts", ".xmp"
    };
};

struct DatabaseConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string name = "mediagate";
    std::string user = "mediagate";
    std::string password;
    std::string password_env = "MEDIAGATE_DB_PASSWORD";
    unsigned int pool_size = 4;

    [[nodiscard]] std::string connectionString() const;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum mediagate = spdlog::level::info;
    spdlog::level::level_enum storage   = spdlog::level::warn;   // local I/O faults
    spdlog::level::level_enum cloud     = spdlog::level::warn;   // S3 errors, not routine requests
    spdlog::level::level_enum move      = spdlog::level::info;   // every relocation outcome
    spdlog::level::level_enum scan      = spdlog::level::warn;
    spdlog::level::level_enum db        = spdlog::level::err;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/mediagate";
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct Config {
    StorageConfig storage;
    ObjectStoreConfig object_store;
    DatabaseConfig database;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

} // namespace mg::config
