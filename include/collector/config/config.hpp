#pragma once

#include "collector/core/result.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace collector::config {

enum class StorageType {
    Local,
    Google
};

enum class MetadataType {
    Memory,
    Sqlite
};

struct LocalStorageConfig {
    std::string uploads_folder = "file-uploads/";
    std::string files_folder = "files/";
};

struct GoogleStorageConfig {
    std::string host;
    std::string port = "443";
    bool use_tls = true;       ///< false only for an explicit http:// endpoint
    std::string ca_file;       ///< Extra trust anchors, system defaults otherwise
    std::string bucket_name;
    std::string access_token;
    std::size_t paging_size = 1000;
};

struct StorageConfig {
    StorageType type = StorageType::Local;
    LocalStorageConfig local;
    GoogleStorageConfig google;
};

struct MetadataConfig {
    MetadataType type = MetadataType::Memory;
    std::string path;                            ///< SQLite database file
    std::string collection_name = "fs.files";
    bool enforce_unique_identity = true;
};

struct ServerConfig {
    std::uint16_t port = 8080;
    std::string endpoint = "/api/v4";
    std::size_t workers = 4;
    std::chrono::milliseconds expiration{86400000};
    std::chrono::milliseconds chunk_timeout{30000};
    std::uint64_t payload_limit = 104857600;
    std::chrono::milliseconds cleanup_interval{86400000};
    std::string log_level = "info";
    StorageConfig storage;
    MetadataConfig metadata;
};

/**
 * @brief Builds a ServerConfig from a parsed JSON document
 *
 * Missing keys take their defaults; "storage-type" is mandatory. Ill-typed or
 * out-of-range values yield ErrorCode::InvalidConfiguration.
 */
collector::Result<ServerConfig> parse_config(const nlohmann::json& document);

collector::Result<ServerConfig> load_config(const std::string& path);

const char* to_string(StorageType type);

} // namespace collector::config
