#include "collector/config/config.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>

namespace collector::config {

using json = nlohmann::json;

namespace {

collector::Error invalid(const std::string& message) {
    return collector::Error{ErrorCode::InvalidConfiguration, message};
}

const json& section(const json& document, const char* key) {
    static const json empty = json::object();
    if (!document.contains(key)) {
        return empty;
    }
    const auto& node = document.at(key);
    if (!node.is_object()) {
        throw std::invalid_argument(std::string("\"") + key + "\" must be an object");
    }
    return node;
}

template<typename T>
T read(const json& node, const char* key, T fallback) {
    return node.contains(key) ? node.at(key).get<T>() : fallback;
}

// "[https://|http://]host[:port]". Without a scheme the endpoint speaks TLS on 443;
// "http://" selects plaintext on 80.
bool split_endpoint(std::string endpoint, std::string& host, std::string& port, bool& use_tls) {
    static const std::string https = "https://";
    static const std::string plain = "http://";
    use_tls = true;
    if (endpoint.compare(0, https.size(), https) == 0) {
        endpoint.erase(0, https.size());
    } else if (endpoint.compare(0, plain.size(), plain) == 0) {
        endpoint.erase(0, plain.size());
        use_tls = false;
    } else if (endpoint.find("://") != std::string::npos) {
        return false;
    }
    while (!endpoint.empty() && endpoint.back() == '/') {
        endpoint.pop_back();
    }

    const auto colon = endpoint.rfind(':');
    if (colon == std::string::npos) {
        host = endpoint;
        port = use_tls ? "443" : "80";
    } else {
        host = endpoint.substr(0, colon);
        port = endpoint.substr(colon + 1);
    }
    return !host.empty() && !port.empty() && host.find('/') == std::string::npos &&
           port.find_first_not_of("0123456789") == std::string::npos;
}

} // namespace

const char* to_string(StorageType type) {
    switch (type) {
        case StorageType::Local: return "local";
        case StorageType::Google: return "google";
    }
    return "unknown";
}

collector::Result<ServerConfig> parse_config(const json& document) {
    if (!document.is_object()) {
        return collector::Err<ServerConfig>(invalid("Configuration must be a JSON object"));
    }

    ServerConfig config;
    try {
        const auto& http = section(document, "http");
        const auto port = read<std::int64_t>(http, "port", config.port);
        if (port <= 0 || port > 65535) {
            return collector::Err<ServerConfig>(invalid("http.port out of range: " + std::to_string(port)));
        }
        config.port = static_cast<std::uint16_t>(port);

        config.endpoint = read<std::string>(http, "endpoint", config.endpoint);
        while (config.endpoint.size() > 1 && config.endpoint.back() == '/') {
            config.endpoint.pop_back();
        }
        if (config.endpoint.empty() || config.endpoint.front() != '/') {
            return collector::Err<ServerConfig>(invalid("http.endpoint must start with '/'"));
        }

        const auto workers = read<std::int64_t>(document, "workers", static_cast<std::int64_t>(config.workers));
        if (workers < 1) {
            return collector::Err<ServerConfig>(invalid("workers must be at least 1"));
        }
        config.workers = static_cast<std::size_t>(workers);

        const auto& upload = section(document, "upload");
        const auto expiration = read<std::int64_t>(upload, "expiration_ms", config.expiration.count());
        const auto chunk_timeout = read<std::int64_t>(upload, "chunk_timeout_ms", config.chunk_timeout.count());
        const auto payload_limit = read<std::int64_t>(upload, "payload_limit",
                                                      static_cast<std::int64_t>(config.payload_limit));
        if (expiration <= 0 || chunk_timeout <= 0 || payload_limit <= 0) {
            return collector::Err<ServerConfig>(invalid("upload.* values must be positive"));
        }
        config.expiration = std::chrono::milliseconds(expiration);
        config.chunk_timeout = std::chrono::milliseconds(chunk_timeout);
        config.payload_limit = static_cast<std::uint64_t>(payload_limit);

        const auto& cleanup = section(document, "cleanup");
        const auto interval = read<std::int64_t>(cleanup, "interval_ms", expiration);
        if (interval <= 0) {
            return collector::Err<ServerConfig>(invalid("cleanup.interval_ms must be positive"));
        }
        config.cleanup_interval = std::chrono::milliseconds(interval);

        const auto& logging = section(document, "logging");
        config.log_level = read<std::string>(logging, "level", config.log_level);
        if (spdlog::level::from_str(config.log_level) == spdlog::level::off && config.log_level != "off") {
            return collector::Err<ServerConfig>(invalid("Unknown logging.level: " + config.log_level));
        }

        if (!document.contains("storage-type")) {
            return collector::Err<ServerConfig>(invalid("Missing \"storage-type\" section"));
        }
        const auto& storage = section(document, "storage-type");
        const auto storage_type = read<std::string>(storage, "type", "");
        if (storage_type == "local") {
            config.storage.type = StorageType::Local;
            config.storage.local.uploads_folder =
                read<std::string>(storage, "uploads-folder", config.storage.local.uploads_folder);
            config.storage.local.files_folder =
                read<std::string>(storage, "files-folder", config.storage.local.files_folder);
        } else if (storage_type == "google") {
            config.storage.type = StorageType::Google;
            auto& google = config.storage.google;
            if (!split_endpoint(read<std::string>(storage, "endpoint", ""), google.host, google.port,
                                google.use_tls)) {
                return collector::Err<ServerConfig>(
                    invalid("storage-type.endpoint must be [https://|http://]host[:port]"));
            }
            google.bucket_name = read<std::string>(storage, "bucket-name", "");
            if (google.bucket_name.empty()) {
                return collector::Err<ServerConfig>(invalid("storage-type.bucket-name is required"));
            }
            google.access_token = read<std::string>(storage, "access-token", "");
            google.ca_file = read<std::string>(storage, "ca-file", "");
            if (!google.use_tls && !google.access_token.empty()) {
                spdlog::warn("Sending the storage access token over plaintext HTTP to {}", google.host);
            }
            const auto paging = read<std::int64_t>(storage, "paging-size",
                                                   static_cast<std::int64_t>(google.paging_size));
            if (paging < 1) {
                return collector::Err<ServerConfig>(invalid("storage-type.paging-size must be positive"));
            }
            google.paging_size = static_cast<std::size_t>(paging);
        } else {
            return collector::Err<ServerConfig>(invalid("Unknown storage-type.type: \"" + storage_type + "\""));
        }

        const auto& metadata = section(document, "metadata");
        const auto metadata_type = read<std::string>(metadata, "type", "memory");
        if (metadata_type == "memory") {
            config.metadata.type = MetadataType::Memory;
        } else if (metadata_type == "sqlite") {
            config.metadata.type = MetadataType::Sqlite;
            config.metadata.path = read<std::string>(metadata, "path", "");
            if (config.metadata.path.empty()) {
                return collector::Err<ServerConfig>(invalid("metadata.path is required for sqlite"));
            }
        } else {
            return collector::Err<ServerConfig>(invalid("Unknown metadata.type: \"" + metadata_type + "\""));
        }
        config.metadata.collection_name =
            read<std::string>(metadata, "collection-name", config.metadata.collection_name);
        config.metadata.enforce_unique_identity =
            read<bool>(metadata, "enforce-unique-identity", config.metadata.enforce_unique_identity);
    } catch (const json::exception& e) {
        return collector::Err<ServerConfig>(invalid(e.what()));
    } catch (const std::invalid_argument& e) {
        return collector::Err<ServerConfig>(invalid(e.what()));
    }

    return collector::Ok(std::move(config));
}

collector::Result<ServerConfig> load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return collector::Err<ServerConfig>(invalid("Cannot open configuration file " + path));
    }

    json document;
    try {
        in >> document;
    } catch (const json::parse_error& e) {
        return collector::Err<ServerConfig>(invalid(path + ": " + e.what()));
    }
    return parse_config(document);
}

} // namespace collector::config
