#include "collector/storage/storage_builder.hpp"

#include "collector/storage/cloud_storage.hpp"
#include "collector/storage/http_object_store.hpp"
#include "collector/storage/local_storage.hpp"

#include <boost/system/system_error.hpp>
#include <spdlog/spdlog.h>

namespace collector::storage {

namespace {

CleanupOperation cleanup_of(const StorageBackendPtr& backend) {
    return [backend](std::chrono::milliseconds expiration_age) {
        return backend->cleanup(expiration_age);
    };
}

} // namespace

collector::Result<StorageSetup> build_storage(const config::StorageConfig& config) {
    StorageBackendPtr backend;

    switch (config.type) {
        case config::StorageType::Local: {
            auto local = std::make_shared<LocalStorageBackend>(config.local.uploads_folder,
                                                               config.local.files_folder);
            auto ready = local->initialize();
            if (ready.is_error()) {
                return collector::Err<StorageSetup>(ready.error());
            }
            spdlog::info("Storing uploads under {} and files under {}",
                         config.local.uploads_folder, config.local.files_folder);
            backend = local;
            break;
        }
        case config::StorageType::Google: {
            HttpObjectStoreOptions options;
            options.host = config.google.host;
            options.port = config.google.port;
            options.use_tls = config.google.use_tls;
            options.ca_file = config.google.ca_file;
            options.bucket = config.google.bucket_name;
            options.access_token = config.google.access_token;
            options.paging_size = config.google.paging_size;
            spdlog::info("Storing uploads in bucket {} at {}://{}:{}", options.bucket,
                         options.use_tls ? "https" : "http", options.host, options.port);
            std::shared_ptr<HttpObjectStore> client;
            try {
                client = std::make_shared<HttpObjectStore>(options);
            } catch (const boost::system::system_error& e) {
                return collector::Err<StorageSetup>(ErrorCode::InvalidConfiguration,
                    "Cannot set up TLS for " + options.host + ": " + e.what());
            }
            backend = std::make_shared<CloudStorageBackend>(client);
            break;
        }
    }

    if (!backend) {
        return collector::Err<StorageSetup>(ErrorCode::InvalidConfiguration, "Unsupported storage type");
    }
    return collector::Ok(StorageSetup{backend, cleanup_of(backend)});
}

} // namespace collector::storage
