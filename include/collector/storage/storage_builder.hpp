#pragma once

#include "collector/config/config.hpp"
#include "collector/core/result.hpp"
#include "collector/storage/storage_backend.hpp"

namespace collector::storage {

/**
 * @brief Backend selected by configuration together with its cleanup operation
 */
struct StorageSetup {
    StorageBackendPtr backend;
    CleanupOperation cleanup;
};

collector::Result<StorageSetup> build_storage(const config::StorageConfig& config);

} // namespace collector::storage
