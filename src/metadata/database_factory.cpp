#include "collector/metadata/database_factory.hpp"

#include "collector/metadata/memory_database.hpp"
#include "collector/metadata/sqlite_database.hpp"

#include <spdlog/spdlog.h>

namespace collector::metadata {

collector::Result<MetadataDatabasePtr> open_database(const config::MetadataConfig& config) {
    if (!config.enforce_unique_identity) {
        spdlog::warn("Unique identity constraint disabled, concurrent completions may store duplicates");
    }

    switch (config.type) {
        case config::MetadataType::Memory:
            spdlog::info("Keeping metadata in memory");
            return collector::Ok<MetadataDatabasePtr>(
                std::make_shared<InMemoryMetadataDatabase>(config.enforce_unique_identity));
        case config::MetadataType::Sqlite: {
            auto opened = SqliteMetadataDatabase::open(config.path, config.collection_name,
                                                       config.enforce_unique_identity);
            if (opened.is_error()) {
                return collector::Err<MetadataDatabasePtr>(opened.error());
            }
            spdlog::info("Metadata database {} (table {})", config.path, opened.value()->table());
            return collector::Ok<MetadataDatabasePtr>(opened.value());
        }
    }
    return collector::Err<MetadataDatabasePtr>(ErrorCode::InvalidConfiguration, "Unsupported metadata type");
}

} // namespace collector::metadata
