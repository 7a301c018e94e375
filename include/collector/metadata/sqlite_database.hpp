#pragma once

#include "collector/metadata/database.hpp"
#include "collector/metadata/sqlite_db.hpp"

#include <mutex>

namespace collector::metadata {

/**
 * @brief MetadataDatabase backed by one SQLite table
 *
 * Each row holds the identity columns and the document's JSON text. With
 * enforce_unique_identity the table carries partial unique indexes on
 * (device_id, measurement_id) for measurements and on
 * (device_id, measurement_id, attachment_id) for attachments, so the store
 * rejects a second document with DuplicateUpload.
 */
class SqliteMetadataDatabase : public MetadataDatabase {
public:
    static collector::Result<std::shared_ptr<SqliteMetadataDatabase>> open(
        const std::string& path,
        const std::string& collection_name = "fs.files",
        bool enforce_unique_identity = true);

    using MetadataDatabase::exists;

    collector::Result<std::string> store_metadata(const UploadMetaData& metadata) override;

    collector::Result<bool> exists(const std::string& device_id,
                                   const std::string& measurement_id) override;

    collector::Result<bool> exists(const std::string& device_id,
                                   const std::string& measurement_id,
                                   const std::string& attachment_id) override;

    collector::Result<std::vector<MetadataDocument>> find(const UploadIdentity& identity) override;

    collector::Result<std::size_t> count() override;

    const std::string& table() const { return table_; }

    SqliteMetadataDatabase(std::unique_ptr<SqliteDB> db, std::string table);

private:
    void create_schema(bool enforce_unique_identity);
    collector::Result<bool> check(const UploadIdentity& identity);
    collector::Result<Statement> prepare(const std::string& sql);
    collector::Error translate(int rc) const;

    std::unique_ptr<SqliteDB> db_;
    std::string table_;
    std::mutex mutex_;
};

} // namespace collector::metadata
