#include "collector/metadata/sqlite_database.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace collector::metadata {

using json = nlohmann::json;

namespace {

void bind_text(sqlite3_stmt* statement, int index, const std::string& value) {
    sqlite3_bind_text(statement, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

std::string column_text(sqlite3_stmt* statement, int column) {
    const unsigned char* text = sqlite3_column_text(statement, column);
    return text ? reinterpret_cast<const char*>(text) : "";
}

// "fs.files" -> "fs_files"
std::string table_name(const std::string& collection_name) {
    std::string table;
    for (char c : collection_name) {
        const bool word = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                          (c >= '0' && c <= '9') || c == '_';
        table.push_back(word ? c : '_');
    }
    return table.empty() ? "documents" : table;
}

std::string identity_clause(const UploadIdentity& identity) {
    return identity.attachment_id
        ? "device_id = ?1 AND measurement_id = ?2 AND attachment_id = ?3"
        : "device_id = ?1 AND measurement_id = ?2 AND attachment_id IS NULL";
}

void bind_identity(sqlite3_stmt* statement, const UploadIdentity& identity) {
    bind_text(statement, 1, identity.device_id);
    bind_text(statement, 2, identity.measurement_id);
    if (identity.attachment_id) {
        bind_text(statement, 3, *identity.attachment_id);
    }
}

} // namespace

collector::Result<std::shared_ptr<SqliteMetadataDatabase>> SqliteMetadataDatabase::open(
    const std::string& path, const std::string& collection_name, bool enforce_unique_identity) {
    try {
        auto database = std::make_shared<SqliteMetadataDatabase>(std::make_unique<SqliteDB>(path),
                                                                  table_name(collection_name));
        database->create_schema(enforce_unique_identity);
        spdlog::info("SQLite metadata database {} ready (table {}, unique identity {})",
                     path, database->table(), enforce_unique_identity ? "enforced" : "not enforced");
        return collector::Ok(std::move(database));
    } catch (const std::runtime_error& e) {
        return collector::Err<std::shared_ptr<SqliteMetadataDatabase>>(ErrorCode::StorageFailure,
            "Cannot open metadata database " + path + ": " + e.what());
    }
}

SqliteMetadataDatabase::SqliteMetadataDatabase(std::unique_ptr<SqliteDB> db, std::string table)
    : db_(std::move(db)), table_(std::move(table)) {}

void SqliteMetadataDatabase::create_schema(bool enforce_unique_identity) {
    const std::string quoted = "\"" + table_ + "\"";
    db_->exec("CREATE TABLE IF NOT EXISTS " + quoted + " ("
              "id TEXT PRIMARY KEY, "
              "device_id TEXT NOT NULL, "
              "measurement_id TEXT NOT NULL, "
              "attachment_id TEXT, "
              "upload_date TEXT NOT NULL, "
              "document TEXT NOT NULL);");

    if (enforce_unique_identity) {
        db_->exec("CREATE UNIQUE INDEX IF NOT EXISTS \"" + table_ + "_measurement_identity\" ON " + quoted +
                  " (device_id, measurement_id) WHERE attachment_id IS NULL;");
        db_->exec("CREATE UNIQUE INDEX IF NOT EXISTS \"" + table_ + "_attachment_identity\" ON " + quoted +
                  " (device_id, measurement_id, attachment_id) WHERE attachment_id IS NOT NULL;");
    } else {
        db_->exec("CREATE INDEX IF NOT EXISTS \"" + table_ + "_identity\" ON " + quoted +
                  " (device_id, measurement_id, attachment_id);");
    }
}

collector::Error SqliteMetadataDatabase::translate(int rc) const {
    switch (rc & 0xFF) {
        case SQLITE_CONSTRAINT:
            return collector::Error{ErrorCode::DuplicateUpload, sqlite3_errmsg(db_->handle())};
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return collector::Error{ErrorCode::CorruptedMetadataState, sqlite3_errmsg(db_->handle())};
        default:
            return collector::Error{ErrorCode::StorageFailure, sqlite3_errmsg(db_->handle())};
    }
}

collector::Result<Statement> SqliteMetadataDatabase::prepare(const std::string& sql) {
    sqlite3_stmt* raw = nullptr;
    const int rc = sqlite3_prepare_v2(db_->handle(), sql.c_str(), -1, &raw, nullptr);
    Statement statement(raw);
    if (rc != SQLITE_OK) {
        return collector::Err<Statement>(translate(rc));
    }
    return collector::Ok(std::move(statement));
}

collector::Result<std::string> SqliteMetadataDatabase::store_metadata(const UploadMetaData& metadata) {
    const auto document = make_document(metadata, std::chrono::system_clock::now());

    std::lock_guard lock(mutex_);
    auto statement = prepare("INSERT INTO \"" + table_ + "\" "
                             "(id, device_id, measurement_id, attachment_id, upload_date, document) "
                             "VALUES (?1, ?2, ?3, ?4, ?5, ?6);");
    if (statement.is_error()) {
        return collector::Err<std::string>(statement.error());
    }

    auto* st = statement.value().get();
    bind_text(st, 1, document.id);
    bind_text(st, 2, metadata.identity.device_id);
    bind_text(st, 3, metadata.identity.measurement_id);
    if (metadata.identity.attachment_id) {
        bind_text(st, 4, *metadata.identity.attachment_id);
    } else {
        sqlite3_bind_null(st, 4);
    }
    bind_text(st, 5, format_timestamp(document.upload_date));
    bind_text(st, 6, to_json(document).dump());

    const int rc = sqlite3_step(st);
    if (rc != SQLITE_DONE) {
        auto error = translate(rc);
        if (error.code == ErrorCode::DuplicateUpload) {
            error.message = "A document for " + metadata.identity.to_string() + " already exists";
        }
        return collector::Err<std::string>(std::move(error));
    }
    return collector::Ok(document.id);
}

collector::Result<bool> SqliteMetadataDatabase::exists(const std::string& device_id,
                                                       const std::string& measurement_id) {
    return check(UploadIdentity{device_id, measurement_id, std::nullopt});
}

collector::Result<bool> SqliteMetadataDatabase::exists(const std::string& device_id,
                                                       const std::string& measurement_id,
                                                       const std::string& attachment_id) {
    return check(UploadIdentity{device_id, measurement_id, attachment_id});
}

collector::Result<bool> SqliteMetadataDatabase::check(const UploadIdentity& identity) {
    std::lock_guard lock(mutex_);
    auto statement = prepare("SELECT COUNT(*) FROM \"" + table_ + "\" WHERE " + identity_clause(identity) + ";");
    if (statement.is_error()) {
        return collector::Err<bool>(statement.error());
    }

    auto* st = statement.value().get();
    bind_identity(st, identity);
    const int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        return collector::Err<bool>(translate(rc));
    }

    const auto matched = sqlite3_column_int64(st, 0);
    if (matched > 1) {
        spdlog::error("Found {} documents for {}, metadata state is corrupted",
                      matched, identity.to_string());
        return collector::Err<bool>(ErrorCode::CorruptedMetadataState,
            std::to_string(matched) + " documents match " + identity.to_string());
    }
    return collector::Ok(matched == 1);
}

collector::Result<std::vector<MetadataDocument>> SqliteMetadataDatabase::find(const UploadIdentity& identity) {
    std::lock_guard lock(mutex_);
    auto statement = prepare("SELECT document FROM \"" + table_ + "\" WHERE " + identity_clause(identity) +
                             " ORDER BY upload_date;");
    if (statement.is_error()) {
        return collector::Err<std::vector<MetadataDocument>>(statement.error());
    }

    auto* st = statement.value().get();
    bind_identity(st, identity);

    std::vector<MetadataDocument> documents;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        const auto text = column_text(st, 0);
        auto feature = json::parse(text, nullptr, false);
        if (feature.is_discarded()) {
            return collector::Err<std::vector<MetadataDocument>>(ErrorCode::CorruptedMetadataState,
                "Unreadable document text in table " + table_);
        }
        auto document = from_json(feature);
        if (document.is_error()) {
            return collector::Err<std::vector<MetadataDocument>>(document.error());
        }
        documents.push_back(std::move(document.value()));
    }
    if (rc != SQLITE_DONE) {
        return collector::Err<std::vector<MetadataDocument>>(translate(rc));
    }
    return collector::Ok(std::move(documents));
}

collector::Result<std::size_t> SqliteMetadataDatabase::count() {
    std::lock_guard lock(mutex_);
    auto statement = prepare("SELECT COUNT(*) FROM \"" + table_ + "\";");
    if (statement.is_error()) {
        return collector::Err<std::size_t>(statement.error());
    }
    auto* st = statement.value().get();
    const int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        return collector::Err<std::size_t>(translate(rc));
    }
    return collector::Ok(static_cast<std::size_t>(sqlite3_column_int64(st, 0)));
}

} // namespace collector::metadata
