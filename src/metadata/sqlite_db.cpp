#include "collector/metadata/sqlite_db.hpp"

#include <stdexcept>

namespace collector::metadata {

static void throw_if(int rc, sqlite3* db, const char* what) {
    if (rc != SQLITE_OK) {
        throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
    }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
    int rc = sqlite3_open_v2(path_.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
        if (db_) {
            sqlite3_close(db_);
        }
        db_ = nullptr;
        throw std::runtime_error(path_ + ": " + message);
    }

    try {
        configure();
    } catch (const std::runtime_error&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteDB::~SqliteDB() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SqliteDB::exec(const std::string& sql) {
    char* error = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error);
    if (rc != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw std::runtime_error(message);
    }
}

void SqliteDB::configure() {
    // WAL lets readers proceed while a writer holds the lock
    exec("PRAGMA journal_mode=WAL;");
    // Metadata documents must survive a power loss once acknowledged
    exec("PRAGMA synchronous=FULL;");
    throw_if(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");
}

} // namespace collector::metadata
