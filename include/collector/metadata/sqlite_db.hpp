#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace collector::metadata {

/*
  Thin RAII wrapper around sqlite3*.

  Throws std::runtime_error; callers at the database boundary convert that into
  collector::Result.
*/
class SqliteDB {
public:
    explicit SqliteDB(std::string path);
    ~SqliteDB();

    SqliteDB(const SqliteDB&) = delete;
    SqliteDB& operator=(const SqliteDB&) = delete;

    sqlite3* handle() const { return db_; }

    // Execute a SQL string (schema and pragmas)
    void exec(const std::string& sql);

    const std::string& path() const { return path_; }

private:
    void configure();

    sqlite3* db_ = nullptr;
    std::string path_;
};

struct StatementDeleter {
    void operator()(sqlite3_stmt* statement) const { sqlite3_finalize(statement); }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

} // namespace collector::metadata
