#pragma once

#include <QLoggingCategory>

#include <sqlite3.h>

#include <memory>
#include <stdexcept>
#include <string>

Q_DECLARE_LOGGING_CATEGORY(ptrcanonStore)

namespace ptrcanon::store {

// Raised when a store cannot be opened, read or written.
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct DatabaseCloser {
    void operator()(sqlite3* db) const;
};

struct StatementFinalizer {
    void operator()(sqlite3_stmt* stmt) const;
};

struct ValueDeleter {
    void operator()(sqlite3_value* value) const;
};

using DatabaseHandle = std::unique_ptr<sqlite3, DatabaseCloser>;
using StatementHandle = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;
using ValueHandle = std::unique_ptr<sqlite3_value, ValueDeleter>;

// Open an existing database read-write. The file is never created.
DatabaseHandle open_db(const std::string& path);

void exec_sql(sqlite3* db, const std::string& sql);

StatementHandle prepare(sqlite3* db, const std::string& sql);

// Step a statement that is expected to finish without producing rows.
void step_done(sqlite3* db, sqlite3_stmt* stmt, const std::string& what);

bool table_exists(sqlite3* db, const std::string& name);

// BEGIN IMMEDIATE on construction; rolled back on destruction unless
// commit() succeeded.
class Transaction {
public:
    explicit Transaction(sqlite3* db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    sqlite3* m_db;
    bool m_open{true};
};

}  // namespace ptrcanon::store
