#include "ptrcanon/store/SqliteStore.hpp"

Q_LOGGING_CATEGORY(ptrcanonStore, "ptrcanon.store")

namespace ptrcanon::store {

namespace {

std::string errorMessage(sqlite3* db) {
    return db ? sqlite3_errmsg(db) : "unknown error";
}

}  // namespace

void DatabaseCloser::operator()(sqlite3* db) const {
    sqlite3_close_v2(db);
}

void StatementFinalizer::operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
}

void ValueDeleter::operator()(sqlite3_value* value) const {
    sqlite3_value_free(value);
}

DatabaseHandle open_db(const std::string& path) {
    sqlite3* raw = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(), &raw, SQLITE_OPEN_READWRITE, nullptr);
    DatabaseHandle db(raw);
    if (rc != SQLITE_OK) {
        throw StoreError("Failed to open SQLite database at " + path + ": " + errorMessage(raw));
    }
    qCDebug(ptrcanonStore, "Opened %s", path.c_str());
    return db;
}

void exec_sql(sqlite3* db, const std::string& sql) {
    char* errmsg = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &errmsg) != SQLITE_OK) {
        std::string message = errmsg ? errmsg : "unknown error";
        sqlite3_free(errmsg);
        throw StoreError("SQLite exec failed: " + message);
    }
}

StatementHandle prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        sqlite3_finalize(raw);
        throw StoreError("SQLite prepare failed: " + errorMessage(db));
    }
    return StatementHandle(raw);
}

void step_done(sqlite3* db, sqlite3_stmt* stmt, const std::string& what) {
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        throw StoreError(what + " failed: " + errorMessage(db));
    }
}

bool table_exists(sqlite3* db, const std::string& name) {
    StatementHandle stmt = prepare(db, "SELECT name FROM sqlite_master WHERE type='table' AND name=?;");
    if (sqlite3_bind_text(stmt.get(), 1, name.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK) {
        throw StoreError("SQLite bind failed: " + errorMessage(db));
    }
    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc != SQLITE_DONE) {
        throw StoreError("Failed to inspect sqlite_master: " + errorMessage(db));
    }
    return false;
}

Transaction::Transaction(sqlite3* db) : m_db(db) {
    exec_sql(m_db, "BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
    if (!m_open) {
        return;
    }
    if (sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
        qCWarning(ptrcanonStore, "Rollback failed: %s", sqlite3_errmsg(m_db));
    }
}

void Transaction::commit() {
    exec_sql(m_db, "COMMIT;");
    m_open = false;
}

}  // namespace ptrcanon::store
