#include "ptrcanon/store/RecordTable.hpp"

#include "ptrcanon/canon/CanonicalJson.hpp"
#include "ptrcanon/store/SqliteStore.hpp"

#include <array>
#include <string>
#include <utility>
#include <vector>

namespace ptrcanon::store {

namespace {

constexpr std::array<const char*, 4> kTextColumns{"value", "extra", "links", "source"};

struct RowUpdate {
    ValueHandle id;
    std::vector<std::pair<const char*, std::string>> columns;
};

std::vector<RowUpdate> collectRowUpdates(sqlite3* db, canon::ConsentLevel defaultConsent) {
    StatementHandle select = prepare(db, "SELECT id, value, extra, links, source FROM memory_records;");

    std::vector<RowUpdate> updates;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(select.get())) == SQLITE_ROW) {
        RowUpdate update;
        for (std::size_t i = 0; i < kTextColumns.size(); ++i) {
            const int column = static_cast<int>(i) + 1;
            // NULL and non-text cells are left as they are.
            if (sqlite3_column_type(select.get(), column) != SQLITE_TEXT) {
                continue;
            }
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(select.get(), column));
            const std::string stored(text, static_cast<std::size_t>(sqlite3_column_bytes(select.get(), column)));

            canon::Canonicalized<std::string> processed = canon::processDocument(stored, defaultConsent);
            if (processed.changed) {
                update.columns.emplace_back(kTextColumns[i], std::move(processed.value));
            }
        }
        if (update.columns.empty()) {
            continue;
        }
        update.id.reset(sqlite3_value_dup(sqlite3_column_value(select.get(), 0)));
        if (!update.id) {
            throw StoreError("Failed to copy memory_records id");
        }
        updates.push_back(std::move(update));
    }
    if (rc != SQLITE_DONE) {
        throw StoreError(std::string("Failed to read memory_records: ") + sqlite3_errmsg(db));
    }
    return updates;
}

void applyRowUpdates(sqlite3* db, const std::vector<RowUpdate>& updates) {
    Transaction transaction(db);
    for (const RowUpdate& update : updates) {
        std::string sql = "UPDATE memory_records SET ";
        for (const auto& column : update.columns) {
            sql += column.first;
            sql += "=?, ";
        }
        sql += "updated=datetime('now') WHERE id=?;";

        StatementHandle stmt = prepare(db, sql);
        int index = 1;
        for (const auto& column : update.columns) {
            const std::string& text = column.second;
            if (sqlite3_bind_text(stmt.get(), index++, text.data(), static_cast<int>(text.size()), SQLITE_TRANSIENT) !=
                SQLITE_OK) {
                throw StoreError(std::string("Failed to bind ") + column.first + ": " + sqlite3_errmsg(db));
            }
        }
        if (sqlite3_bind_value(stmt.get(), index, update.id.get()) != SQLITE_OK) {
            throw StoreError(std::string("Failed to bind memory_records id: ") + sqlite3_errmsg(db));
        }
        step_done(db, stmt.get(), "UPDATE memory_records");
    }
    transaction.commit();
}

}  // namespace

int migrateMemoryRecords(const std::filesystem::path& dbPath, bool dryRun, canon::ConsentLevel defaultConsent) {
    DatabaseHandle db = open_db(dbPath.string());
    if (!table_exists(db.get(), kMemoryRecordsTable)) {
        qCDebug(ptrcanonStore, "No %s table in %s", kMemoryRecordsTable, dbPath.string().c_str());
        return 0;
    }

    const std::vector<RowUpdate> updates = collectRowUpdates(db.get(), defaultConsent);
    if (!updates.empty() && !dryRun) {
        applyRowUpdates(db.get(), updates);
        qCDebug(ptrcanonStore, "Committed %d row update(s) to %s", static_cast<int>(updates.size()),
                dbPath.string().c_str());
    }
    return static_cast<int>(updates.size());
}

}  // namespace ptrcanon::store
