#pragma once

#include "ptrcanon/canon/Consent.hpp"

#include <filesystem>

namespace ptrcanon::store {

constexpr const char* kMemoryRecordsTable = "memory_records";

// Canonicalize the value/extra/links/source columns of memory_records in one
// SQLite file. Returns the number of rows that need (or, unless dryRun,
// received) an update. A database without the table yields 0. All updates
// land in a single transaction.
//
// Throws StoreError when the file cannot be opened, read or updated.
int migrateMemoryRecords(const std::filesystem::path& dbPath, bool dryRun, canon::ConsentLevel defaultConsent);

}  // namespace ptrcanon::store
