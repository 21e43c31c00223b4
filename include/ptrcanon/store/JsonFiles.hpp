#pragma once

#include "ptrcanon/canon/Consent.hpp"

#include <filesystem>
#include <vector>

namespace ptrcanon::store {

struct FileMigrationResult {
    std::vector<std::filesystem::path> changed;
    std::vector<std::filesystem::path> failed;
};

// Canonicalize one whole-document file. Returns true when the content needs
// (or, unless dryRun, received) a rewrite. Rewritten files end with exactly
// one newline. Throws std::runtime_error on read or write failure.
bool migrateJsonFile(const std::filesystem::path& path, bool dryRun, canon::ConsentLevel defaultConsent);

// Run migrateJsonFile over every path. A failing file is logged and recorded
// in `failed`; the remaining files are still processed.
FileMigrationResult migrateJsonFiles(const std::vector<std::filesystem::path>& paths, bool dryRun,
                                     canon::ConsentLevel defaultConsent);

}  // namespace ptrcanon::store
