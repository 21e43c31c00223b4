#pragma once

#include "ptrcanon/migrate/Options.hpp"

#include <QLoggingCategory>

#include <filesystem>
#include <vector>

Q_DECLARE_LOGGING_CATEGORY(ptrcanonMigrate)

namespace ptrcanon::migrate {

struct MigrationReport {
    int changedRecords = 0;
    int changedFiles = 0;
    int storesScanned = 0;
    int storesSkipped = 0;
    int filesFailed = 0;
};

/**
 * Drives one migration over a state directory.
 * Algorithm: Discover stores → Migrate rows per store → Collect JSON files →
 * Migrate files → Log summary
 *
 * Units are processed one at a time. A store or file that fails is logged and
 * skipped; run() itself always completes.
 */
class MigrationRunner
{
public:
    explicit MigrationRunner(MigrationOptions options);

    MigrationReport run() const;

    // Row-store files anywhere under the state directory, sorted.
    std::vector<std::filesystem::path> discoverStores() const;

    // Extra JSON paths first, then <state>/config/**/*.json sorted; each file once.
    std::vector<std::filesystem::path> discoverJsonFiles() const;

    const MigrationOptions& options() const { return m_options; }

private:
    bool isStoreFile(const std::filesystem::path& path) const;
    const char* modeVerb() const;

    MigrationOptions m_options;
};

}  // namespace ptrcanon::migrate
