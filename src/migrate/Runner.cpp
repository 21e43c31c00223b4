#include "ptrcanon/migrate/Runner.hpp"

#include "ptrcanon/store/JsonFiles.hpp"
#include "ptrcanon/store/RecordTable.hpp"
#include "ptrcanon/store/SqliteStore.hpp"

#include <algorithm>
#include <set>
#include <system_error>
#include <utility>

Q_LOGGING_CATEGORY(ptrcanonMigrate, "ptrcanon.migrate")

namespace fs = std::filesystem;

namespace ptrcanon::migrate {

namespace {

// Regular files under `root` accepted by `keep`, sorted. Unreadable
// directories are skipped.
template <typename Predicate>
std::vector<fs::path> collectFiles(const fs::path& root, Predicate keep) {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return files;
    }

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    const fs::recursive_directory_iterator end;
    while (!ec && it != end) {
        std::error_code typeEc;
        if (it->is_regular_file(typeEc) && keep(it->path())) {
            files.push_back(it->path());
        }
        it.increment(ec);
    }
    if (ec) {
        qCWarning(ptrcanonMigrate, "Stopped scanning %s: %s", root.string().c_str(), ec.message().c_str());
    }
    std::sort(files.begin(), files.end());
    return files;
}

fs::path identityOf(const fs::path& path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    return (ec ? path : absolute).lexically_normal();
}

}  // namespace

MigrationRunner::MigrationRunner(MigrationOptions options) : m_options(std::move(options)) {}

bool MigrationRunner::isStoreFile(const fs::path& path) const {
    const std::string extension = path.extension().string();
    return std::find(m_options.storeExtensions.begin(), m_options.storeExtensions.end(), extension) !=
           m_options.storeExtensions.end();
}

const char* MigrationRunner::modeVerb() const {
    return m_options.dryRun ? "would update" : "updated";
}

std::vector<fs::path> MigrationRunner::discoverStores() const {
    return collectFiles(m_options.stateDir, [this](const fs::path& path) { return isStoreFile(path); });
}

std::vector<fs::path> MigrationRunner::discoverJsonFiles() const {
    std::vector<fs::path> targets;
    std::set<fs::path> seen;
    auto add = [&](const fs::path& path) {
        if (seen.insert(identityOf(path)).second) {
            targets.push_back(path);
        }
    };

    for (const auto& extra : m_options.extraJson) {
        add(extra);
    }
    const auto configFiles =
        collectFiles(m_options.stateDir / "config", [](const fs::path& path) { return path.extension() == ".json"; });
    for (const auto& path : configFiles) {
        add(path);
    }
    return targets;
}

MigrationReport MigrationRunner::run() const {
    MigrationReport report;

    std::error_code ec;
    if (!fs::exists(m_options.stateDir, ec)) {
        qCWarning(ptrcanonMigrate, "state directory %s does not exist", m_options.stateDir.string().c_str());
    }

    for (const auto& storePath : discoverStores()) {
        ++report.storesScanned;
        int updatedRows = 0;
        try {
            updatedRows = store::migrateMemoryRecords(storePath, m_options.dryRun, m_options.defaultConsent);
        } catch (const store::StoreError& e) {
            qCWarning(ptrcanonMigrate, "skipping %s: %s", storePath.string().c_str(), e.what());
            ++report.storesSkipped;
            continue;
        }
        if (updatedRows > 0) {
            qCInfo(ptrcanonMigrate, "%s %d memory record(s) in %s", modeVerb(), updatedRows, storePath.string().c_str());
            report.changedRecords += updatedRows;
        }
    }

    const store::FileMigrationResult files =
        store::migrateJsonFiles(discoverJsonFiles(), m_options.dryRun, m_options.defaultConsent);
    report.changedFiles = static_cast<int>(files.changed.size());
    report.filesFailed = static_cast<int>(files.failed.size());
    if (report.changedFiles > 0) {
        qCInfo(ptrcanonMigrate, "%s %d JSON file(s)", modeVerb(), report.changedFiles);
    }

    qCInfo(ptrcanonMigrate, "%s; %s %d record(s) and %d JSON file(s)",
           m_options.dryRun ? "dry-run complete" : "migration complete", modeVerb(), report.changedRecords,
           report.changedFiles);
    return report;
}

}  // namespace ptrcanon::migrate
