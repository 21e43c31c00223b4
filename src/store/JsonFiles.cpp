#include "ptrcanon/store/JsonFiles.hpp"

#include "ptrcanon/canon/CanonicalJson.hpp"
#include "ptrcanon/store/SqliteStore.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

namespace ptrcanon::store {

namespace {

std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to open " + path.string() + " for reading");
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw std::runtime_error("Failed to read " + path.string());
    }
    return text;
}

void writeFile(const std::filesystem::path& path, std::string text) {
    while (!text.empty() && text.back() == '\n') {
        text.pop_back();
    }
    text.push_back('\n');

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Failed to open " + path.string() + " for writing");
    }
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.close();
    if (!out) {
        throw std::runtime_error("Failed to write " + path.string());
    }
}

}  // namespace

bool migrateJsonFile(const std::filesystem::path& path, bool dryRun, canon::ConsentLevel defaultConsent) {
    const std::string original = readFile(path);
    canon::Canonicalized<std::string> processed = canon::processDocument(original, defaultConsent);
    if (!processed.changed) {
        return false;
    }
    if (!dryRun) {
        writeFile(path, std::move(processed.value));
        qCDebug(ptrcanonStore, "Rewrote %s", path.string().c_str());
    }
    return true;
}

FileMigrationResult migrateJsonFiles(const std::vector<std::filesystem::path>& paths, bool dryRun,
                                     canon::ConsentLevel defaultConsent) {
    FileMigrationResult result;
    for (const auto& path : paths) {
        try {
            if (migrateJsonFile(path, dryRun, defaultConsent)) {
                result.changed.push_back(path);
            }
        } catch (const std::exception& e) {
            qCWarning(ptrcanonStore, "skipping %s: %s", path.string().c_str(), e.what());
            result.failed.push_back(path);
        }
    }
    return result;
}

}  // namespace ptrcanon::store
