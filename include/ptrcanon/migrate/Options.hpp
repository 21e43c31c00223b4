#pragma once

#include "ptrcanon/canon/Consent.hpp"

#include <QString>

#include <filesystem>
#include <string>
#include <vector>

namespace ptrcanon::migrate {

constexpr const char* kStateDirEnv = "PTRCANON_STATE_DIR";
constexpr const char* kDefaultStateDir = "state";

struct MigrationOptions {
    std::filesystem::path stateDir{kDefaultStateDir};
    bool dryRun{false};
    canon::ConsentLevel defaultConsent{canon::ConsentLevel::Private};
    std::vector<std::filesystem::path> extraJson;
    std::vector<std::string> storeExtensions{".sqlite"};
};

// Explicit value first, then $PTRCANON_STATE_DIR, then ./state.
std::filesystem::path resolveStateDir(const QString& explicitDir);

}  // namespace ptrcanon::migrate
