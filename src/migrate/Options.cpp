#include "ptrcanon/migrate/Options.hpp"

namespace ptrcanon::migrate {

std::filesystem::path resolveStateDir(const QString& explicitDir) {
    if (!explicitDir.isEmpty()) {
        return std::filesystem::path(explicitDir.toStdString());
    }
    if (!qEnvironmentVariableIsEmpty(kStateDirEnv)) {
        return std::filesystem::path(qEnvironmentVariable(kStateDirEnv).toStdString());
    }
    return std::filesystem::path(kDefaultStateDir);
}

}  // namespace ptrcanon::migrate
