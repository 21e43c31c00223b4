#include "ptrcanon/canon/Consent.hpp"

namespace ptrcanon::canon {

const char* toString(ConsentLevel level) {
    switch (level) {
        case ConsentLevel::Private:
            return "private";
        case ConsentLevel::Shared:
            return "shared";
        case ConsentLevel::Public:
            return "public";
    }
    return "private";
}

std::optional<ConsentLevel> parseConsentLevel(const std::string& text) {
    if (text == "private") {
        return ConsentLevel::Private;
    }
    if (text == "shared") {
        return ConsentLevel::Shared;
    }
    if (text == "public") {
        return ConsentLevel::Public;
    }
    return std::nullopt;
}

}  // namespace ptrcanon::canon
