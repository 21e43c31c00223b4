#pragma once

#include <optional>
#include <string>

namespace ptrcanon::canon {

enum class ConsentLevel {
    Private,
    Shared,
    Public,
};

const char* toString(ConsentLevel level);

// Accepts exactly "private", "shared" or "public".
std::optional<ConsentLevel> parseConsentLevel(const std::string& text);

}  // namespace ptrcanon::canon
