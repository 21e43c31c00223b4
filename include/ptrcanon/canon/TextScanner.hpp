#pragma once

#include "ptrcanon/canon/Token.hpp"

#include <string>

namespace ptrcanon::canon {

// Canonicalize every pointer token embedded in free text. Bytes outside the
// matched tokens are copied through verbatim.
Canonicalized<std::string> canonicalizeText(const std::string& text);

}  // namespace ptrcanon::canon
