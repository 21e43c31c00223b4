#pragma once

#include "ptrcanon/canon/Consent.hpp"
#include "ptrcanon/canon/JsonWalker.hpp"
#include "ptrcanon/canon/Token.hpp"

#include <string>

namespace ptrcanon::canon {

// Serialize with object keys sorted at every depth, ", " and ": " separators
// and non-ASCII text kept as UTF-8. Output is byte-stable for equal values.
std::string dumpCanonical(const Json& value);

// Canonicalize a stored document. JSON text is walked and re-serialized only
// when the walk changed something; text that does not parse as JSON is
// scanned for embedded tokens instead.
Canonicalized<std::string> processDocument(const std::string& text, ConsentLevel defaultConsent);

}  // namespace ptrcanon::canon
