#pragma once

#include "ptrcanon/canon/Consent.hpp"

#include <nlohmann/json.hpp>

namespace ptrcanon::canon {

// Objects keep their key insertion order while being walked.
using Json = nlohmann::ordered_json;

// Recursively canonicalize pointer tokens inside a JSON value, in place.
//
// Object string members first try the whole string as one token; only when
// that changes nothing is the string scanned for embedded tokens. A member
// named "pointer" rewritten by the whole-token pass gets `consent` set to
// defaultConsent unless the object already carries one. A string `domain`
// member is lowercased. Returns true if anything at or below `value` changed.
bool canonicalizeJson(Json& value, ConsentLevel defaultConsent);

}  // namespace ptrcanon::canon
