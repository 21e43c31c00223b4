#pragma once

#include <cstddef>
#include <string>

namespace ptrcanon::canon {

// Longest accepted pointer token, in code points, after normalization.
constexpr std::size_t kMaxPointerLength = 256;

// A rewritten value paired with whether it differs from the input.
template <typename T>
struct Canonicalized {
    T value;
    bool changed{false};
};

// Normalize a single `<@prefix:remainder>` token (NFKC, CRLF -> LF, prefix
// lowercased). Anything that is not a well-formed token comes back untouched
// with changed == false.
Canonicalized<std::string> canonicalizePointer(const std::string& token);

}  // namespace ptrcanon::canon
