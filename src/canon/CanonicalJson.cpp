#include "ptrcanon/canon/CanonicalJson.hpp"

#include "ptrcanon/canon/TextScanner.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace ptrcanon::canon {

namespace {

void writeCanonical(const Json& value, std::string& out) {
    switch (value.type()) {
        case Json::value_t::object: {
            std::vector<std::pair<const std::string*, const Json*>> members;
            members.reserve(value.size());
            for (auto it = value.begin(); it != value.end(); ++it) {
                members.emplace_back(&it.key(), &it.value());
            }
            std::sort(members.begin(), members.end(),
                      [](const auto& lhs, const auto& rhs) { return *lhs.first < *rhs.first; });

            out.push_back('{');
            for (std::size_t i = 0; i < members.size(); ++i) {
                if (i > 0) {
                    out += ", ";
                }
                out += Json(*members[i].first).dump();
                out += ": ";
                writeCanonical(*members[i].second, out);
            }
            out.push_back('}');
            break;
        }
        case Json::value_t::array: {
            out.push_back('[');
            bool first = true;
            for (const Json& element : value) {
                if (!first) {
                    out += ", ";
                }
                first = false;
                writeCanonical(element, out);
            }
            out.push_back(']');
            break;
        }
        case Json::value_t::null:
        case Json::value_t::boolean:
        case Json::value_t::string:
        case Json::value_t::number_integer:
        case Json::value_t::number_unsigned:
        case Json::value_t::number_float:
        case Json::value_t::binary:
        case Json::value_t::discarded:
            out += value.dump();
            break;
    }
}

}  // namespace

std::string dumpCanonical(const Json& value) {
    std::string out;
    writeCanonical(value, out);
    return out;
}

Canonicalized<std::string> processDocument(const std::string& text, ConsentLevel defaultConsent) {
    Json document = Json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return canonicalizeText(text);
    }
    if (!canonicalizeJson(document, defaultConsent)) {
        return {text, false};
    }

    std::string serialized = dumpCanonical(document);
    const bool changed = serialized != text;
    return {std::move(serialized), changed};
}

}  // namespace ptrcanon::canon
