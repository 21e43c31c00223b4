#include "ptrcanon/canon/JsonWalker.hpp"

#include "ptrcanon/canon/TextScanner.hpp"
#include "ptrcanon/canon/Token.hpp"

#include <QLoggingCategory>
#include <QString>

#include <string>
#include <utility>
#include <vector>

Q_LOGGING_CATEGORY(ptrcanonCanon, "ptrcanon.canon")

namespace ptrcanon::canon {

namespace {

constexpr const char* kPointerKey = "pointer";
constexpr const char* kConsentKey = "consent";
constexpr const char* kDomainKey = "domain";

bool canonicalizeEmbedded(Json& value) {
    Canonicalized<std::string> scanned = canonicalizeText(value.get_ref<const std::string&>());
    if (scanned.changed) {
        value = std::move(scanned.value);
    }
    return scanned.changed;
}

// Whole-string tier: only a string that is exactly one token. A rewritten
// value is scanned again so that `<@A:x\n<@B:y>` ends at a fixed point.
bool canonicalizeWholeToken(Json& value) {
    Canonicalized<std::string> exact = canonicalizePointer(value.get_ref<const std::string&>());
    if (!exact.changed || exact.value.find('>') != exact.value.size() - 1) {
        return false;
    }
    Canonicalized<std::string> rescanned = canonicalizeText(exact.value);
    value = rescanned.changed ? std::move(rescanned.value) : std::move(exact.value);
    return true;
}

bool foldDomain(Json& object) {
    auto domain = object.find(kDomainKey);
    if (domain == object.end() || !domain->is_string()) {
        return false;
    }
    const std::string& current = domain->get_ref<const std::string&>();
    std::string lowered = QString::fromStdString(current).toLower().toStdString();
    if (lowered == current) {
        return false;
    }
    *domain = std::move(lowered);
    return true;
}

bool canonicalizeObject(Json& object, ConsentLevel defaultConsent) {
    // Members added during the walk (consent) are not visited.
    std::vector<std::string> keys;
    keys.reserve(object.size());
    for (auto it = object.begin(); it != object.end(); ++it) {
        keys.push_back(it.key());
    }

    bool changed = false;
    for (const std::string& key : keys) {
        Json& member = object[key];
        switch (member.type()) {
            case Json::value_t::string: {
                if (!canonicalizeWholeToken(member)) {
                    changed = canonicalizeEmbedded(member) || changed;
                    break;
                }
                changed = true;
                // Inserting may reallocate the members; `member` is not used past here.
                if (key == kPointerKey && !object.contains(kConsentKey)) {
                    object[kConsentKey] = toString(defaultConsent);
                    qCDebug(ptrcanonCanon, "Added consent=%s next to rewritten pointer", toString(defaultConsent));
                }
                break;
            }
            case Json::value_t::object:
            case Json::value_t::array:
                changed = canonicalizeJson(member, defaultConsent) || changed;
                break;
            case Json::value_t::null:
            case Json::value_t::boolean:
            case Json::value_t::number_integer:
            case Json::value_t::number_unsigned:
            case Json::value_t::number_float:
            case Json::value_t::binary:
            case Json::value_t::discarded:
                break;
        }
    }

    return foldDomain(object) || changed;
}

}  // namespace

bool canonicalizeJson(Json& value, ConsentLevel defaultConsent) {
    switch (value.type()) {
        case Json::value_t::object:
            return canonicalizeObject(value, defaultConsent);
        case Json::value_t::array: {
            bool changed = false;
            for (Json& element : value) {
                changed = canonicalizeJson(element, defaultConsent) || changed;
            }
            return changed;
        }
        case Json::value_t::string:
            return canonicalizeEmbedded(value);
        case Json::value_t::null:
        case Json::value_t::boolean:
        case Json::value_t::number_integer:
        case Json::value_t::number_unsigned:
        case Json::value_t::number_float:
        case Json::value_t::binary:
        case Json::value_t::discarded:
            return false;
    }
    return false;
}

}  // namespace ptrcanon::canon
