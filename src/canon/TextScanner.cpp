#include "ptrcanon/canon/TextScanner.hpp"

#include <QByteArrayView>
#include <QChar>
#include <QString>
#include <QStringDecoder>

#include <string_view>
#include <utility>

namespace ptrcanon::canon {

namespace {

constexpr std::size_t kMaxTokenBody = kMaxPointerLength - 1;

bool isTokenSpace(char32_t codePoint) {
    // U+001C..U+001F count as whitespace for token boundaries too.
    return (codePoint >= 0x1C && codePoint <= 0x1F) || QChar::isSpace(codePoint);
}

// Byte length of the token whose "<@" starts at `start`, or 0 when the text
// there is not <@ + 1..255 non-space, non-'>' code points + '>'.
std::size_t matchTokenAt(const std::string& text, std::size_t start) {
    // 255 code points take at most 1020 bytes of UTF-8.
    const std::size_t bodyStart = start + 2;
    const std::size_t window = std::string_view(text).substr(bodyStart, kMaxTokenBody * 4 + 1).find('>');
    if (window == std::string_view::npos || window == 0) {
        return 0;
    }
    const std::size_t close = bodyStart + window;

    // A body with bad bytes is never a token.
    QStringDecoder decoder(QStringConverter::Utf8,
                           QStringConverter::Flag::Stateless | QStringConverter::Flag::ConvertInitialBom);
    const QString body =
        decoder.decode(QByteArrayView(text.data() + bodyStart, static_cast<qsizetype>(close - bodyStart)));
    if (decoder.hasError()) {
        return 0;
    }

    std::size_t bodyLength = 0;
    for (char32_t codePoint : body.toUcs4()) {
        if (isTokenSpace(codePoint) || ++bodyLength > kMaxTokenBody) {
            return 0;
        }
    }
    return close + 1 - start;
}

}  // namespace

Canonicalized<std::string> canonicalizeText(const std::string& text) {
    std::string rebuilt;
    bool matched = false;
    bool changed = false;
    std::size_t copied = 0;

    std::size_t pos = text.find("<@");
    while (pos != std::string::npos) {
        const std::size_t length = matchTokenAt(text, pos);
        if (length == 0) {
            pos = text.find("<@", pos + 1);
            continue;
        }

        if (!matched) {
            rebuilt.reserve(text.size());
            matched = true;
        }
        rebuilt.append(text, copied, pos - copied);
        Canonicalized<std::string> token = canonicalizePointer(text.substr(pos, length));
        changed = changed || token.changed;
        rebuilt += token.value;

        copied = pos + length;
        pos = text.find("<@", copied);
    }

    if (!matched) {
        return {text, false};
    }
    rebuilt.append(text, copied, std::string::npos);
    return {std::move(rebuilt), changed};
}

}  // namespace ptrcanon::canon
