#include "ptrcanon/canon/Token.hpp"

#include <QByteArrayView>
#include <QString>
#include <QStringDecoder>

#include <utility>

namespace ptrcanon::canon {

Canonicalized<std::string> canonicalizePointer(const std::string& token) {
    // Decoding would substitute U+FFFD for bad bytes; leave such input alone.
    QStringDecoder decoder(QStringConverter::Utf8,
                           QStringConverter::Flag::Stateless | QStringConverter::Flag::ConvertInitialBom);
    const QString decoded = decoder.decode(QByteArrayView(token.data(), static_cast<qsizetype>(token.size())));
    if (decoder.hasError()) {
        return {token, false};
    }

    QString normalized = decoded.normalized(QString::NormalizationForm_KC);
    normalized.replace(QStringLiteral("\r\n"), QStringLiteral("\n"));

    if (static_cast<std::size_t>(normalized.toUcs4().size()) > kMaxPointerLength ||
        !normalized.startsWith(QLatin1String("<@")) || !normalized.endsWith(QLatin1Char('>'))) {
        return {token, false};
    }

    const QString interior = normalized.mid(2, normalized.size() - 3);
    const qsizetype colon = interior.indexOf(QLatin1Char(':'));
    if (colon < 0) {
        return {token, false};
    }

    const QString canonical = QStringLiteral("<@") + interior.left(colon).toLower() + QLatin1Char(':') +
                              interior.mid(colon + 1) + QLatin1Char('>');
    std::string result = canonical.toStdString();
    const bool changed = result != token;
    return {std::move(result), changed};
}

}  // namespace ptrcanon::canon
