#include "core/query/query_normalizer.h"

#include <QSet>

namespace rw {

namespace {

bool isDroppedApostrophe(QChar ch)
{
    switch (ch.unicode()) {
    case '\'':
    case '`':
    case 0x2018:
    case 0x2019:
        return true;
    default:
        return false;
    }
}

const QSet<QString>& stopWords()
{
    static const QSet<QString> words = {
        QStringLiteral("a"),     QStringLiteral("an"),    QStringLiteral("and"),
        QStringLiteral("are"),   QStringLiteral("as"),    QStringLiteral("at"),
        QStringLiteral("be"),    QStringLiteral("been"),  QStringLiteral("by"),
        QStringLiteral("for"),   QStringLiteral("from"),  QStringLiteral("has"),
        QStringLiteral("have"),  QStringLiteral("in"),    QStringLiteral("into"),
        QStringLiteral("is"),    QStringLiteral("it"),    QStringLiteral("its"),
        QStringLiteral("of"),    QStringLiteral("on"),    QStringLiteral("or"),
        QStringLiteral("that"),  QStringLiteral("the"),   QStringLiteral("their"),
        QStringLiteral("there"), QStringLiteral("this"),  QStringLiteral("to"),
        QStringLiteral("was"),   QStringLiteral("were"),  QStringLiteral("with"),
    };
    return words;
}

} // namespace

bool QueryNormalizer::isStopWord(const QString& token)
{
    return stopWords().contains(token);
}

std::vector<QString> QueryNormalizer::tokenize(const QString& raw)
{
    std::vector<QString> tokens;
    QString current;

    auto flush = [&tokens, &current]() {
        if (current.size() >= kMinTokenLength && !isStopWord(current)) {
            tokens.push_back(current);
        }
        current.clear();
    };

    for (const QChar ch : raw) {
        if (isDroppedApostrophe(ch)) {
            continue;
        }
        if (ch.isLetterOrNumber()) {
            current.append(ch.toLower());
            continue;
        }
        // Whitespace and every other punctuation mark separate tokens.
        flush();
    }
    flush();

    return tokens;
}

NormalizedQuery QueryNormalizer::normalize(const QString& raw)
{
    NormalizedQuery result;
    result.original = raw;
    result.tokens = tokenize(raw);

    QString normalized;
    for (const QString& token : result.tokens) {
        if (!normalized.isEmpty()) {
            normalized.append(QLatin1Char(' '));
        }
        normalized.append(token);
    }
    result.normalized = normalized;
    return result;
}

} // namespace rw
