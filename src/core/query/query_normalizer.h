#pragma once

#include <QString>
#include <vector>

namespace rw {

struct NormalizedQuery {
    QString original;
    QString normalized;            // tokens joined by single spaces
    std::vector<QString> tokens;   // in query order, duplicates kept
};

class QueryNormalizer {
public:
    // Lower-case, strip punctuation, split on whitespace, drop tokens shorter
    // than kMinTokenLength and stop words.
    static NormalizedQuery normalize(const QString& raw);

    static std::vector<QString> tokenize(const QString& raw);

    static bool isStopWord(const QString& token);

    static constexpr int kMinTokenLength = 2;
};

} // namespace rw
