#pragma once

#include <QString>

namespace rw {

// Normalized edit-distance similarity between single tokens.
class Similarity {
public:
    // Optimal string alignment (restricted Damerau-Levenshtein) distance,
    // capped at maxDist+1 for early exit.
    static int editDistance(const QString& a, const QString& b, int maxDist);

    // 1 - distance / max(|a|, |b|), in [0,1]. Two empty strings score 1.
    static double tokenSimilarity(const QString& a, const QString& b);

    // tokenSimilarity, or 0 unless it is strictly above floor.
    static double flooredSimilarity(const QString& a, const QString& b, double floor);
};

} // namespace rw
