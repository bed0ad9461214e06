#pragma once

#include <QString>

namespace rw {

constexpr int kDefaultTopK = 3;
constexpr double kDefaultMinScoreThreshold = 0.3;

// Lowest configurable fuzzy floor; below it half of a word may differ.
constexpr double kMinFuzzyMatchFloor = 0.5;

// Configurable scoring weights. All values are on the [0,1] confidence scale.
struct ScoringWeights {
    // Road-type alignment
    double roadTypeBoost = 0.15;         // explicit road type matches the record
    double defaultRoadTypeBoost = 0.05;  // caller omitted road type, "urban" matched

    // Environment tags: scaled by the fraction of tags that overlap
    double environmentBoostCap = 0.25;

    // Priority nudge, kept well below any meaningful base-score gap
    double highPriorityWeight = 0.03;
    double mediumPriorityWeight = 0.015;
    double lowPriorityWeight = 0.005;

    // Token similarity at or below this counts as no match
    double fuzzyMatchFloor = 0.75;

    // Share of a keyword score granted by alignment alone; the remainder
    // scales with how much of the query the keyword covers.
    double keywordAlignmentShare = 0.5;
};

// Request-level defaults applied by callers when fields are left unset.
struct RetrievalDefaults {
    int topK = kDefaultTopK;
    double minScoreThreshold = kDefaultMinScoreThreshold;
    QString roadType = QStringLiteral("urban");
};

} // namespace rw
