#pragma once

#include "core/shared/intervention.h"
#include "core/shared/recommendation.h"
#include "core/shared/scoring_types.h"

#include <QString>
#include <vector>

namespace rw {

// Query-side inputs to scoring, already normalized by the caller.
struct ScoringContext {
    std::vector<QString> queryTokens;
    QString roadType;                        // normalized; "urban" when defaulted
    bool roadTypeIsDefault = false;
    std::vector<QString> environmentTokens;  // tokens of the supplied environment
};

// Pure scoring over immutable inputs. No state beyond the weights.
class Scorer {
public:
    explicit Scorer(const ScoringWeights& weights = {});

    // Full breakdown for one record:
    //   final = clamp(base + roadType + environment + priority, 0, 1)
    ScoreBreakdown computeScore(const InterventionRecord& record,
                                const ScoringContext& context) const;

    // Best keyword score over the record's keyword set.
    double computeBaseScore(const std::vector<QString>& queryTokens,
                            const std::vector<QString>& issueKeywords) const;

    // alignment * (share + (1 - share) * coverage), see keywordAlignmentShare.
    double computeKeywordScore(const std::vector<QString>& queryTokens,
                               const QString& keyword) const;

    double computeRoadTypeBoost(const std::vector<QString>& recordRoadTypes,
                                const QString& roadType, bool isDefault) const;

    // environmentBoostCap * (overlapping tags / all tags)
    double computeEnvironmentBoost(const std::vector<QString>& environmentTags,
                                   const std::vector<QString>& queryTokens,
                                   const std::vector<QString>& environmentTokens) const;

    double computePriorityWeight(Priority priority) const;

    const ScoringWeights& weights() const { return m_weights; }

private:
    ScoringWeights m_weights;

    // Best floored similarity of word against any of the candidates.
    double bestMatch(const QString& word, const std::vector<QString>& candidates) const;

    static std::vector<QString> keywordWords(const QString& keyword);
};

} // namespace rw
