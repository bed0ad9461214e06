#include "core/ranking/scorer.h"

#include "core/query/query_normalizer.h"
#include "core/ranking/similarity.h"

#include <algorithm>

namespace rw {

Scorer::Scorer(const ScoringWeights& weights)
    : m_weights(weights)
{
}

std::vector<QString> Scorer::keywordWords(const QString& keyword)
{
    std::vector<QString> words = QueryNormalizer::tokenize(keyword);
    if (words.empty() && !keyword.isEmpty()) {
        // Keywords made only of stop words still match literally.
        words.push_back(keyword);
    }
    return words;
}

double Scorer::bestMatch(const QString& word, const std::vector<QString>& candidates) const
{
    double best = 0.0;
    for (const QString& candidate : candidates) {
        best = std::max(best, Similarity::flooredSimilarity(word, candidate,
                                                            m_weights.fuzzyMatchFloor));
        if (best >= 1.0) {
            break;
        }
    }
    return best;
}

double Scorer::computeKeywordScore(const std::vector<QString>& queryTokens,
                                   const QString& keyword) const
{
    if (queryTokens.empty()) {
        return 0.0;
    }

    const std::vector<QString> words = keywordWords(keyword);
    if (words.empty()) {
        return 0.0;
    }

    double alignmentSum = 0.0;
    for (const QString& word : words) {
        alignmentSum += bestMatch(word, queryTokens);
    }
    const double alignment = alignmentSum / static_cast<double>(words.size());
    if (alignment <= 0.0) {
        return 0.0;
    }

    // Duplicated query tokens count once per occurrence.
    int covered = 0;
    for (const QString& token : queryTokens) {
        if (bestMatch(token, words) > 0.0) {
            ++covered;
        }
    }
    const double coverage = static_cast<double>(covered)
                            / static_cast<double>(queryTokens.size());

    const double share = m_weights.keywordAlignmentShare;
    return alignment * (share + (1.0 - share) * coverage);
}

double Scorer::computeBaseScore(const std::vector<QString>& queryTokens,
                                const std::vector<QString>& issueKeywords) const
{
    double best = 0.0;
    for (const QString& keyword : issueKeywords) {
        best = std::max(best, computeKeywordScore(queryTokens, keyword));
    }
    return best;
}

double Scorer::computeRoadTypeBoost(const std::vector<QString>& recordRoadTypes,
                                    const QString& roadType, bool isDefault) const
{
    const bool applies = recordRoadTypes.empty()
        || std::find(recordRoadTypes.begin(), recordRoadTypes.end(), roadType)
               != recordRoadTypes.end();
    if (!applies) {
        return 0.0;
    }
    return isDefault ? m_weights.defaultRoadTypeBoost : m_weights.roadTypeBoost;
}

double Scorer::computeEnvironmentBoost(const std::vector<QString>& environmentTags,
                                       const std::vector<QString>& queryTokens,
                                       const std::vector<QString>& environmentTokens) const
{
    if (environmentTags.empty()) {
        return 0.0;
    }

    std::vector<QString> contextTokens = queryTokens;
    contextTokens.insert(contextTokens.end(), environmentTokens.begin(), environmentTokens.end());
    if (contextTokens.empty()) {
        return 0.0;
    }

    int overlapping = 0;
    for (const QString& tag : environmentTags) {
        const std::vector<QString> words = keywordWords(tag);
        if (words.empty()) {
            continue;
        }
        const bool allPresent = std::all_of(words.begin(), words.end(),
            [this, &contextTokens](const QString& word) {
                return bestMatch(word, contextTokens) > 0.0;
            });
        if (allPresent) {
            ++overlapping;
        }
    }

    const double fraction = static_cast<double>(overlapping)
                            / static_cast<double>(environmentTags.size());
    return m_weights.environmentBoostCap * fraction;
}

double Scorer::computePriorityWeight(Priority priority) const
{
    switch (priority) {
    case Priority::High:   return m_weights.highPriorityWeight;
    case Priority::Medium: return m_weights.mediumPriorityWeight;
    case Priority::Low:    return m_weights.lowPriorityWeight;
    }
    return 0.0;
}

ScoreBreakdown Scorer::computeScore(const InterventionRecord& record,
                                    const ScoringContext& context) const
{
    ScoreBreakdown breakdown;

    // 1. Base similarity
    breakdown.baseScore = computeBaseScore(context.queryTokens, record.issueKeywords);

    // 2. Road type
    breakdown.roadTypeBoost = computeRoadTypeBoost(record.roadTypes, context.roadType,
                                                   context.roadTypeIsDefault);

    // 3. Environment
    breakdown.environmentBoost = computeEnvironmentBoost(record.environmentTags,
                                                         context.queryTokens,
                                                         context.environmentTokens);

    // 4. Priority
    breakdown.priorityWeight = computePriorityWeight(record.priority);

    const double sum = breakdown.baseScore
                       + breakdown.roadTypeBoost
                       + breakdown.environmentBoost
                       + breakdown.priorityWeight;
    breakdown.finalScore = std::clamp(sum, 0.0, 1.0);

    return breakdown;
}

} // namespace rw
