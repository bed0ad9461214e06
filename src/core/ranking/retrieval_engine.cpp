#include "core/ranking/retrieval_engine.h"

#include "core/kb/knowledge_base_handle.h"
#include "core/query/query_normalizer.h"

#include <algorithm>
#include <cmath>

namespace rw {

namespace {

RetrievalOutcome invalid(RetrievalOutcome::Status status, const QString& message)
{
    RetrievalOutcome outcome;
    outcome.status = status;
    outcome.errorMessage = message;
    return outcome;
}

} // namespace

RetrievalEngine::RetrievalEngine(const ScoringWeights& weights, const QString& defaultRoadType)
    : m_scorer(weights)
    , m_defaultRoadType(normalizeTag(defaultRoadType))
{
}

bool RetrievalEngine::ranksBefore(double scoreA, Priority priorityA, int idA,
                                  double scoreB, Priority priorityB, int idB)
{
    if (scoreA != scoreB) {
        return scoreA > scoreB;
    }
    if (priorityA != priorityB) {
        return priorityRank(priorityA) > priorityRank(priorityB);
    }
    return idA < idB;
}

void RetrievalEngine::sortRanked(std::vector<RankedIntervention>& ranked)
{
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const RankedIntervention& a, const RankedIntervention& b) {
                         return ranksBefore(a.score, a.record.priority, a.record.id,
                                            b.score, b.record.priority, b.record.id);
                     });
}

bool RetrievalEngine::checkMinimumThreshold(const std::vector<RankedIntervention>& ranked,
                                            double threshold)
{
    return !ranked.empty() && ranked.front().score >= threshold;
}

RetrievalOutcome RetrievalEngine::retrieveAndRank(const KnowledgeBaseHandle& handle,
                                                  const RetrievalRequest& request) const
{
    const std::shared_ptr<const KnowledgeBase> snapshot = handle.snapshot();
    return retrieveAndRank(*snapshot, request);
}

RetrievalOutcome RetrievalEngine::retrieveAndRank(const KnowledgeBase& kb,
                                                  const RetrievalRequest& request) const
{
    if (request.topK < 1) {
        return invalid(RetrievalOutcome::Status::InvalidArgument,
                       QStringLiteral("top_k must be at least 1, got %1").arg(request.topK));
    }
    if (std::isnan(request.minScoreThreshold)
        || request.minScoreThreshold < 0.0 || request.minScoreThreshold > 1.0) {
        return invalid(RetrievalOutcome::Status::InvalidArgument,
                       QStringLiteral("min_score_threshold must be within [0, 1], got %1")
                           .arg(request.minScoreThreshold));
    }

    ScoringContext context;
    context.queryTokens = QueryNormalizer::tokenize(request.queryText);
    if (context.queryTokens.empty()) {
        return invalid(RetrievalOutcome::Status::EmptyQuery,
                       QStringLiteral("Query has no searchable words"));
    }

    const QString explicitRoadType = request.roadType.has_value()
        ? normalizeTag(*request.roadType) : QString();
    context.roadTypeIsDefault = explicitRoadType.isEmpty();
    context.roadType = context.roadTypeIsDefault ? m_defaultRoadType : explicitRoadType;

    if (request.environment.has_value()) {
        context.environmentTokens = QueryNormalizer::tokenize(*request.environment);
    }

    std::vector<ScoredCandidate> candidates;
    candidates.reserve(kb.getAll().size());
    for (const InterventionRecord& record : kb.getAll()) {
        ScoreBreakdown breakdown = m_scorer.computeScore(record, context);
        // Boosts alone never surface a record no query word matched.
        if (breakdown.baseScore <= 0.0) {
            continue;
        }
        candidates.push_back(ScoredCandidate{&record, breakdown});
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const ScoredCandidate& a, const ScoredCandidate& b) {
                         return ranksBefore(a.breakdown.finalScore, a.record->priority,
                                            a.record->id,
                                            b.breakdown.finalScore, b.record->priority,
                                            b.record->id);
                     });

    const size_t keep = std::min(candidates.size(), static_cast<size_t>(request.topK));

    RetrievalOutcome outcome;
    outcome.status = RetrievalOutcome::Status::Ok;
    outcome.queryTokens = context.queryTokens;
    outcome.effectiveRoadType = context.roadType;
    outcome.usedDefaultRoadType = context.roadTypeIsDefault;
    outcome.results.reserve(keep);
    for (size_t i = 0; i < keep; ++i) {
        RankedIntervention ranked;
        ranked.record = *candidates[i].record;
        ranked.breakdown = candidates[i].breakdown;
        ranked.score = candidates[i].breakdown.finalScore;
        outcome.results.push_back(std::move(ranked));
    }
    outcome.confident = checkMinimumThreshold(outcome.results, request.minScoreThreshold);

    return outcome;
}

} // namespace rw
