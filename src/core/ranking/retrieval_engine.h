#pragma once

#include "core/kb/knowledge_base.h"
#include "core/ranking/scorer.h"
#include "core/shared/recommendation.h"
#include "core/shared/scoring_types.h"

#include <QString>
#include <vector>

namespace rw {

class KnowledgeBaseHandle;

// RetrievalEngine -- turns a request into a ranked top-K of interventions.
//
// Stateless: every call is a deterministic function of the request and the
// knowledge base it is given. Order is (score DESC, priority DESC, id ASC).
class RetrievalEngine {
public:
    explicit RetrievalEngine(const ScoringWeights& weights = {},
                             const QString& defaultRoadType = QStringLiteral("urban"));

    RetrievalOutcome retrieveAndRank(const KnowledgeBase& kb,
                                     const RetrievalRequest& request) const;

    // Pins the handle's current snapshot for the duration of the call.
    RetrievalOutcome retrieveAndRank(const KnowledgeBaseHandle& handle,
                                     const RetrievalRequest& request) const;

    // True iff the top-ranked score reaches threshold.
    static bool checkMinimumThreshold(const std::vector<RankedIntervention>& ranked,
                                      double threshold = kDefaultMinScoreThreshold);

    // Sort by (score DESC, priority DESC, id ASC).
    static void sortRanked(std::vector<RankedIntervention>& ranked);

    const Scorer& scorer() const { return m_scorer; }
    const QString& defaultRoadType() const { return m_defaultRoadType; }

private:
    struct ScoredCandidate {
        const InterventionRecord* record = nullptr;
        ScoreBreakdown breakdown;
    };

    static bool ranksBefore(double scoreA, Priority priorityA, int idA,
                            double scoreB, Priority priorityB, int idB);

    Scorer m_scorer;
    QString m_defaultRoadType;
};

} // namespace rw
