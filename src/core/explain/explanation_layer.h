#pragma once

#include "core/kb/knowledge_base.h"
#include "core/shared/recommendation.h"

#include <QJsonObject>
#include <QString>
#include <vector>

namespace rw {

// Human-facing view of one ranked intervention.
struct RecommendationCard {
    int id = 0;
    QString intervention;
    QString reference;
    QString rationale;
    QString assumptions;
    QString priority;
    double relevanceScore = 0.0;   // percent, one decimal
    QString confidence;
    ScoreBreakdown breakdown;
};

// ExplanationLayer -- presentation of engine results.
//
// Owns the confidence-label binning, the JSON response shapes and the
// fallback guidance. Consumes engine output; never re-ranks it.
class ExplanationLayer {
public:
    // "Very High" >= 0.85, "High" >= 0.65, "Medium" >= threshold, else "Low".
    static QString confidenceLabel(double score,
                                   double threshold = kDefaultMinScoreThreshold);

    static RecommendationCard formatRecommendation(const RankedIntervention& ranked,
                                                   double threshold = kDefaultMinScoreThreshold);

    static std::vector<RecommendationCard> formatRecommendations(
        const RetrievalOutcome& outcome, double threshold = kDefaultMinScoreThreshold);

    static QJsonObject cardToJson(const RecommendationCard& card);

    // success / no_match / needs_more_input / invalid_argument
    static QJsonObject buildResponse(const RetrievalRequest& request,
                                     const RetrievalOutcome& outcome);

    static QJsonObject fallbackResponse(const QString& query);

    static QString reportText(const RetrievalRequest& request,
                              const std::vector<RecommendationCard>& cards);

    static QJsonObject statsToJson(const KnowledgeBaseStats& stats);
};

} // namespace rw
