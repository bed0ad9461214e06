#include "core/explain/explanation_layer.h"
#include "core/shared/logging.h"

#include <QJsonArray>
#include <QStringList>

#include <cmath>

namespace rw {

namespace {

const QString kRule = QString(70, QLatin1Char('='));
const QString kDivider = QString(70, QLatin1Char('-'));

QJsonObject breakdownToJson(const ScoreBreakdown& breakdown)
{
    QJsonObject json;
    json.insert(QStringLiteral("base"), breakdown.baseScore);
    json.insert(QStringLiteral("road_type_boost"), breakdown.roadTypeBoost);
    json.insert(QStringLiteral("environment_boost"), breakdown.environmentBoost);
    json.insert(QStringLiteral("priority_weight"), breakdown.priorityWeight);
    json.insert(QStringLiteral("final"), breakdown.finalScore);
    return json;
}

QJsonObject errorResponse(const QString& status, const QString& message)
{
    QJsonObject json;
    json.insert(QStringLiteral("status"), status);
    json.insert(QStringLiteral("message"), message);
    return json;
}

} // namespace

QString ExplanationLayer::confidenceLabel(double score, double threshold)
{
    if (score < threshold) {
        return QStringLiteral("Low");
    }
    if (score >= 0.85) {
        return QStringLiteral("Very High");
    }
    if (score >= 0.65) {
        return QStringLiteral("High");
    }
    return QStringLiteral("Medium");
}

RecommendationCard ExplanationLayer::formatRecommendation(const RankedIntervention& ranked,
                                                          double threshold)
{
    RecommendationCard card;
    card.id = ranked.record.id;
    card.intervention = ranked.record.interventionText;
    card.reference = ranked.record.reference;
    card.rationale = ranked.record.rationale;
    card.assumptions = ranked.record.assumptions;
    card.priority = priorityToString(ranked.record.priority);
    card.relevanceScore = std::round(ranked.score * 1000.0) / 10.0;
    card.confidence = confidenceLabel(ranked.score, threshold);
    card.breakdown = ranked.breakdown;
    return card;
}

std::vector<RecommendationCard> ExplanationLayer::formatRecommendations(
    const RetrievalOutcome& outcome, double threshold)
{
    std::vector<RecommendationCard> cards;
    cards.reserve(outcome.results.size());
    for (const RankedIntervention& ranked : outcome.results) {
        cards.push_back(formatRecommendation(ranked, threshold));
    }
    return cards;
}

QJsonObject ExplanationLayer::cardToJson(const RecommendationCard& card)
{
    QJsonObject json;
    json.insert(QStringLiteral("id"), card.id);
    json.insert(QStringLiteral("intervention"), card.intervention);
    json.insert(QStringLiteral("reference"), card.reference);
    json.insert(QStringLiteral("rationale"), card.rationale);
    json.insert(QStringLiteral("assumptions"), card.assumptions);
    json.insert(QStringLiteral("priority"), card.priority);
    json.insert(QStringLiteral("relevance_score"), card.relevanceScore);
    json.insert(QStringLiteral("confidence"), card.confidence);
    json.insert(QStringLiteral("score_breakdown"), breakdownToJson(card.breakdown));
    return json;
}

QJsonObject ExplanationLayer::fallbackResponse(const QString& query)
{
    QJsonObject json;
    json.insert(QStringLiteral("status"), QStringLiteral("no_match"));
    json.insert(QStringLiteral("query"), query);
    json.insert(QStringLiteral("message"),
                QStringLiteral("No direct IRC-aligned intervention found in knowledge base."));
    json.insert(QStringLiteral("suggestions"), QJsonArray{
        QStringLiteral("Refine your query with specific road type (urban/highway/rural)"),
        QStringLiteral("Add environment context (e.g., curve, school zone, intersection)"),
        QStringLiteral("Check for alternative terms related to the issue"),
        QStringLiteral("Contact administrators to expand knowledge base"),
    });
    json.insert(QStringLiteral("fallback_action"),
                QStringLiteral("Please consult road safety engineers or refer to IRC SP:84 "
                               "and IRC SP:87 for general guidance."));
    return json;
}

QJsonObject ExplanationLayer::buildResponse(const RetrievalRequest& request,
                                            const RetrievalOutcome& outcome)
{
    switch (outcome.status) {
    case RetrievalOutcome::Status::InvalidArgument:
        return errorResponse(QStringLiteral("invalid_argument"),
                             outcome.errorMessage.value_or(QStringLiteral("Invalid request")));
    case RetrievalOutcome::Status::EmptyQuery:
        return errorResponse(QStringLiteral("needs_more_input"),
                             QStringLiteral("Describe the road safety issue in more detail."));
    case RetrievalOutcome::Status::Ok:
        break;
    }

    if (!outcome.confident) {
        LOG_DEBUG(rwExplain, "No confident match for '%s' (%zu candidates); using fallback",
                  qUtf8Printable(request.queryText), outcome.results.size());
        return fallbackResponse(request.queryText);
    }

    QJsonObject queryJson;
    queryJson.insert(QStringLiteral("issue"), request.queryText);
    queryJson.insert(QStringLiteral("road_type"),
                     outcome.usedDefaultRoadType
                         ? QStringLiteral("%1 (default)").arg(outcome.effectiveRoadType)
                         : outcome.effectiveRoadType);
    const QString environment = request.environment.value_or(QString()).trimmed();
    queryJson.insert(QStringLiteral("environment"),
                     environment.isEmpty() ? QStringLiteral("general") : environment);

    QJsonArray recommendations;
    for (const RecommendationCard& card
         : formatRecommendations(outcome, request.minScoreThreshold)) {
        recommendations.append(cardToJson(card));
    }

    QJsonObject metadata;
    metadata.insert(QStringLiteral("system"), QStringLiteral("RoadWise"));
    metadata.insert(QStringLiteral("note"),
                    QStringLiteral("Material-only costs; excludes labor and taxes"));

    QJsonObject json;
    json.insert(QStringLiteral("status"), QStringLiteral("success"));
    json.insert(QStringLiteral("query"), queryJson);
    json.insert(QStringLiteral("recommendations"), recommendations);
    json.insert(QStringLiteral("total_recommendations"), static_cast<int>(recommendations.size()));
    json.insert(QStringLiteral("metadata"), metadata);
    return json;
}

QString ExplanationLayer::reportText(const RetrievalRequest& request,
                                     const std::vector<RecommendationCard>& cards)
{
    QStringList lines;
    lines << kRule
          << QStringLiteral("ROADWISE - ROAD SAFETY INTERVENTION RECOMMENDATION REPORT")
          << kRule
          << QString();

    lines << QStringLiteral("QUERY DETAILS:")
          << QStringLiteral("  Issue: %1").arg(request.queryText);
    if (request.roadType.has_value() && !request.roadType->trimmed().isEmpty()) {
        lines << QStringLiteral("  Road Type: %1").arg(request.roadType->trimmed());
    }
    if (request.environment.has_value() && !request.environment->trimmed().isEmpty()) {
        lines << QStringLiteral("  Environment: %1").arg(request.environment->trimmed());
    }
    lines << QString();

    lines << QStringLiteral("RECOMMENDED INTERVENTIONS:") << kDivider;

    int index = 1;
    for (const RecommendationCard& card : cards) {
        lines << QString()
              << QStringLiteral("[Recommendation %1]").arg(index++)
              << QStringLiteral("Intervention: %1").arg(card.intervention)
              << QStringLiteral("Reference: %1").arg(card.reference)
              << QStringLiteral("Rationale: %1").arg(card.rationale)
              << QStringLiteral("Assumptions: %1").arg(card.assumptions)
              << QStringLiteral("Confidence: %1 (%2%)")
                     .arg(card.confidence)
                     .arg(card.relevanceScore, 0, 'f', 1)
              << kDivider;
    }

    lines << QString()
          << QStringLiteral("NOTE: All recommendations are material-only estimates.")
          << QStringLiteral("Labor, transport, and taxes are excluded from cost calculations.")
          << kRule;

    return lines.join(QLatin1Char('\n'));
}

QJsonObject ExplanationLayer::statsToJson(const KnowledgeBaseStats& stats)
{
    QJsonArray roadTypes;
    for (const QString& roadType : stats.roadTypes) {
        roadTypes.append(roadType);
    }

    QJsonObject priorities;
    for (const auto& entry : stats.priorityBreakdown) {
        priorities.insert(entry.first, entry.second);
    }

    QJsonObject json;
    json.insert(QStringLiteral("total_interventions"), stats.totalInterventions);
    json.insert(QStringLiteral("road_types"), roadTypes);
    json.insert(QStringLiteral("priority_breakdown"), priorities);
    return json;
}

} // namespace rw
