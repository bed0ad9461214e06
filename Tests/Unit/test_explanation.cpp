#include <QtTest/QtTest>

#include "core/explain/explanation_layer.h"

#include <QJsonArray>

class TestExplanation : public QObject {
    Q_OBJECT

private:
    static rw::RankedIntervention makeRanked(int id, double score,
                                             rw::Priority priority = rw::Priority::High)
    {
        rw::RankedIntervention ranked;
        ranked.record.id = id;
        ranked.record.issueKeywords = {QStringLiteral("curve")};
        ranked.record.interventionText = QStringLiteral("Install chevron signs");
        ranked.record.reference = QStringLiteral("IRC:67-2022");
        ranked.record.rationale = QStringLiteral("Delineates the curve.");
        ranked.record.assumptions = QStringLiteral("Material-only cost.");
        ranked.record.priority = priority;
        ranked.score = score;
        ranked.breakdown.baseScore = score;
        ranked.breakdown.finalScore = score;
        return ranked;
    }

private slots:
    void testConfidenceLabels();
    void testFormatRecommendation();
    void testSuccessResponse();
    void testDefaultRoadTypeEcho();
    void testFallbackWhenNotConfident();
    void testErrorResponses();
    void testReportText();
    void testStatsJson();
};

void TestExplanation::testConfidenceLabels()
{
    QCOMPARE(rw::ExplanationLayer::confidenceLabel(0.95), QStringLiteral("Very High"));
    QCOMPARE(rw::ExplanationLayer::confidenceLabel(0.85), QStringLiteral("Very High"));
    QCOMPARE(rw::ExplanationLayer::confidenceLabel(0.7), QStringLiteral("High"));
    QCOMPARE(rw::ExplanationLayer::confidenceLabel(0.4), QStringLiteral("Medium"));
    QCOMPARE(rw::ExplanationLayer::confidenceLabel(0.2), QStringLiteral("Low"));
    QCOMPARE(rw::ExplanationLayer::confidenceLabel(0.4, 0.5), QStringLiteral("Low"));
}

void TestExplanation::testFormatRecommendation()
{
    const rw::RecommendationCard card =
        rw::ExplanationLayer::formatRecommendation(makeRanked(4, 0.94736));
    QCOMPARE(card.id, 4);
    QCOMPARE(card.priority, QStringLiteral("High"));
    QCOMPARE(card.relevanceScore, 94.7);
    QCOMPARE(card.confidence, QStringLiteral("Very High"));

    const QJsonObject json = rw::ExplanationLayer::cardToJson(card);
    QCOMPARE(json.value(QStringLiteral("intervention")).toString(),
             QStringLiteral("Install chevron signs"));
    QCOMPARE(json.value(QStringLiteral("relevance_score")).toDouble(), 94.7);
    QVERIFY(json.value(QStringLiteral("score_breakdown")).isObject());
}

void TestExplanation::testSuccessResponse()
{
    rw::RetrievalRequest request;
    request.queryText = QStringLiteral("blind curve");
    request.roadType = QStringLiteral("Highway");
    request.environment = QStringLiteral("Curve");

    rw::RetrievalOutcome outcome;
    outcome.results = {makeRanked(4, 1.0), makeRanked(5, 0.5, rw::Priority::Medium)};
    outcome.confident = true;
    outcome.effectiveRoadType = QStringLiteral("highway");

    const QJsonObject response = rw::ExplanationLayer::buildResponse(request, outcome);
    QCOMPARE(response.value(QStringLiteral("status")).toString(), QStringLiteral("success"));
    QCOMPARE(response.value(QStringLiteral("total_recommendations")).toInt(), 2);

    const QJsonObject query = response.value(QStringLiteral("query")).toObject();
    QCOMPARE(query.value(QStringLiteral("issue")).toString(), QStringLiteral("blind curve"));
    QCOMPARE(query.value(QStringLiteral("road_type")).toString(), QStringLiteral("highway"));
    QCOMPARE(query.value(QStringLiteral("environment")).toString(), QStringLiteral("Curve"));

    const QJsonArray recommendations = response.value(QStringLiteral("recommendations")).toArray();
    QCOMPARE(static_cast<int>(recommendations.size()), 2);
    QCOMPARE(recommendations.at(0).toObject().value(QStringLiteral("id")).toInt(), 4);
    QCOMPARE(recommendations.at(1).toObject().value(QStringLiteral("confidence")).toString(),
             QStringLiteral("Medium"));
    QCOMPARE(response.value(QStringLiteral("metadata")).toObject()
                 .value(QStringLiteral("system")).toString(),
             QStringLiteral("RoadWise"));
}

void TestExplanation::testDefaultRoadTypeEcho()
{
    rw::RetrievalRequest request;
    request.queryText = QStringLiteral("pothole");

    rw::RetrievalOutcome outcome;
    outcome.results = {makeRanked(1, 0.9)};
    outcome.confident = true;
    outcome.usedDefaultRoadType = true;
    outcome.effectiveRoadType = QStringLiteral("urban");

    const QJsonObject query =
        rw::ExplanationLayer::buildResponse(request, outcome).value(QStringLiteral("query")).toObject();
    QCOMPARE(query.value(QStringLiteral("road_type")).toString(), QStringLiteral("urban (default)"));
    QCOMPARE(query.value(QStringLiteral("environment")).toString(), QStringLiteral("general"));
}

void TestExplanation::testFallbackWhenNotConfident()
{
    rw::RetrievalRequest request;
    request.queryText = QStringLiteral("xyzzy unrelated nonsense");

    rw::RetrievalOutcome outcome;
    outcome.results = {makeRanked(2, 0.1)};
    outcome.confident = false;

    const QJsonObject response = rw::ExplanationLayer::buildResponse(request, outcome);
    QCOMPARE(response.value(QStringLiteral("status")).toString(), QStringLiteral("no_match"));
    QCOMPARE(response.value(QStringLiteral("query")).toString(), request.queryText);
    QCOMPARE(static_cast<int>(response.value(QStringLiteral("suggestions")).toArray().size()), 4);
    QVERIFY(response.value(QStringLiteral("fallback_action")).toString()
                .contains(QStringLiteral("IRC SP:84")));
    QVERIFY(!response.contains(QStringLiteral("recommendations")));
}

void TestExplanation::testErrorResponses()
{
    rw::RetrievalRequest request;

    rw::RetrievalOutcome invalid;
    invalid.status = rw::RetrievalOutcome::Status::InvalidArgument;
    invalid.errorMessage = QStringLiteral("top_k must be at least 1, got 0");
    const QJsonObject invalidResponse = rw::ExplanationLayer::buildResponse(request, invalid);
    QCOMPARE(invalidResponse.value(QStringLiteral("status")).toString(),
             QStringLiteral("invalid_argument"));
    QCOMPARE(invalidResponse.value(QStringLiteral("message")).toString(),
             QStringLiteral("top_k must be at least 1, got 0"));

    rw::RetrievalOutcome empty;
    empty.status = rw::RetrievalOutcome::Status::EmptyQuery;
    QCOMPARE(rw::ExplanationLayer::buildResponse(request, empty)
                 .value(QStringLiteral("status")).toString(),
             QStringLiteral("needs_more_input"));
}

void TestExplanation::testReportText()
{
    rw::RetrievalRequest request;
    request.queryText = QStringLiteral("blind curve");
    request.roadType = QStringLiteral("Highway");

    const std::vector<rw::RecommendationCard> cards = {
        rw::ExplanationLayer::formatRecommendation(makeRanked(4, 0.9)),
    };
    const QString report = rw::ExplanationLayer::reportText(request, cards);
    QVERIFY(report.startsWith(QString(70, QLatin1Char('='))));
    QVERIFY(report.contains(QStringLiteral("  Issue: blind curve")));
    QVERIFY(report.contains(QStringLiteral("  Road Type: Highway")));
    QVERIFY(!report.contains(QStringLiteral("Environment:")));
    QVERIFY(report.contains(QStringLiteral("[Recommendation 1]")));
    QVERIFY(report.contains(QStringLiteral("Confidence: Very High (90.0%)")));
}

void TestExplanation::testStatsJson()
{
    rw::KnowledgeBaseStats stats;
    stats.totalInterventions = 3;
    stats.roadTypes = {QStringLiteral("highway"), QStringLiteral("urban")};
    stats.priorityBreakdown[QStringLiteral("High")] = 2;
    stats.priorityBreakdown[QStringLiteral("Low")] = 1;

    const QJsonObject json = rw::ExplanationLayer::statsToJson(stats);
    QCOMPARE(json.value(QStringLiteral("total_interventions")).toInt(), 3);
    QCOMPARE(static_cast<int>(json.value(QStringLiteral("road_types")).toArray().size()), 2);
    QCOMPARE(json.value(QStringLiteral("priority_breakdown")).toObject()
                 .value(QStringLiteral("High")).toInt(), 2);
}

QTEST_MAIN(TestExplanation)
#include "test_explanation.moc"
