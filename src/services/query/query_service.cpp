#include "query_service.h"

#include "core/explain/explanation_layer.h"
#include "core/shared/logging.h"

#include <cmath>
#include <limits>

namespace rw {

namespace {

std::optional<QString> optionalText(const QJsonObject& params, const QString& key)
{
    const QJsonValue value = params.value(key);
    if (!value.isString() || value.toString().trimmed().isEmpty()) {
        return std::nullopt;
    }
    return value.toString();
}

// Absent and null fields fall back to the configured defaults.
bool isUnset(const QJsonValue& value)
{
    return value.isUndefined() || value.isNull();
}

} // namespace

QueryService::QueryService(const Settings& settings)
    : m_settings(settings)
    , m_engine(settings.weights, settings.defaults.roadType)
{
}

KnowledgeBaseLoadResult QueryService::loadKnowledgeBase(const QString& path)
{
    LOG_INFO(rwCore, "Loading knowledge base from %s", qUtf8Printable(path));
    return m_kb.reloadFromFile(path);
}

std::optional<RetrievalRequest> QueryService::requestFromJson(const QJsonObject& params,
                                                              QString* errorOut) const
{
    auto fail = [errorOut](const QString& message) -> std::optional<RetrievalRequest> {
        if (errorOut) {
            *errorOut = message;
        }
        return std::nullopt;
    };

    RetrievalRequest request;

    const QJsonValue query = params.value(QStringLiteral("query"));
    if (!isUnset(query) && !query.isString()) {
        return fail(QStringLiteral("query must be a string"));
    }
    request.queryText = query.toString();
    request.roadType = optionalText(params, QStringLiteral("road_type"));
    request.environment = optionalText(params, QStringLiteral("environment"));

    const QJsonValue topK = params.value(QStringLiteral("top_k"));
    if (isUnset(topK)) {
        request.topK = m_settings.defaults.topK;
    } else {
        const double raw = topK.toDouble();
        if (!topK.isDouble() || std::floor(raw) != raw
            || raw < std::numeric_limits<int>::min() || raw > std::numeric_limits<int>::max()) {
            return fail(QStringLiteral("top_k must be an integer"));
        }
        request.topK = static_cast<int>(raw);
    }

    const QJsonValue threshold = params.value(QStringLiteral("threshold"));
    if (isUnset(threshold)) {
        request.minScoreThreshold = m_settings.defaults.minScoreThreshold;
    } else {
        if (!threshold.isDouble()) {
            return fail(QStringLiteral("threshold must be a number"));
        }
        request.minScoreThreshold = threshold.toDouble();
    }

    return request;
}

RetrievalOutcome QueryService::recommend(const RetrievalRequest& request) const
{
    return m_engine.retrieveAndRank(m_kb, request);
}

QJsonObject QueryService::handleRecommend(const QJsonObject& params) const
{
    QString parseError;
    const std::optional<RetrievalRequest> parsed = requestFromJson(params, &parseError);
    if (!parsed) {
        LOG_INFO(rwCore, "Malformed recommendation request: %s", qUtf8Printable(parseError));
        RetrievalOutcome rejected;
        rejected.status = RetrievalOutcome::Status::InvalidArgument;
        rejected.errorMessage = parseError;
        return ExplanationLayer::buildResponse(RetrievalRequest{}, rejected);
    }

    const RetrievalRequest& request = *parsed;
    const RetrievalOutcome outcome = recommend(request);
    if (!outcome.ok()) {
        LOG_INFO(rwCore, "Recommendation request rejected (%s): %s",
                 qUtf8Printable(retrievalStatusToString(outcome.status)),
                 qUtf8Printable(outcome.errorMessage.value_or(QString())));
    }
    return ExplanationLayer::buildResponse(request, outcome);
}

QJsonObject QueryService::handleStats() const
{
    const std::shared_ptr<const KnowledgeBase> snapshot = m_kb.snapshot();
    QJsonObject json = ExplanationLayer::statsToJson(snapshot->stats());
    json.insert(QStringLiteral("generation"), static_cast<qint64>(m_kb.generation()));
    return json;
}

} // namespace rw
