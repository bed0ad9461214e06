#pragma once

#include "core/kb/knowledge_base_handle.h"
#include "core/ranking/retrieval_engine.h"
#include "core/shared/recommendation.h"
#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace rw {

// QueryService -- wires settings, the knowledge base handle and the engine
// behind JSON-shaped requests:
//   {"query": "...", "road_type": "...", "environment": "...",
//    "top_k": 3, "threshold": 0.3}
class QueryService {
public:
    explicit QueryService(const Settings& settings = {});

    // Load (or reload) the knowledge base. The previous snapshot stays
    // active when loading fails.
    KnowledgeBaseLoadResult loadKnowledgeBase(const QString& path);

    // Fill unset fields from the configured defaults. Returns nullopt and
    // sets errorOut when a field has the wrong JSON type, e.g. a string or
    // fractional top_k.
    std::optional<RetrievalRequest> requestFromJson(const QJsonObject& params,
                                                    QString* errorOut = nullptr) const;

    RetrievalOutcome recommend(const RetrievalRequest& request) const;

    // ExplanationLayer response for the request.
    QJsonObject handleRecommend(const QJsonObject& params) const;

    QJsonObject handleStats() const;

    const Settings& settings() const { return m_settings; }
    const KnowledgeBaseHandle& knowledgeBase() const { return m_kb; }

private:
    Settings m_settings;
    KnowledgeBaseHandle m_kb;
    RetrievalEngine m_engine;
};

} // namespace rw
