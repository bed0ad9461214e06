#pragma once

#include "core/shared/intervention.h"
#include "core/shared/scoring_types.h"

#include <QString>
#include <optional>
#include <vector>

namespace rw {

// Caller-supplied query with its context.
struct RetrievalRequest {
    QString queryText;
    std::optional<QString> roadType;     // absent: engine falls back to "urban"
    std::optional<QString> environment;
    int topK = kDefaultTopK;
    double minScoreThreshold = kDefaultMinScoreThreshold;
};

// Per-component score for transparency. finalScore is the clamped sum.
struct ScoreBreakdown {
    double baseScore = 0.0;
    double roadTypeBoost = 0.0;
    double environmentBoost = 0.0;
    double priorityWeight = 0.0;
    double finalScore = 0.0;
};

struct RankedIntervention {
    InterventionRecord record;
    double score = 0.0;
    ScoreBreakdown breakdown;
};

struct RetrievalOutcome {
    enum class Status {
        Ok,
        InvalidArgument,   // malformed field, top_k < 1 or threshold outside [0,1]
        EmptyQuery,        // nothing left after normalization
    };

    Status status = Status::Ok;
    std::vector<RankedIntervention> results;
    bool confident = false;
    bool usedDefaultRoadType = false;
    QString effectiveRoadType;
    std::vector<QString> queryTokens;
    std::optional<QString> errorMessage;

    bool ok() const { return status == Status::Ok; }
};

QString retrievalStatusToString(RetrievalOutcome::Status status);

} // namespace rw
