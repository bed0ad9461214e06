#pragma once

#include "core/shared/scoring_types.h"

#include <QString>

namespace rw {

struct Settings {
    // Knowledge base source (.csv, .json or SQLite database)
    QString kbPath;

    // Request defaults
    RetrievalDefaults defaults;

    // Scoring
    ScoringWeights weights;
};

} // namespace rw
