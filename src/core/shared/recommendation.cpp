#include "core/shared/recommendation.h"

namespace rw {

QString retrievalStatusToString(RetrievalOutcome::Status status)
{
    switch (status) {
    case RetrievalOutcome::Status::Ok:              return QStringLiteral("ok");
    case RetrievalOutcome::Status::InvalidArgument: return QStringLiteral("invalid_argument");
    case RetrievalOutcome::Status::EmptyQuery:      return QStringLiteral("empty_query");
    }
    return QStringLiteral("unknown");
}

} // namespace rw
