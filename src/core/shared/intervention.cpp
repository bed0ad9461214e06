#include "core/shared/intervention.h"

#include <algorithm>

namespace rw {

QString priorityToString(Priority priority)
{
    switch (priority) {
    case Priority::High:   return QStringLiteral("High");
    case Priority::Medium: return QStringLiteral("Medium");
    case Priority::Low:    return QStringLiteral("Low");
    }
    return QStringLiteral("Medium");
}

std::optional<Priority> priorityFromString(const QString& str)
{
    const QString normalized = str.trimmed().toLower();
    if (normalized == QLatin1String("high"))   return Priority::High;
    if (normalized == QLatin1String("medium")) return Priority::Medium;
    if (normalized == QLatin1String("low"))    return Priority::Low;
    return std::nullopt;
}

int priorityRank(Priority priority)
{
    switch (priority) {
    case Priority::High:   return 3;
    case Priority::Medium: return 2;
    case Priority::Low:    return 1;
    }
    return 0;
}

QString normalizeTag(const QString& raw)
{
    return raw.simplified().toLower();
}

std::vector<QString> normalizeTagList(const std::vector<QString>& raw)
{
    std::vector<QString> normalized;
    normalized.reserve(raw.size());
    for (const QString& entry : raw) {
        const QString tag = normalizeTag(entry);
        if (tag.isEmpty()) {
            continue;
        }
        if (std::find(normalized.begin(), normalized.end(), tag) != normalized.end()) {
            continue;
        }
        normalized.push_back(tag);
    }
    return normalized;
}

} // namespace rw
