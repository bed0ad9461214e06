#pragma once

#include <QString>
#include <optional>
#include <vector>

namespace rw {

// Remedy urgency, as catalogued in the knowledge base source.
enum class Priority {
    High,
    Medium,
    Low,
};

QString priorityToString(Priority priority);
std::optional<Priority> priorityFromString(const QString& str);

// Higher is more urgent. Used for tie-breaking in ranking.
int priorityRank(Priority priority);

// One catalogued road-safety remedy.
// Set-valued fields hold lower-cased, trimmed, de-duplicated strings once the
// record has passed through KnowledgeBase::create().
struct InterventionRecord {
    int id = 0;
    std::vector<QString> issueKeywords;
    QString interventionText;
    QString reference;
    QString rationale;
    QString assumptions;
    std::vector<QString> roadTypes;         // empty = applies to all road types
    std::vector<QString> environmentTags;   // empty = no environment boost
    Priority priority = Priority::Medium;
};

// Lower-case and trim a single tag or keyword.
QString normalizeTag(const QString& raw);

// Normalize every entry, drop blanks, keep first occurrence of duplicates.
std::vector<QString> normalizeTagList(const std::vector<QString>& raw);

} // namespace rw
