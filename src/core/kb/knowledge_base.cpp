#include "core/kb/knowledge_base.h"

#include <algorithm>
#include <set>
#include <unordered_set>

namespace rw {

namespace {

const QString kDefaultRationale = QStringLiteral("Enhances road safety in line with IRC standards.");
const QString kDefaultAssumptions = QStringLiteral("Material-only cost; excludes labor and taxes.");

KnowledgeBaseLoadResult rejected(KnowledgeBaseLoadResult::Status status, const QString& message)
{
    KnowledgeBaseLoadResult result;
    result.status = status;
    result.errorMessage = message;
    return result;
}

} // namespace

QString loadStatusToString(KnowledgeBaseLoadResult::Status status)
{
    switch (status) {
    case KnowledgeBaseLoadResult::Status::Loaded:           return QStringLiteral("loaded");
    case KnowledgeBaseLoadResult::Status::SourceUnreadable: return QStringLiteral("source_unreadable");
    case KnowledgeBaseLoadResult::Status::MalformedSource:  return QStringLiteral("malformed_source");
    case KnowledgeBaseLoadResult::Status::MissingField:     return QStringLiteral("missing_field");
    case KnowledgeBaseLoadResult::Status::InvalidField:     return QStringLiteral("invalid_field");
    case KnowledgeBaseLoadResult::Status::DuplicateId:      return QStringLiteral("duplicate_id");
    case KnowledgeBaseLoadResult::Status::EmptyKeywords:    return QStringLiteral("empty_keywords");
    }
    return QStringLiteral("unknown");
}

KnowledgeBase::KnowledgeBase(std::vector<InterventionRecord> records)
    : m_records(std::move(records))
{
    m_indexById.reserve(m_records.size());
    for (size_t i = 0; i < m_records.size(); ++i) {
        m_indexById.emplace(m_records[i].id, i);
    }
}

KnowledgeBaseLoadResult KnowledgeBase::create(std::vector<InterventionRecord> records)
{
    std::unordered_set<int> seenIds;
    seenIds.reserve(records.size());

    for (InterventionRecord& record : records) {
        if (record.id <= 0) {
            return rejected(KnowledgeBaseLoadResult::Status::InvalidField,
                            QStringLiteral("Intervention id must be positive, got %1")
                                .arg(record.id));
        }
        if (!seenIds.insert(record.id).second) {
            return rejected(KnowledgeBaseLoadResult::Status::DuplicateId,
                            QStringLiteral("Duplicate intervention id %1").arg(record.id));
        }

        record.issueKeywords = normalizeTagList(record.issueKeywords);
        record.roadTypes = normalizeTagList(record.roadTypes);
        record.environmentTags = normalizeTagList(record.environmentTags);
        record.interventionText = record.interventionText.trimmed();
        record.reference = record.reference.trimmed();
        record.rationale = record.rationale.trimmed();
        record.assumptions = record.assumptions.trimmed();

        if (record.issueKeywords.empty()) {
            return rejected(KnowledgeBaseLoadResult::Status::EmptyKeywords,
                            QStringLiteral("Intervention %1 has no issue keywords")
                                .arg(record.id));
        }
        if (record.interventionText.isEmpty()) {
            return rejected(KnowledgeBaseLoadResult::Status::MissingField,
                            QStringLiteral("Intervention %1 has no intervention text")
                                .arg(record.id));
        }
        if (record.reference.isEmpty()) {
            return rejected(KnowledgeBaseLoadResult::Status::MissingField,
                            QStringLiteral("Intervention %1 has no reference").arg(record.id));
        }
        if (record.rationale.isEmpty()) {
            record.rationale = kDefaultRationale;
        }
        if (record.assumptions.isEmpty()) {
            record.assumptions = kDefaultAssumptions;
        }
    }

    KnowledgeBaseLoadResult result;
    result.status = KnowledgeBaseLoadResult::Status::Loaded;
    result.kb = std::shared_ptr<const KnowledgeBase>(new KnowledgeBase(std::move(records)));
    return result;
}

std::optional<InterventionRecord> KnowledgeBase::getById(int id) const
{
    auto it = m_indexById.find(id);
    if (it == m_indexById.end()) {
        return std::nullopt;
    }
    return m_records[it->second];
}

std::vector<InterventionRecord> KnowledgeBase::searchByKeywords(
    const std::vector<QString>& keywords) const
{
    const std::vector<QString> wanted = normalizeTagList(keywords);
    std::vector<InterventionRecord> matches;
    if (wanted.empty()) {
        return matches;
    }

    for (const InterventionRecord& record : m_records) {
        const bool intersects = std::any_of(
            record.issueKeywords.begin(), record.issueKeywords.end(),
            [&wanted](const QString& keyword) {
                return std::find(wanted.begin(), wanted.end(), keyword) != wanted.end();
            });
        if (intersects) {
            matches.push_back(record);
        }
    }
    return matches;
}

KnowledgeBaseStats KnowledgeBase::stats() const
{
    KnowledgeBaseStats stats;
    stats.totalInterventions = size();

    std::set<QString> roadTypes;
    for (const InterventionRecord& record : m_records) {
        roadTypes.insert(record.roadTypes.begin(), record.roadTypes.end());
        ++stats.priorityBreakdown[priorityToString(record.priority)];
    }
    stats.roadTypes.assign(roadTypes.begin(), roadTypes.end());
    return stats;
}

} // namespace rw
