#pragma once

#include "core/shared/intervention.h"

#include <QString>
#include <map>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace rw {

class KnowledgeBase;

// Outcome of building a knowledge base. Any status other than Loaded means
// the whole load was rejected and kb is null.
struct KnowledgeBaseLoadResult {
    enum class Status {
        Loaded,
        SourceUnreadable,   // file missing, unreadable, or unknown format
        MalformedSource,    // not parseable as CSV / JSON / SQLite
        MissingField,       // required column or value absent
        InvalidField,       // value present but unusable (bad id, priority, list)
        DuplicateId,
        EmptyKeywords,
    };

    Status status = Status::SourceUnreadable;
    std::shared_ptr<const KnowledgeBase> kb;
    std::optional<QString> errorMessage;

    bool ok() const { return status == Status::Loaded && kb != nullptr; }
};

QString loadStatusToString(KnowledgeBaseLoadResult::Status status);

struct KnowledgeBaseStats {
    int totalInterventions = 0;
    std::vector<QString> roadTypes;          // distinct, sorted
    std::map<QString, int> priorityBreakdown;
};

// KnowledgeBase -- immutable, validated collection of intervention records.
//
// Built once through create(); never mutated afterwards, so a single instance
// can be shared across concurrent queries without locking. Reloads go through
// KnowledgeBaseHandle, which swaps whole instances.
class KnowledgeBase {
public:
    // Normalize and validate every record. Rejects the whole set on the first
    // invalid record (non-positive or duplicate id, empty keywords, empty
    // intervention text or reference). Blank rationale and assumptions get
    // the catalogue defaults.
    static KnowledgeBaseLoadResult create(std::vector<InterventionRecord> records);

    // Records in load order.
    const std::vector<InterventionRecord>& getAll() const { return m_records; }

    std::optional<InterventionRecord> getById(int id) const;

    // Records whose issue keywords intersect the given set, in load order.
    std::vector<InterventionRecord> searchByKeywords(const std::vector<QString>& keywords) const;

    KnowledgeBaseStats stats() const;

    int size() const { return static_cast<int>(m_records.size()); }
    bool isEmpty() const { return m_records.empty(); }

private:
    explicit KnowledgeBase(std::vector<InterventionRecord> records);

    std::vector<InterventionRecord> m_records;
    std::unordered_map<int, size_t> m_indexById;
};

} // namespace rw
