#pragma once

#include "core/kb/knowledge_base.h"

#include <QString>
#include <atomic>
#include <cstdint>
#include <memory>

namespace rw {

// KnowledgeBaseHandle -- the current knowledge base snapshot.
//
// Readers take a snapshot and keep using it for the whole query; a reload
// publishes a complete new instance with a single atomic store, so readers
// see either the old or the new knowledge base, never a mix.
class KnowledgeBaseHandle {
public:
    explicit KnowledgeBaseHandle(std::shared_ptr<const KnowledgeBase> initial = nullptr);

    KnowledgeBaseHandle(const KnowledgeBaseHandle&) = delete;
    KnowledgeBaseHandle& operator=(const KnowledgeBaseHandle&) = delete;

    // Never null: an empty knowledge base stands in before the first load.
    std::shared_ptr<const KnowledgeBase> snapshot() const;

    // Publish next. A null pointer is ignored.
    void replace(std::shared_ptr<const KnowledgeBase> next);

    // Load path and publish it on success. On failure the current snapshot
    // stays in place and the failed result is returned.
    KnowledgeBaseLoadResult reloadFromFile(const QString& path);

    // Number of successful replacements.
    uint64_t generation() const { return m_generation.load(); }

private:
    static std::shared_ptr<const KnowledgeBase> emptyKnowledgeBase();

    std::shared_ptr<const KnowledgeBase> m_current;
    std::atomic<uint64_t> m_generation{0};
};

} // namespace rw
