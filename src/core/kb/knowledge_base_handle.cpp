#include "core/kb/knowledge_base_handle.h"

#include "core/kb/kb_loader.h"
#include "core/shared/logging.h"

namespace rw {

KnowledgeBaseHandle::KnowledgeBaseHandle(std::shared_ptr<const KnowledgeBase> initial)
    : m_current(initial ? std::move(initial) : emptyKnowledgeBase())
{
}

std::shared_ptr<const KnowledgeBase> KnowledgeBaseHandle::emptyKnowledgeBase()
{
    static const std::shared_ptr<const KnowledgeBase> empty = KnowledgeBase::create({}).kb;
    return empty;
}

std::shared_ptr<const KnowledgeBase> KnowledgeBaseHandle::snapshot() const
{
    return std::atomic_load(&m_current);
}

void KnowledgeBaseHandle::replace(std::shared_ptr<const KnowledgeBase> next)
{
    if (!next) {
        LOG_WARN(rwKb, "Ignoring replacement with a null knowledge base");
        return;
    }
    const int size = next->size();
    std::atomic_store(&m_current, std::move(next));
    const uint64_t generation = ++m_generation;
    LOG_INFO(rwKb, "Knowledge base replaced: %d interventions (generation %llu)",
             size, static_cast<unsigned long long>(generation));
}

KnowledgeBaseLoadResult KnowledgeBaseHandle::reloadFromFile(const QString& path)
{
    KnowledgeBaseLoadResult result = KnowledgeBaseLoader::loadFromFile(path);
    if (!result.ok()) {
        LOG_WARN(rwKb, "Reload from %s rejected; keeping generation %llu",
                 qUtf8Printable(path), static_cast<unsigned long long>(generation()));
        return result;
    }
    replace(result.kb);
    return result;
}

} // namespace rw
