#include "core/ranking/chunk_deduplicator.h"
#include "core/shared/logging.h"

#include <QHash>

namespace rc {

std::vector<RetrievalCandidate> ChunkDeduplicator::deduplicate(
    std::vector<RetrievalCandidate> candidates)
{
    sortByFinalScore(candidates);

    std::vector<RetrievalCandidate> survivors;
    survivors.reserve(candidates.size());
    QHash<QString, int> survivorByParent;

    for (RetrievalCandidate& candidate : candidates) {
        const auto it = survivorByParent.constFind(candidate.doc.parentId);
        if (it != survivorByParent.constEnd()) {
            ++survivors[static_cast<size_t>(it.value())].siblingMatches;
            continue;
        }
        survivorByParent.insert(candidate.doc.parentId, static_cast<int>(survivors.size()));
        survivors.push_back(std::move(candidate));
    }

    if (survivors.size() != candidates.size()) {
        LOG_DEBUG(rcRanking, "Deduplicated %d candidates into %d items",
                  static_cast<int>(candidates.size()), static_cast<int>(survivors.size()));
    }
    return survivors;
}

} // namespace rc
