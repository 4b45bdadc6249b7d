#pragma once

#include "core/shared/retrieval_candidate.h"

#include <vector>

namespace rc {

// Collapses candidates that share a parent item into the best-scoring one,
// which records how many sibling chunks also matched. Output is ranked.
class ChunkDeduplicator {
public:
    static std::vector<RetrievalCandidate> deduplicate(std::vector<RetrievalCandidate> candidates);
};

} // namespace rc
