#pragma once

#include "core/models/relevance_model.h"
#include "core/shared/retrieval_candidate.h"

#include <QString>
#include <vector>

namespace rc {

struct RefinerConfig {
    int topN = 100;     // candidates sent to the relevance model
    int topK = 10;      // results kept after refinement
};

// Re-orders the head of the ranked list by joint (query, passage) relevance.
// Tag-matched candidates are not re-scored: they keep their fusion order
// ahead of the refined ones.
class CrossEncoderRefiner {
public:
    struct Outcome {
        bool applied = false;
        bool modelFailed = false;   // scoring was attempted and failed
        int scoredCount = 0;
        int pinnedCount = 0;
    };

    explicit CrossEncoderRefiner(RelevanceModel* model);

    bool isAvailable() const;

    // Returns at most config.topK candidates. When the model is unavailable
    // or fails, the input order is kept and outcome->applied is false. A head
    // made only of tag-matched candidates is not scored either.
    std::vector<RetrievalCandidate> refine(const QString& query,
                                           std::vector<RetrievalCandidate> candidates,
                                           const RefinerConfig& config,
                                           Outcome* outcome = nullptr) const;

private:
    RelevanceModel* m_model = nullptr;
};

} // namespace rc
