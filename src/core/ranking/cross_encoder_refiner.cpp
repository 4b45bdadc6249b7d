#include "core/ranking/cross_encoder_refiner.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <iterator>

namespace rc {

CrossEncoderRefiner::CrossEncoderRefiner(RelevanceModel* model)
    : m_model(model)
{
}

bool CrossEncoderRefiner::isAvailable() const
{
    return m_model && m_model->isAvailable();
}

std::vector<RetrievalCandidate> CrossEncoderRefiner::refine(
    const QString& query,
    std::vector<RetrievalCandidate> candidates,
    const RefinerConfig& config,
    Outcome* outcome) const
{
    Outcome local;
    const size_t topK = static_cast<size_t>(std::max(config.topK, 0));
    auto finish = [&](std::vector<RetrievalCandidate> ranked) {
        if (ranked.size() > topK) {
            ranked.resize(topK);
        }
        if (outcome) {
            *outcome = local;
        }
        return ranked;
    };

    if (candidates.empty() || !isAvailable()) {
        return finish(std::move(candidates));
    }

    const size_t head = std::min(candidates.size(), static_cast<size_t>(std::max(config.topN, 0)));

    std::vector<RetrievalCandidate> pinned;
    std::vector<RetrievalCandidate> toScore;
    for (size_t i = 0; i < head; ++i) {
        if (candidates[i].tagMatched) {
            pinned.push_back(std::move(candidates[i]));
        } else {
            toScore.push_back(std::move(candidates[i]));
        }
    }

    if (!toScore.empty()) {
        std::vector<QString> passages;
        passages.reserve(toScore.size());
        for (const RetrievalCandidate& candidate : toScore) {
            passages.push_back(candidate.relevanceText());
        }

        const std::optional<std::vector<float>> scores = m_model->score(query, passages);
        if (!scores || scores->size() != toScore.size()) {
            LOG_WARN(rcRanking, "Cross-encoder scoring failed for %d candidates, keeping fusion order",
                     static_cast<int>(toScore.size()));
            local.modelFailed = true;
            // Restore the original head order: pinned items were ahead only by score.
            std::vector<RetrievalCandidate> restored;
            restored.reserve(candidates.size());
            std::merge(std::make_move_iterator(pinned.begin()), std::make_move_iterator(pinned.end()),
                       std::make_move_iterator(toScore.begin()), std::make_move_iterator(toScore.end()),
                       std::back_inserter(restored), rankedBefore);
            for (size_t i = head; i < candidates.size(); ++i) {
                restored.push_back(std::move(candidates[i]));
            }
            return finish(std::move(restored));
        }

        for (size_t i = 0; i < toScore.size(); ++i) {
            toScore[i].crossEncoderScore = static_cast<double>((*scores)[i]);
        }
        std::stable_sort(toScore.begin(), toScore.end(),
                         [](const RetrievalCandidate& lhs, const RetrievalCandidate& rhs) {
                             return *lhs.crossEncoderScore > *rhs.crossEncoderScore;
                         });
        local.applied = true;
        local.scoredCount = static_cast<int>(toScore.size());
    }
    local.pinnedCount = static_cast<int>(pinned.size());

    std::vector<RetrievalCandidate> refined;
    refined.reserve(candidates.size());
    for (RetrievalCandidate& candidate : pinned) {
        refined.push_back(std::move(candidate));
    }
    for (RetrievalCandidate& candidate : toScore) {
        refined.push_back(std::move(candidate));
    }
    for (size_t i = head; i < candidates.size(); ++i) {
        refined.push_back(std::move(candidates[i]));
    }

    LOG_DEBUG(rcRanking, "Cross-encoder refined %d candidate(s), %d pinned by tag match",
              local.scoredCount, local.pinnedCount);
    return finish(std::move(refined));
}

} // namespace rc
