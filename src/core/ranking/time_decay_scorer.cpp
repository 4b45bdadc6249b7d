#include "core/ranking/time_decay_scorer.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <cmath>

namespace rc {

namespace {

constexpr double kSecondsPerDay = 86400.0;

} // namespace

TimeDecayScorer::TimeDecayScorer(const TimeDecayConfig& config)
    : m_config(config)
{
}

double TimeDecayScorer::ageInDays(double modifiedAt, double now)
{
    return std::max(0.0, (now - modifiedAt) / kSecondsPerDay);
}

double TimeDecayScorer::boostForAge(double ageDays) const
{
    if (m_config.halfLifeDays <= 0.0) {
        return 0.0;
    }
    const double age = std::max(0.0, ageDays);
    return m_config.maxBoost * std::pow(0.5, age / m_config.halfLifeDays);
}

void TimeDecayScorer::apply(std::vector<RetrievalCandidate>& candidates, double now) const
{
    if (m_config.maxAgeDays) {
        const double maxAge = *m_config.maxAgeDays;
        const auto before = candidates.size();
        candidates.erase(
            std::remove_if(candidates.begin(), candidates.end(),
                           [&](const RetrievalCandidate& candidate) {
                               return candidate.item
                                   && ageInDays(candidate.item->modifiedAt, now) > maxAge;
                           }),
            candidates.end());
        if (candidates.size() != before) {
            LOG_DEBUG(rcRanking, "Age cutoff %.0fd removed %d candidate(s)", maxAge,
                      static_cast<int>(before - candidates.size()));
        }
    }

    if (!m_config.enabled) {
        return;
    }

    for (RetrievalCandidate& candidate : candidates) {
        if (!candidate.item) {
            continue;
        }
        const double boost = boostForAge(ageInDays(candidate.item->modifiedAt, now));
        candidate.timeDecayFactor = 1.0 + boost;
        candidate.finalScore *= candidate.timeDecayFactor;
    }
    sortByFinalScore(candidates);
}

} // namespace rc
