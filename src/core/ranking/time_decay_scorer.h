#pragma once

#include "core/shared/retrieval_candidate.h"

#include <optional>
#include <vector>

namespace rc {

struct TimeDecayConfig {
    bool enabled = true;
    double halfLifeDays = 90.0;
    double maxBoost = 0.20;
    std::optional<double> maxAgeDays;   // candidates older than this are dropped
};

// Recency adjustment: boost = maxBoost * 0.5^(age / halfLife), applied as
// score * (1 + boost). Timestamps in the future count as age zero.
class TimeDecayScorer {
public:
    explicit TimeDecayScorer(const TimeDecayConfig& config = {});

    double boostForAge(double ageDays) const;
    static double ageInDays(double modifiedAt, double now);

    // Adjusts finalScore in place, applies the age cutoff, and re-sorts.
    // now is seconds since epoch.
    void apply(std::vector<RetrievalCandidate>& candidates, double now) const;

    const TimeDecayConfig& config() const { return m_config; }

private:
    TimeDecayConfig m_config;
};

} // namespace rc
