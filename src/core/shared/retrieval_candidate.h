#pragma once

#include "core/shared/chunk.h"
#include "core/shared/types.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <memory>
#include <optional>
#include <vector>

namespace rc {

// Which boost fired for a candidate and by how much it multiplied the score.
struct BoostAnnotation {
    QString kind;       // "tag", "metadata"
    QString reason;     // human-readable trigger, e.g. "tag:ai", "popularity=12000"
    double factor = 1.0;

    QJsonObject toJson() const;
};

// Per-query working record for one retrieval unit. Never persisted.
struct RetrievalCandidate {
    DocumentRef doc;
    std::shared_ptr<const Item> item;

    std::optional<int> lexicalRank;     // 1-based
    std::optional<int> vectorRank;      // 1-based
    double lexicalScore = 0.0;
    double vectorScore = 0.0;
    double fusedScore = 0.0;

    bool tagMatched = false;
    QStringList matchedTags;
    std::vector<BoostAnnotation> boosts;

    double timeDecayFactor = 1.0;       // multiplier, 1 + boost
    double finalScore = 0.0;
    int siblingMatches = 0;             // other chunks of the same item that matched
    std::optional<double> crossEncoderScore;

    // Chunk text for chunked items, otherwise the item body.
    QString passageText() const;
    // "title\npassage", as fed to the relevance model.
    QString relevanceText() const;

    // withPassage adds the full chunk text next to the truncated snippet.
    QJsonObject toJson(bool includeBreakdown = true, bool withPassage = false) const;
};

// Stable sort by finalScore desc, then lexical score desc, item id asc, doc id asc.
void sortByFinalScore(std::vector<RetrievalCandidate>& candidates);
bool rankedBefore(const RetrievalCandidate& lhs, const RetrievalCandidate& rhs);

} // namespace rc
