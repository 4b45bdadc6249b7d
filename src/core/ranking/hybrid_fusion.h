#pragma once

#include "core/index/lexical_index.h"
#include "core/shared/item_catalog.h"
#include "core/shared/retrieval_candidate.h"
#include "core/vector/vector_index.h"

#include <QJsonObject>
#include <QString>
#include <optional>
#include <vector>

namespace rc {

// Score boost driven by an item's metadata.
//  LogCounter: unbounded counters (popularity); factor grows with log(1 + n)
//              and reaches 1 + maxBoost at `saturation`.
//  CategoricalMatch: flat multiplier when a query term equals the field value
//              (or one of its values, for list fields such as topics).
struct MetadataBoostRule {
    enum class Kind {
        LogCounter,
        CategoricalMatch,
    };

    Kind kind = Kind::LogCounter;
    QString field;
    double maxBoost = 0.5;
    double saturation = 100000.0;
    double multiplier = 1.5;

    QJsonObject toJson() const;
    static std::optional<MetadataBoostRule> fromJson(const QJsonObject& json, QString* error = nullptr);
};

struct FusionConfig {
    int rrfK = 60;
    double lexicalWeight = 1.0;
    double vectorWeight = 1.0;

    bool tagBoostEnabled = true;
    double tagLexicalMultiplier = 5.0;
    double tagMarginMin = 1.5;      // tagged score >= natural maximum x margin
    double tagMarginMax = 2.0;

    bool metadataBoostEnabled = true;
    std::vector<MetadataBoostRule> metadataBoosts;

    // hybridWeight in [0, 1] shifts weight from lexical (0) to vector (1);
    // 0.5 with bm25Boost 1.0 gives plain RRF.
    static FusionConfig fromHybridWeight(double hybridWeight, double bm25Boost);
};

// HybridFusion: reciprocal-rank fusion of the lexical and vector lists,
// followed by metadata boosts and the tag-match override.
class HybridFusion {
public:
    static std::vector<RetrievalCandidate> fuse(
        const std::vector<LexicalHit>& lexicalHits,
        const std::vector<VectorHit>& vectorHits,
        const QString& query,
        const ItemCatalog& catalog,
        const FusionConfig& config = {});

    static double rrfContribution(double weight, int rank, int rrfK);
    static double logCounterFactor(double count, const MetadataBoostRule& rule);
    static double tagMargin(int matchedTerms, int queryTerms, const FusionConfig& config);
};

} // namespace rc
