#pragma once

#include "core/shared/types.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <optional>
#include <vector>

namespace rc {

struct SearchLimits {
    int defaultLimit = 10;
    int maxLimit = 100;
    int maxQueryLength = 1000;
};

// One validated search call. Unset optionals fall back to the profile.
struct SearchRequest {
    QString query;
    QString corpus;                         // empty: the default corpus
    QString profile = QStringLiteral("default");
    int limit = 10;
    std::optional<double> minScore;

    std::vector<ItemStatus> includeStatuses{ItemStatus::Active};
    std::vector<ItemStatus> excludeStatuses;
    std::optional<QStringList> includeTypes;
    std::optional<QStringList> excludeTypes;

    std::optional<double> hybridWeight;
    std::optional<bool> expandQuery;
    std::optional<bool> rerank;
    std::optional<bool> timeDecay;
    std::optional<bool> tagBoost;
    std::optional<bool> metadataBoost;
    bool includeBreakdown = true;

    // Fails on a missing or empty query, mistyped fields, unknown statuses,
    // and out-of-range limit, minScore or hybridWeight.
    static std::optional<SearchRequest> fromJson(const QJsonObject& params,
                                                 const SearchLimits& limits = {},
                                                 QString* error = nullptr);
    QJsonObject toJson() const;
};

} // namespace rc
