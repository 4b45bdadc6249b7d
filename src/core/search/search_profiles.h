#pragma once

#include "core/indexing/chunker.h"
#include "core/ranking/hybrid_fusion.h"
#include "core/ranking/time_decay_scorer.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <map>
#include <optional>
#include <vector>

namespace rc {

// Named bundle of retrieval and ranking defaults. Request parameters
// override these per query.
struct SearchProfile {
    QString name;
    QString displayName;
    QString description;

    double hybridWeight = 0.5;          // 0 = lexical only, 1 = semantic only
    double bm25Boost = 1.0;
    std::vector<MetadataBoostRule> metadataBoosts;

    std::optional<TimeDecayConfig> timeDecay;   // nullopt: recency ignored
    std::optional<double> maxAgeDays;           // hard cutoff

    bool crossEncoderEnabled = true;
    bool queryExpansionEnabled = false;

    QStringList defaultIncludeTypes;
    QStringList defaultExcludeTypes;

    bool chunkingEnabled = true;
    int chunkSize = 2000;
    int chunkOverlap = 400;
    bool showChunkContext = false;

    FusionConfig fusionConfig() const;
    TimeDecayConfig timeDecayConfig() const;
    ChunkerConfig chunkerConfig() const;

    QJsonObject toJson() const;
    // Missing keys take the defaults above. Fails on out-of-range values and
    // on chunk parameters the Chunker rejects.
    static std::optional<SearchProfile> fromJson(const QString& name, const QJsonObject& json,
                                                 QString* error = nullptr);
};

// Built-in profiles plus custom ones loaded from configuration.
class SearchProfileRegistry {
public:
    SearchProfileRegistry();

    static std::vector<SearchProfile> builtinProfiles();
    static bool isBuiltin(const QString& name);

    // Rejects names that shadow a built-in profile, and duplicates.
    bool addCustom(const SearchProfile& profile, QString* error = nullptr);

    std::optional<SearchProfile> find(const QString& name) const;
    QStringList names() const;
    QJsonObject toJson() const;

    static constexpr const char* kDefaultProfile = "default";

private:
    std::map<QString, SearchProfile> m_profiles;
};

} // namespace rc
