#include "core/ranking/hybrid_fusion.h"
#include "core/shared/logging.h"

#include <QHash>
#include <QVariant>

#include <algorithm>
#include <cmath>

namespace rc {

namespace {

QStringList fieldValues(const Item& item, const QString& field)
{
    if (field == QLatin1String("topics")) {
        return item.metadata.topics;
    }
    if (field == QLatin1String("language")) {
        return {item.metadata.language};
    }
    if (field == QLatin1String("type")) {
        return {item.metadata.type};
    }
    if (field == QLatin1String("tags")) {
        return item.tags;
    }
    const QVariant value = item.metadata.extra.value(field);
    if (value.canConvert<QStringList>() && value.typeId() != QMetaType::QString) {
        return value.toStringList();
    }
    return {value.toString()};
}

std::optional<double> counterValue(const Item& item, const QString& field)
{
    if (field == QLatin1String("popularity")) {
        if (item.metadata.popularity) {
            return static_cast<double>(*item.metadata.popularity);
        }
        return std::nullopt;
    }
    const QVariant value = item.metadata.extra.value(field);
    bool ok = false;
    const double number = value.toDouble(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return number;
}

void applyMetadataBoosts(RetrievalCandidate& candidate, const QStringList& queryTerms,
                         const std::vector<MetadataBoostRule>& rules)
{
    const Item& item = *candidate.item;
    for (const MetadataBoostRule& rule : rules) {
        double factor = 1.0;
        QString reason;

        if (rule.kind == MetadataBoostRule::Kind::LogCounter) {
            const std::optional<double> count = counterValue(item, rule.field);
            if (!count || *count <= 0.0) {
                continue;
            }
            factor = HybridFusion::logCounterFactor(*count, rule);
            reason = QStringLiteral("%1=%2").arg(rule.field).arg(*count, 0, 'f', 0);
        } else {
            const QStringList values = fieldValues(item, rule.field);
            for (const QString& value : values) {
                const QString normalized = LexicalIndex::normalizeTag(value);
                if (!normalized.isEmpty() && queryTerms.contains(normalized)) {
                    factor = rule.multiplier;
                    reason = QStringLiteral("%1:%2").arg(rule.field, normalized);
                    break;
                }
            }
        }

        if (factor == 1.0) {
            continue;
        }
        candidate.fusedScore *= factor;
        candidate.boosts.push_back(BoostAnnotation{QStringLiteral("metadata"), reason, factor});
        LOG_DEBUG(rcRanking, "Metadata boost %s x%.3f on %s",
                  qUtf8Printable(reason), factor, qUtf8Printable(candidate.doc.docId));
    }
}

} // namespace

// ── MetadataBoostRule ───────────────────────────────────────

QJsonObject MetadataBoostRule::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("field")] = field;
    if (kind == Kind::LogCounter) {
        json[QStringLiteral("kind")] = QStringLiteral("log");
        json[QStringLiteral("maxBoost")] = maxBoost;
        json[QStringLiteral("saturation")] = saturation;
    } else {
        json[QStringLiteral("kind")] = QStringLiteral("match");
        json[QStringLiteral("multiplier")] = multiplier;
    }
    return json;
}

std::optional<MetadataBoostRule> MetadataBoostRule::fromJson(const QJsonObject& json, QString* error)
{
    auto fail = [error](const QString& message) -> std::optional<MetadataBoostRule> {
        if (error) {
            *error = message;
        }
        return std::nullopt;
    };

    MetadataBoostRule rule;
    rule.field = json.value(QStringLiteral("field")).toString().trimmed();
    if (rule.field.isEmpty()) {
        return fail(QStringLiteral("metadata boost is missing a field"));
    }

    const QString kind = json.value(QStringLiteral("kind")).toString();
    if (kind == QLatin1String("log")) {
        rule.kind = Kind::LogCounter;
        rule.maxBoost = json.value(QStringLiteral("maxBoost")).toDouble(rule.maxBoost);
        rule.saturation = json.value(QStringLiteral("saturation")).toDouble(rule.saturation);
        if (rule.maxBoost < 0.0 || rule.saturation <= 0.0) {
            return fail(QStringLiteral("metadata boost '%1' needs maxBoost >= 0 and saturation > 0")
                            .arg(rule.field));
        }
    } else if (kind == QLatin1String("match")) {
        rule.kind = Kind::CategoricalMatch;
        rule.multiplier = json.value(QStringLiteral("multiplier")).toDouble(rule.multiplier);
        if (rule.multiplier <= 0.0) {
            return fail(QStringLiteral("metadata boost '%1' needs a positive multiplier")
                            .arg(rule.field));
        }
    } else {
        return fail(QStringLiteral("metadata boost '%1' has unknown kind '%2'")
                        .arg(rule.field, kind));
    }
    return rule;
}

// ── FusionConfig ────────────────────────────────────────────

FusionConfig FusionConfig::fromHybridWeight(double hybridWeight, double bm25Boost)
{
    FusionConfig config;
    const double h = std::clamp(hybridWeight, 0.0, 1.0);
    config.lexicalWeight = 2.0 * (1.0 - h) * std::max(bm25Boost, 0.0);
    config.vectorWeight = 2.0 * h;
    return config;
}

// ── HybridFusion ────────────────────────────────────────────

double HybridFusion::rrfContribution(double weight, int rank, int rrfK)
{
    if (rank <= 0) {
        return 0.0;
    }
    const int denom = std::max(1, rrfK) + rank;
    return weight / static_cast<double>(denom);
}

double HybridFusion::logCounterFactor(double count, const MetadataBoostRule& rule)
{
    if (count <= 0.0) {
        return 1.0;
    }
    const double scale = std::log1p(count) / std::log1p(std::max(rule.saturation, 1.0));
    return 1.0 + rule.maxBoost * std::min(1.0, scale);
}

double HybridFusion::tagMargin(int matchedTerms, int queryTerms, const FusionConfig& config)
{
    const double low = std::max(1.0, std::min(config.tagMarginMin, config.tagMarginMax));
    const double high = std::max(low, config.tagMarginMax);
    if (queryTerms <= 0) {
        return low;
    }
    const double ratio = std::clamp(static_cast<double>(matchedTerms) / queryTerms, 0.0, 1.0);
    return low + (high - low) * ratio;
}

std::vector<RetrievalCandidate> HybridFusion::fuse(
    const std::vector<LexicalHit>& lexicalHits,
    const std::vector<VectorHit>& vectorHits,
    const QString& query,
    const ItemCatalog& catalog,
    const FusionConfig& config)
{
    std::vector<RetrievalCandidate> candidates;
    candidates.reserve(lexicalHits.size() + vectorHits.size());
    QHash<QString, int> byDocId;

    auto candidateFor = [&](const DocumentRef& doc) -> RetrievalCandidate* {
        const auto it = byDocId.constFind(doc.docId);
        if (it != byDocId.constEnd()) {
            return &candidates[static_cast<size_t>(it.value())];
        }
        std::shared_ptr<const Item> item = catalog.find(doc.parentId);
        if (!item) {
            LOG_WARN(rcRanking, "Dropping hit %s: item %s not in catalog",
                     qUtf8Printable(doc.docId), qUtf8Printable(doc.parentId));
            return nullptr;
        }
        RetrievalCandidate candidate;
        candidate.doc = doc;
        candidate.item = std::move(item);
        byDocId.insert(doc.docId, static_cast<int>(candidates.size()));
        candidates.push_back(std::move(candidate));
        return &candidates.back();
    };

    // Ranks are positions in the incoming lists; a doc repeated in one list keeps its best rank.
    for (size_t i = 0; i < lexicalHits.size(); ++i) {
        const LexicalHit& hit = lexicalHits[i];
        RetrievalCandidate* candidate = candidateFor(hit.doc);
        if (!candidate || candidate->lexicalRank) {
            continue;
        }
        candidate->lexicalRank = static_cast<int>(i) + 1;
        candidate->lexicalScore = hit.score;
        candidate->tagMatched = config.tagBoostEnabled && hit.tagMatch;
        candidate->matchedTags = hit.matchedTags;
    }
    for (size_t i = 0; i < vectorHits.size(); ++i) {
        const VectorHit& hit = vectorHits[i];
        RetrievalCandidate* candidate = candidateFor(hit.doc);
        if (!candidate || candidate->vectorRank) {
            continue;
        }
        candidate->vectorRank = static_cast<int>(i) + 1;
        candidate->vectorScore = hit.similarity;
    }

    if (candidates.empty()) {
        return candidates;
    }

    const QStringList queryTerms = LexicalIndex::tagTerms(query);

    for (RetrievalCandidate& candidate : candidates) {
        double lexicalWeight = config.lexicalWeight;
        if (candidate.tagMatched) {
            lexicalWeight *= config.tagLexicalMultiplier;
        }
        candidate.fusedScore =
            rrfContribution(lexicalWeight, candidate.lexicalRank.value_or(0), config.rrfK)
            + rrfContribution(config.vectorWeight, candidate.vectorRank.value_or(0), config.rrfK);

        if (config.metadataBoostEnabled && !config.metadataBoosts.empty()) {
            applyMetadataBoosts(candidate, queryTerms, config.metadataBoosts);
        }
    }

    // Tag matches are lifted above the best natural score last, so no other
    // boost can put an untagged item ahead of a tagged one.
    if (config.tagBoostEnabled) {
        double naturalMax = 0.0;
        for (const RetrievalCandidate& candidate : candidates) {
            naturalMax = std::max(naturalMax, candidate.fusedScore);
        }
        for (RetrievalCandidate& candidate : candidates) {
            if (!candidate.tagMatched) {
                continue;
            }
            const double margin = tagMargin(candidate.matchedTags.size(), queryTerms.size(), config);
            const double natural = candidate.fusedScore;
            candidate.fusedScore = naturalMax * margin + natural;
            const double factor = natural > 0.0 ? candidate.fusedScore / natural : margin;
            candidate.boosts.push_back(BoostAnnotation{
                QStringLiteral("tag"),
                QStringLiteral("tag:%1 margin=%2").arg(candidate.matchedTags.join(QLatin1Char(',')))
                    .arg(margin, 0, 'f', 2),
                factor});
            LOG_DEBUG(rcRanking, "Tag boost on %s: tags=%s margin=%.2f score %.5f -> %.5f",
                      qUtf8Printable(candidate.doc.docId),
                      qUtf8Printable(candidate.matchedTags.join(QLatin1Char(','))),
                      margin, natural, candidate.fusedScore);
        }
    }

    for (RetrievalCandidate& candidate : candidates) {
        candidate.finalScore = candidate.fusedScore;
    }
    sortByFinalScore(candidates);

    LOG_DEBUG(rcRanking, "Fused %d lexical + %d vector hits into %d candidates",
              static_cast<int>(lexicalHits.size()), static_cast<int>(vectorHits.size()),
              static_cast<int>(candidates.size()));
    return candidates;
}

} // namespace rc
