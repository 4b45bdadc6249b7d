#include "core/search/search_profiles.h"
#include "core/shared/logging.h"

#include <QJsonArray>

namespace rc {

namespace {

MetadataBoostRule logRule(const QString& field, double maxBoost)
{
    MetadataBoostRule rule;
    rule.kind = MetadataBoostRule::Kind::LogCounter;
    rule.field = field;
    rule.maxBoost = maxBoost;
    return rule;
}

MetadataBoostRule matchRule(const QString& field, double multiplier)
{
    MetadataBoostRule rule;
    rule.kind = MetadataBoostRule::Kind::CategoricalMatch;
    rule.field = field;
    rule.multiplier = multiplier;
    return rule;
}

TimeDecayConfig decay(double halfLifeDays, double maxBoost)
{
    TimeDecayConfig config;
    config.halfLifeDays = halfLifeDays;
    config.maxBoost = maxBoost;
    return config;
}

QStringList stringList(const QJsonValue& value)
{
    QStringList out;
    for (const QJsonValue& entry : value.toArray()) {
        const QString text = entry.toString().trimmed();
        if (!text.isEmpty()) {
            out.append(text);
        }
    }
    return out;
}

} // namespace

// ── SearchProfile ───────────────────────────────────────────

FusionConfig SearchProfile::fusionConfig() const
{
    FusionConfig config = FusionConfig::fromHybridWeight(hybridWeight, bm25Boost);
    config.metadataBoosts = metadataBoosts;
    config.metadataBoostEnabled = !metadataBoosts.empty();
    return config;
}

TimeDecayConfig SearchProfile::timeDecayConfig() const
{
    TimeDecayConfig config = timeDecay.value_or(TimeDecayConfig{});
    config.enabled = timeDecay.has_value();
    config.maxAgeDays = maxAgeDays;
    return config;
}

ChunkerConfig SearchProfile::chunkerConfig() const
{
    ChunkerConfig config;
    config.chunkSize = chunkSize;
    config.overlap = chunkOverlap;
    return config;
}

QJsonObject SearchProfile::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("name")] = name;
    json[QStringLiteral("displayName")] = displayName;
    json[QStringLiteral("description")] = description;
    json[QStringLiteral("hybridWeight")] = hybridWeight;
    json[QStringLiteral("bm25Boost")] = bm25Boost;

    QJsonArray boosts;
    for (const MetadataBoostRule& rule : metadataBoosts) {
        boosts.append(rule.toJson());
    }
    json[QStringLiteral("metadataBoosts")] = boosts;

    if (timeDecay) {
        QJsonObject decayJson;
        decayJson[QStringLiteral("halfLifeDays")] = timeDecay->halfLifeDays;
        decayJson[QStringLiteral("maxBoost")] = timeDecay->maxBoost;
        json[QStringLiteral("timeDecay")] = decayJson;
    } else {
        json[QStringLiteral("timeDecay")] = QJsonValue::Null;
    }
    if (maxAgeDays) {
        json[QStringLiteral("maxAgeDays")] = *maxAgeDays;
    }

    json[QStringLiteral("crossEncoderEnabled")] = crossEncoderEnabled;
    json[QStringLiteral("queryExpansionEnabled")] = queryExpansionEnabled;
    json[QStringLiteral("defaultIncludeTypes")] = QJsonArray::fromStringList(defaultIncludeTypes);
    json[QStringLiteral("defaultExcludeTypes")] = QJsonArray::fromStringList(defaultExcludeTypes);
    json[QStringLiteral("chunkingEnabled")] = chunkingEnabled;
    json[QStringLiteral("chunkSize")] = chunkSize;
    json[QStringLiteral("chunkOverlap")] = chunkOverlap;
    json[QStringLiteral("showChunkContext")] = showChunkContext;
    return json;
}

std::optional<SearchProfile> SearchProfile::fromJson(const QString& name, const QJsonObject& json,
                                                     QString* error)
{
    auto fail = [&](const QString& message) -> std::optional<SearchProfile> {
        if (error) {
            *error = QStringLiteral("Profile '%1': %2").arg(name, message);
        }
        return std::nullopt;
    };

    if (name.trimmed().isEmpty()) {
        return fail(QStringLiteral("name is empty"));
    }

    SearchProfile profile;
    profile.name = name;
    profile.displayName = json.value(QStringLiteral("displayName")).toString(name);
    profile.description = json.value(QStringLiteral("description"))
                              .toString(QStringLiteral("Custom search profile"));

    profile.hybridWeight = json.value(QStringLiteral("hybridWeight")).toDouble(profile.hybridWeight);
    if (profile.hybridWeight < 0.0 || profile.hybridWeight > 1.0) {
        return fail(QStringLiteral("hybridWeight must be within [0, 1]"));
    }
    profile.bm25Boost = json.value(QStringLiteral("bm25Boost")).toDouble(profile.bm25Boost);
    if (profile.bm25Boost < 0.0) {
        return fail(QStringLiteral("bm25Boost must be >= 0"));
    }

    for (const QJsonValue& value : json.value(QStringLiteral("metadataBoosts")).toArray()) {
        QString ruleError;
        auto rule = MetadataBoostRule::fromJson(value.toObject(), &ruleError);
        if (!rule) {
            return fail(ruleError);
        }
        profile.metadataBoosts.push_back(*rule);
    }

    const QJsonValue decayValue = json.value(QStringLiteral("timeDecay"));
    if (decayValue.isObject()) {
        const QJsonObject decayJson = decayValue.toObject();
        TimeDecayConfig config;
        config.halfLifeDays = decayJson.value(QStringLiteral("halfLifeDays")).toDouble(config.halfLifeDays);
        config.maxBoost = decayJson.value(QStringLiteral("maxBoost")).toDouble(config.maxBoost);
        if (config.halfLifeDays <= 0.0 || config.maxBoost < 0.0) {
            return fail(QStringLiteral("timeDecay needs halfLifeDays > 0 and maxBoost >= 0"));
        }
        profile.timeDecay = config;
    } else if (!decayValue.isUndefined() && !decayValue.isNull()) {
        return fail(QStringLiteral("timeDecay must be an object or null"));
    }

    if (json.contains(QStringLiteral("maxAgeDays"))
        && !json.value(QStringLiteral("maxAgeDays")).isNull()) {
        const double maxAge = json.value(QStringLiteral("maxAgeDays")).toDouble(-1.0);
        if (maxAge <= 0.0) {
            return fail(QStringLiteral("maxAgeDays must be > 0"));
        }
        profile.maxAgeDays = maxAge;
    }

    profile.crossEncoderEnabled =
        json.value(QStringLiteral("crossEncoderEnabled")).toBool(profile.crossEncoderEnabled);
    profile.queryExpansionEnabled =
        json.value(QStringLiteral("queryExpansionEnabled")).toBool(profile.queryExpansionEnabled);
    profile.defaultIncludeTypes = stringList(json.value(QStringLiteral("defaultIncludeTypes")));
    profile.defaultExcludeTypes = stringList(json.value(QStringLiteral("defaultExcludeTypes")));
    profile.chunkingEnabled = json.value(QStringLiteral("chunkingEnabled")).toBool(profile.chunkingEnabled);
    profile.chunkSize = json.value(QStringLiteral("chunkSize")).toInt(profile.chunkSize);
    profile.chunkOverlap = json.value(QStringLiteral("chunkOverlap")).toInt(profile.chunkOverlap);
    profile.showChunkContext = json.value(QStringLiteral("showChunkContext")).toBool(profile.showChunkContext);

    QString chunkError;
    if (!Chunker::validate(profile.chunkerConfig(), &chunkError)) {
        return fail(chunkError);
    }
    return profile;
}

// ── SearchProfileRegistry ───────────────────────────────────

std::vector<SearchProfile> SearchProfileRegistry::builtinProfiles()
{
    std::vector<SearchProfile> profiles;

    SearchProfile repos;
    repos.name = QStringLiteral("repos");
    repos.displayName = QStringLiteral("Repos & Tech");
    repos.description = QStringLiteral("Find repositories, libraries and tools by keywords and popularity");
    repos.hybridWeight = 0.3;
    repos.bm25Boost = 2.0;
    repos.metadataBoosts = {
        logRule(QStringLiteral("popularity"), 0.5),
        matchRule(QStringLiteral("topics"), 3.0),
        matchRule(QStringLiteral("language"), 1.5),
    };
    repos.crossEncoderEnabled = false;
    repos.defaultIncludeTypes = {QStringLiteral("gleaning")};
    repos.chunkingEnabled = false;
    profiles.push_back(repos);

    SearchProfile recent;
    recent.name = QStringLiteral("recent");
    recent.displayName = QStringLiteral("Recent Work");
    recent.description = QStringLiteral("Find what you wrote or saved recently (last 90 days)");
    recent.timeDecay = decay(7.0, 0.5);
    recent.maxAgeDays = 90.0;
    recent.defaultIncludeTypes = {QStringLiteral("daily"), QStringLiteral("note"),
                                  QStringLiteral("writering")};
    profiles.push_back(recent);

    SearchProfile deep;
    deep.name = QStringLiteral("deep");
    deep.displayName = QStringLiteral("Deep Reading");
    deep.description = QStringLiteral("Search long-form content with full context");
    deep.hybridWeight = 0.8;
    deep.showChunkContext = true;
    deep.defaultExcludeTypes = {QStringLiteral("daily"), QStringLiteral("gleaning")};
    profiles.push_back(deep);

    SearchProfile keywords;
    keywords.name = QStringLiteral("keywords");
    keywords.displayName = QStringLiteral("Keyword Search");
    keywords.description = QStringLiteral("Exact keyword matching for technical terms, names, phrases");
    keywords.hybridWeight = 0.2;
    keywords.bm25Boost = 1.5;
    keywords.crossEncoderEnabled = false;
    profiles.push_back(keywords);

    SearchProfile balanced;
    balanced.name = QStringLiteral("default");
    balanced.displayName = QStringLiteral("Balanced");
    balanced.description = QStringLiteral("General-purpose search");
    balanced.timeDecay = decay(90.0, 0.2);
    balanced.defaultExcludeTypes = {QStringLiteral("daily")};
    profiles.push_back(balanced);

    return profiles;
}

SearchProfileRegistry::SearchProfileRegistry()
{
    for (SearchProfile& profile : builtinProfiles()) {
        const QString name = profile.name;
        m_profiles.emplace(name, std::move(profile));
    }
}

bool SearchProfileRegistry::isBuiltin(const QString& name)
{
    for (const SearchProfile& profile : builtinProfiles()) {
        if (profile.name == name) {
            return true;
        }
    }
    return false;
}

bool SearchProfileRegistry::addCustom(const SearchProfile& profile, QString* error)
{
    if (isBuiltin(profile.name)) {
        if (error) {
            *error = QStringLiteral("Custom profile '%1' would shadow a built-in profile")
                         .arg(profile.name);
        }
        return false;
    }
    if (m_profiles.count(profile.name) > 0) {
        if (error) {
            *error = QStringLiteral("Duplicate profile '%1'").arg(profile.name);
        }
        return false;
    }
    m_profiles.emplace(profile.name, profile);
    LOG_INFO(rcCore, "Loaded custom profile: %s", qUtf8Printable(profile.name));
    return true;
}

std::optional<SearchProfile> SearchProfileRegistry::find(const QString& name) const
{
    auto it = m_profiles.find(name);
    if (it == m_profiles.end()) {
        return std::nullopt;
    }
    return it->second;
}

QStringList SearchProfileRegistry::names() const
{
    QStringList out;
    for (const auto& entry : m_profiles) {
        out.append(entry.first);
    }
    return out;
}

QJsonObject SearchProfileRegistry::toJson() const
{
    QJsonArray profiles;
    for (const auto& entry : m_profiles) {
        profiles.append(entry.second.toJson());
    }
    QJsonObject json;
    json[QStringLiteral("profiles")] = profiles;
    json[QStringLiteral("default")] = QString::fromLatin1(kDefaultProfile);
    return json;
}

} // namespace rc
