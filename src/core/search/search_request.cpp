#include "core/search/search_request.h"

#include <QJsonArray>

#include <cmath>

namespace rc {

namespace {

std::optional<QStringList> readStringList(const QJsonObject& params, const QString& key,
                                          QString* error)
{
    const QJsonValue value = params.value(key);
    if (!value.isArray()) {
        if (error) {
            *error = QStringLiteral("'%1' must be an array of strings").arg(key);
        }
        return std::nullopt;
    }
    QStringList out;
    for (const QJsonValue& entry : value.toArray()) {
        if (!entry.isString()) {
            if (error) {
                *error = QStringLiteral("'%1' must be an array of strings").arg(key);
            }
            return std::nullopt;
        }
        const QString text = entry.toString().trimmed();
        if (!text.isEmpty()) {
            out.append(text);
        }
    }
    return out;
}

bool readStatuses(const QJsonObject& params, const QString& key,
                  std::vector<ItemStatus>* out, QString* error)
{
    if (!params.contains(key)) {
        return true;
    }
    auto names = readStringList(params, key, error);
    if (!names) {
        return false;
    }
    out->clear();
    for (const QString& name : *names) {
        auto status = itemStatusFromString(name.toLower());
        if (!status) {
            if (error) {
                *error = QStringLiteral("'%1' has unknown status '%2'").arg(key, name);
            }
            return false;
        }
        out->push_back(*status);
    }
    return true;
}

bool readBool(const QJsonObject& params, const QString& key, std::optional<bool>* out,
              QString* error)
{
    if (!params.contains(key)) {
        return true;
    }
    const QJsonValue value = params.value(key);
    if (!value.isBool()) {
        if (error) {
            *error = QStringLiteral("'%1' must be a boolean").arg(key);
        }
        return false;
    }
    *out = value.toBool();
    return true;
}

QJsonArray statusArray(const std::vector<ItemStatus>& statuses)
{
    QJsonArray array;
    for (ItemStatus status : statuses) {
        array.append(itemStatusToString(status));
    }
    return array;
}

} // namespace

std::optional<SearchRequest> SearchRequest::fromJson(const QJsonObject& params,
                                                     const SearchLimits& limits,
                                                     QString* error)
{
    auto fail = [error](const QString& message) -> std::optional<SearchRequest> {
        if (error) {
            *error = message;
        }
        return std::nullopt;
    };

    SearchRequest request;

    const QJsonValue queryValue = params.value(QStringLiteral("query"));
    if (!queryValue.isString()) {
        return fail(QStringLiteral("'query' must be a string"));
    }
    request.query = queryValue.toString().trimmed();
    if (request.query.isEmpty()) {
        return fail(QStringLiteral("'query' is empty"));
    }
    if (request.query.size() > limits.maxQueryLength) {
        return fail(QStringLiteral("'query' exceeds %1 characters").arg(limits.maxQueryLength));
    }

    if (params.contains(QStringLiteral("corpus"))) {
        const QJsonValue value = params.value(QStringLiteral("corpus"));
        if (!value.isString()) {
            return fail(QStringLiteral("'corpus' must be a string"));
        }
        request.corpus = value.toString().trimmed();
    }

    if (params.contains(QStringLiteral("profile"))) {
        const QJsonValue value = params.value(QStringLiteral("profile"));
        if (!value.isString() || value.toString().trimmed().isEmpty()) {
            return fail(QStringLiteral("'profile' must be a non-empty string"));
        }
        request.profile = value.toString().trimmed();
    }

    request.limit = limits.defaultLimit;
    if (params.contains(QStringLiteral("limit"))) {
        const QJsonValue value = params.value(QStringLiteral("limit"));
        const double raw = value.toDouble(-1.0);
        if (!value.isDouble() || raw != std::floor(raw)) {
            return fail(QStringLiteral("'limit' must be an integer"));
        }
        if (raw < 1 || raw > limits.maxLimit) {
            return fail(QStringLiteral("'limit' must be within [1, %1]").arg(limits.maxLimit));
        }
        request.limit = static_cast<int>(raw);
    }

    if (params.contains(QStringLiteral("minScore"))) {
        const QJsonValue value = params.value(QStringLiteral("minScore"));
        if (!value.isDouble() || !std::isfinite(value.toDouble()) || value.toDouble() < 0.0) {
            return fail(QStringLiteral("'minScore' must be a number >= 0"));
        }
        request.minScore = value.toDouble();
    }

    if (params.contains(QStringLiteral("hybridWeight"))) {
        const QJsonValue value = params.value(QStringLiteral("hybridWeight"));
        const double weight = value.toDouble(-1.0);
        if (!value.isDouble() || weight < 0.0 || weight > 1.0) {
            return fail(QStringLiteral("'hybridWeight' must be within [0, 1]"));
        }
        request.hybridWeight = weight;
    }

    QString fieldError;
    if (!readStatuses(params, QStringLiteral("includeStatuses"), &request.includeStatuses, &fieldError)
        || !readStatuses(params, QStringLiteral("excludeStatuses"), &request.excludeStatuses, &fieldError)) {
        return fail(fieldError);
    }

    for (const QString& key : {QStringLiteral("includeTypes"), QStringLiteral("excludeTypes")}) {
        if (!params.contains(key)) {
            continue;
        }
        auto types = readStringList(params, key, &fieldError);
        if (!types) {
            return fail(fieldError);
        }
        if (key == QLatin1String("includeTypes")) {
            request.includeTypes = *types;
        } else {
            request.excludeTypes = *types;
        }
    }

    if (!readBool(params, QStringLiteral("expand"), &request.expandQuery, &fieldError)
        || !readBool(params, QStringLiteral("rerank"), &request.rerank, &fieldError)
        || !readBool(params, QStringLiteral("timeDecay"), &request.timeDecay, &fieldError)
        || !readBool(params, QStringLiteral("tagBoost"), &request.tagBoost, &fieldError)
        || !readBool(params, QStringLiteral("metadataBoost"), &request.metadataBoost, &fieldError)) {
        return fail(fieldError);
    }

    std::optional<bool> breakdown;
    if (!readBool(params, QStringLiteral("includeBreakdown"), &breakdown, &fieldError)) {
        return fail(fieldError);
    }
    request.includeBreakdown = breakdown.value_or(true);

    return request;
}

QJsonObject SearchRequest::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("query")] = query;
    if (!corpus.isEmpty()) {
        json[QStringLiteral("corpus")] = corpus;
    }
    json[QStringLiteral("profile")] = profile;
    json[QStringLiteral("limit")] = limit;
    if (minScore) {
        json[QStringLiteral("minScore")] = *minScore;
    }
    json[QStringLiteral("includeStatuses")] = statusArray(includeStatuses);
    if (!excludeStatuses.empty()) {
        json[QStringLiteral("excludeStatuses")] = statusArray(excludeStatuses);
    }
    if (includeTypes) {
        json[QStringLiteral("includeTypes")] = QJsonArray::fromStringList(*includeTypes);
    }
    if (excludeTypes) {
        json[QStringLiteral("excludeTypes")] = QJsonArray::fromStringList(*excludeTypes);
    }
    if (hybridWeight) {
        json[QStringLiteral("hybridWeight")] = *hybridWeight;
    }
    if (expandQuery) {
        json[QStringLiteral("expand")] = *expandQuery;
    }
    if (rerank) {
        json[QStringLiteral("rerank")] = *rerank;
    }
    if (timeDecay) {
        json[QStringLiteral("timeDecay")] = *timeDecay;
    }
    if (tagBoost) {
        json[QStringLiteral("tagBoost")] = *tagBoost;
    }
    if (metadataBoost) {
        json[QStringLiteral("metadataBoost")] = *metadataBoost;
    }
    json[QStringLiteral("includeBreakdown")] = includeBreakdown;
    return json;
}

} // namespace rc
