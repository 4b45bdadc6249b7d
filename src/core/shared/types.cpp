#include "core/shared/types.h"

#include <QJsonArray>

namespace rc {

namespace {

QStringList stringList(const QJsonValue& value)
{
    QStringList out;
    const QJsonArray array = value.toArray();
    for (const QJsonValue& entry : array) {
        const QString text = entry.toString().trimmed();
        if (!text.isEmpty()) {
            out.append(text);
        }
    }
    return out;
}

} // namespace

QString itemStatusToString(ItemStatus status)
{
    switch (status) {
    case ItemStatus::Active:   return QStringLiteral("active");
    case ItemStatus::Inactive: return QStringLiteral("inactive");
    case ItemStatus::Hidden:   return QStringLiteral("hidden");
    }
    return QStringLiteral("active");
}

std::optional<ItemStatus> itemStatusFromString(const QString& str)
{
    if (str == QLatin1String("active"))   return ItemStatus::Active;
    if (str == QLatin1String("inactive")) return ItemStatus::Inactive;
    if (str == QLatin1String("hidden"))   return ItemStatus::Hidden;
    return std::nullopt;
}

// ── ItemMetadata ────────────────────────────────────────────

QJsonObject ItemMetadata::toJson() const
{
    QJsonObject json = QJsonObject::fromVariantMap(extra);
    if (!type.isEmpty()) {
        json[QStringLiteral("type")] = type;
    }
    if (!description.isEmpty()) {
        json[QStringLiteral("description")] = description;
    }
    if (!language.isEmpty()) {
        json[QStringLiteral("language")] = language;
    }
    if (!topics.isEmpty()) {
        json[QStringLiteral("topics")] = QJsonArray::fromStringList(topics);
    }
    if (popularity.has_value()) {
        json[QStringLiteral("popularity")] = static_cast<qint64>(*popularity);
    }
    return json;
}

ItemMetadata ItemMetadata::fromJson(const QJsonObject& json)
{
    ItemMetadata meta;
    for (auto it = json.begin(); it != json.end(); ++it) {
        const QString& key = it.key();
        if (key == QLatin1String("type")) {
            meta.type = it.value().toString().trimmed().toLower();
        } else if (key == QLatin1String("description")) {
            meta.description = it.value().toString();
        } else if (key == QLatin1String("language")) {
            meta.language = it.value().toString().trimmed();
        } else if (key == QLatin1String("topics")) {
            meta.topics = stringList(it.value());
        } else if (key == QLatin1String("popularity")) {
            if (it.value().isDouble()) {
                meta.popularity = it.value().toInteger();
            }
        } else {
            meta.extra.insert(key, it.value().toVariant());
        }
    }
    return meta;
}

// ── Item ────────────────────────────────────────────────────

QJsonObject Item::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("id")] = id;
    json[QStringLiteral("title")] = title;
    json[QStringLiteral("body")] = body;
    json[QStringLiteral("tags")] = QJsonArray::fromStringList(tags);
    json[QStringLiteral("metadata")] = metadata.toJson();
    json[QStringLiteral("modifiedAt")] = modifiedAt;
    json[QStringLiteral("status")] = itemStatusToString(status);
    return json;
}

std::optional<Item> Item::fromJson(const QJsonObject& json, QString* error)
{
    Item item;
    item.id = json.value(QStringLiteral("id")).toString().trimmed();
    if (item.id.isEmpty()) {
        if (error) {
            *error = QStringLiteral("item is missing an id");
        }
        return std::nullopt;
    }

    item.title = json.value(QStringLiteral("title")).toString();
    item.body = json.value(QStringLiteral("body")).toString();
    item.tags = stringList(json.value(QStringLiteral("tags")));
    item.metadata = ItemMetadata::fromJson(json.value(QStringLiteral("metadata")).toObject());
    item.modifiedAt = json.value(QStringLiteral("modifiedAt")).toDouble(0.0);

    const QString statusText = json.value(QStringLiteral("status")).toString();
    if (!statusText.isEmpty()) {
        const auto status = itemStatusFromString(statusText);
        if (!status) {
            if (error) {
                *error = QStringLiteral("item %1 has unknown status '%2'").arg(item.id, statusText);
            }
            return std::nullopt;
        }
        item.status = *status;
    }
    return item;
}

} // namespace rc
