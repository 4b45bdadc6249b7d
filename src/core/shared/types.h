#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QVariantMap>
#include <cstdint>
#include <optional>

namespace rc {

// Lifecycle status of an indexed item. Items are never deleted: an item that
// disappears from its source is marked Inactive, a user-suppressed item Hidden.
enum class ItemStatus {
    Active,
    Inactive,
    Hidden,
};

QString itemStatusToString(ItemStatus status);
std::optional<ItemStatus> itemStatusFromString(const QString& str);

// Well-known metadata fields plus an open bag for provenance-specific keys.
struct ItemMetadata {
    QString type;                       // "note", "daily", "gleaning", ...
    QString description;
    QString language;
    QStringList topics;
    std::optional<int64_t> popularity;  // unbounded counter, e.g. repository stars
    QVariantMap extra;

    QJsonObject toJson() const;
    static ItemMetadata fromJson(const QJsonObject& json);
};

struct Item {
    QString id;
    QString title;
    QString body;
    QStringList tags;
    ItemMetadata metadata;
    double modifiedAt = 0.0;            // seconds since epoch
    ItemStatus status = ItemStatus::Active;

    QJsonObject toJson() const;
    static std::optional<Item> fromJson(const QJsonObject& json, QString* error = nullptr);
};

} // namespace rc
