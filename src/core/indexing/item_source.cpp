#include "core/indexing/item_source.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSet>

namespace rc {

JsonItemSource::JsonItemSource(const QString& fileName)
    : m_fileName(fileName)
{
}

std::optional<std::vector<Item>> JsonItemSource::loadItems(const QString& corpusRoot,
                                                           QString* error)
{
    const QString path = QDir(corpusRoot).filePath(m_fileName);
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) {
            *error = QStringLiteral("Cannot open item source %1: %2").arg(path, file.errorString());
        }
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (error) {
            *error = QStringLiteral("Cannot parse %1: %2").arg(path, parseError.errorString());
        }
        return std::nullopt;
    }

    QJsonArray entries;
    if (doc.isArray()) {
        entries = doc.array();
    } else if (doc.isObject() && doc.object().value(QStringLiteral("items")).isArray()) {
        entries = doc.object().value(QStringLiteral("items")).toArray();
    } else {
        if (error) {
            *error = QStringLiteral("%1 holds neither an item array nor an \"items\" array").arg(path);
        }
        return std::nullopt;
    }

    std::vector<Item> items;
    items.reserve(static_cast<size_t>(entries.size()));
    QSet<QString> seen;
    int skipped = 0;
    for (int i = 0; i < entries.size(); ++i) {
        QString entryError;
        auto item = Item::fromJson(entries.at(i).toObject(), &entryError);
        if (!item) {
            LOG_WARN(rcIndex, "Skipping item #%d in %s: %s", i, qUtf8Printable(path),
                     qUtf8Printable(entryError));
            ++skipped;
            continue;
        }
        if (seen.contains(item->id)) {
            LOG_WARN(rcIndex, "Skipping duplicate item id %s in %s",
                     qUtf8Printable(item->id), qUtf8Printable(path));
            ++skipped;
            continue;
        }
        seen.insert(item->id);
        items.push_back(std::move(*item));
    }

    LOG_INFO(rcIndex, "Loaded %d item(s) from %s (%d skipped)",
             static_cast<int>(items.size()), qUtf8Printable(path), skipped);
    return items;
}

} // namespace rc
