#include "core/corpus/corpus.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>

namespace rc {

QJsonObject Corpus::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("name")] = name;
    json[QStringLiteral("root")] = rootPath;
    json[QStringLiteral("storage")] = storagePath;
    json[QStringLiteral("modelId")] = modelId;
    if (lastIndexedAt) {
        json[QStringLiteral("lastIndexedAt")] = *lastIndexedAt;
    }
    return json;
}

namespace storage_layout {

QString manifestPath(const QString& storagePath)
{
    return QDir(storagePath).filePath(QStringLiteral("index.json"));
}

QString lexicalDbPath(const QString& storagePath)
{
    return QDir(storagePath).filePath(QStringLiteral("lexical.db"));
}

QString vectorIndexPath(const QString& storagePath)
{
    return QDir(storagePath).filePath(QStringLiteral("vectors.bin"));
}

QString vectorMetaPath(const QString& storagePath)
{
    return QDir(storagePath).filePath(QStringLiteral("vectors.meta.json"));
}

} // namespace storage_layout

QJsonObject IndexManifest::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("corpus_root")] = corpusRoot;
    json[QStringLiteral("corpus_name")] = corpusName;
    json[QStringLiteral("model_id")] = modelId;
    if (!buildId.isEmpty()) {
        json[QStringLiteral("build_id")] = buildId;
    }
    json[QStringLiteral("dimensions")] = dimensions;
    json[QStringLiteral("indexed_at")] = indexedAt;
    json[QStringLiteral("item_count")] = itemCount;
    json[QStringLiteral("document_count")] = documentCount;
    json[QStringLiteral("schema_version")] = schemaVersion;
    if (!migratedAt.isEmpty()) {
        json[QStringLiteral("migrated_at")] = migratedAt;
    }
    return json;
}

IndexManifest IndexManifest::fromJson(const QJsonObject& json)
{
    IndexManifest manifest;
    manifest.corpusRoot = json.value(QStringLiteral("corpus_root")).toString();
    manifest.corpusName = json.value(QStringLiteral("corpus_name")).toString();
    manifest.modelId = json.value(QStringLiteral("model_id")).toString();
    manifest.buildId = json.value(QStringLiteral("build_id")).toString();
    manifest.dimensions = json.value(QStringLiteral("dimensions")).toInt();
    manifest.indexedAt = json.value(QStringLiteral("indexed_at")).toDouble();
    manifest.itemCount = json.value(QStringLiteral("item_count")).toInt();
    manifest.documentCount = json.value(QStringLiteral("document_count")).toInt();
    manifest.schemaVersion = json.value(QStringLiteral("schema_version")).toInt(1);
    manifest.migratedAt = json.value(QStringLiteral("migrated_at")).toString();
    return manifest;
}

std::optional<QJsonObject> IndexManifest::readRaw(const QString& storagePath, QString* error)
{
    const QString path = storage_layout::manifestPath(storagePath);
    QFile file(path);
    if (!file.exists()) {
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) {
            *error = QStringLiteral("Cannot open %1: %2").arg(path, file.errorString());
        }
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error) {
            *error = QStringLiteral("Cannot parse %1: %2").arg(path, parseError.errorString());
        }
        return std::nullopt;
    }
    return doc.object();
}

std::optional<IndexManifest> IndexManifest::read(const QString& storagePath, QString* error)
{
    auto raw = readRaw(storagePath, error);
    if (!raw) {
        return std::nullopt;
    }
    return fromJson(*raw);
}

bool IndexManifest::writeRaw(const QString& storagePath, const QJsonObject& json, QString* error)
{
    if (!QDir().mkpath(storagePath)) {
        if (error) {
            *error = QStringLiteral("Cannot create storage directory %1").arg(storagePath);
        }
        return false;
    }

    const QString path = storage_layout::manifestPath(storagePath);
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        if (error) {
            *error = QStringLiteral("Cannot write %1: %2").arg(path, file.errorString());
        }
        return false;
    }
    file.write(QJsonDocument(json).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        if (error) {
            *error = QStringLiteral("Cannot commit %1: %2").arg(path, file.errorString());
        }
        return false;
    }
    return true;
}

bool IndexManifest::write(const QString& storagePath, QString* error) const
{
    return writeRaw(storagePath, toJson(), error);
}

QString normalizedPath(const QString& path)
{
    const QFileInfo info(path);
    const QString canonical = info.canonicalFilePath();
    if (!canonical.isEmpty()) {
        return canonical;
    }
    return QDir::cleanPath(info.absoluteFilePath());
}

} // namespace rc
