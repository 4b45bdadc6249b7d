#pragma once

#include <QJsonObject>
#include <QString>
#include <optional>

namespace rc {

// A named root of items plus the directory holding its index files.
struct Corpus {
    QString name;
    QString rootPath;
    QString storagePath;
    QString modelId;                        // embedding model the index was built with
    std::optional<double> lastIndexedAt;    // seconds since epoch

    QJsonObject toJson() const;
};

// File names inside a corpus storage directory.
namespace storage_layout {

QString manifestPath(const QString& storagePath);       // index.json
QString lexicalDbPath(const QString& storagePath);      // lexical.db
QString vectorIndexPath(const QString& storagePath);    // vectors.bin
QString vectorMetaPath(const QString& storagePath);     // vectors.meta.json

} // namespace storage_layout

// Contents of index.json. Written last by the indexer so a manifest implies
// a complete index. Manifests without corpusRoot are legacy.
struct IndexManifest {
    QString corpusRoot;
    QString corpusName;
    QString modelId;
    QString buildId;                // matches the build_id of the files it describes
    int dimensions = 0;
    double indexedAt = 0.0;
    int itemCount = 0;
    int documentCount = 0;
    int schemaVersion = 1;
    QString migratedAt;             // ISO-8601, set by legacy migration

    QJsonObject toJson() const;
    static IndexManifest fromJson(const QJsonObject& json);

    // nullopt when the file is missing or unreadable; error is set only for
    // a file that exists but cannot be parsed.
    static std::optional<QJsonObject> readRaw(const QString& storagePath, QString* error = nullptr);
    static std::optional<IndexManifest> read(const QString& storagePath, QString* error = nullptr);

    // Atomic replace of index.json.
    static bool writeRaw(const QString& storagePath, const QJsonObject& json, QString* error = nullptr);
    bool write(const QString& storagePath, QString* error = nullptr) const;
};

// Absolute, symlink-resolved form used to compare corpus roots.
QString normalizedPath(const QString& path);

} // namespace rc
