#include "core/corpus/storage_guard.h"
#include "core/corpus/corpus.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QJsonObject>

namespace rc {

QString StorageGuard::deriveStoragePath(const QString& corpusRoot,
                                        const QString& defaultRoot,
                                        const QString& defaultStoragePath)
{
    const QString root = normalizedPath(corpusRoot);
    if (!defaultRoot.isEmpty() && root == normalizedPath(defaultRoot)) {
        return defaultStoragePath;
    }
    return QDir(root).filePath(QStringLiteral(".recollect"));
}

bool StorageGuard::validateSafe(const QString& storagePath,
                                const QString& corpusRoot,
                                const QString& operation,
                                bool force,
                                QString* error,
                                Verdict* verdict)
{
    auto report = [verdict](Verdict v) {
        if (verdict) {
            *verdict = v;
        }
    };

    if (force) {
        LOG_WARN(rcCorpus, "Force mode: skipping storage validation for %s on %s",
                 qUtf8Printable(operation), qUtf8Printable(storagePath));
        report(Verdict::Forced);
        return true;
    }

    QString readError;
    const auto manifest = IndexManifest::readRaw(storagePath, &readError);
    if (!manifest) {
        if (!readError.isEmpty()) {
            LOG_WARN(rcCorpus, "Could not read index metadata, proceeding: %s",
                     qUtf8Printable(readError));
            report(Verdict::Unverified);
        } else {
            report(Verdict::Safe);
        }
        return true;
    }

    const QString currentRoot = normalizedPath(corpusRoot);
    const QString storedRootRaw = manifest->value(QStringLiteral("corpus_root")).toString();

    if (storedRootRaw.isEmpty()) {
        LOG_INFO(rcCorpus, "Migrating legacy index at %s to corpus root %s",
                 qUtf8Printable(storagePath), qUtf8Printable(currentRoot));
        QJsonObject migrated = *manifest;
        migrated[QStringLiteral("corpus_root")] = currentRoot;
        migrated[QStringLiteral("corpus_name")] = QFileInfo(currentRoot).fileName();
        migrated[QStringLiteral("migrated_at")] =
            QDateTime::currentDateTimeUtc().toString(Qt::ISODate);

        QString writeError;
        if (!IndexManifest::writeRaw(storagePath, migrated, &writeError)) {
            LOG_WARN(rcCorpus, "Could not update index metadata: %s",
                     qUtf8Printable(writeError));
        }
        report(Verdict::Migrated);
        return true;
    }

    const QString storedRoot = normalizedPath(storedRootRaw);
    if (storedRoot == currentRoot) {
        report(Verdict::Safe);
        return true;
    }

    LOG_ERROR(rcCorpus, "Storage mismatch for %s: %s holds the index of %s, not %s",
              qUtf8Printable(operation), qUtf8Printable(storagePath),
              qUtf8Printable(storedRoot), qUtf8Printable(currentRoot));
    if (error) {
        *error = QStringLiteral(
            "Storage directory mismatch detected.\n"
            "\n"
            "Operation: %1\n"
            "Target corpus root: %2\n"
            "Existing index root: %3\n"
            "Storage path: %4\n"
            "\n"
            "Continuing would overwrite the index of a different corpus.\n"
            "\n"
            "Remedies:\n"
            "  1. Use the corpus root this index belongs to: %3\n"
            "  2. Delete the existing index if it is no longer needed: %4\n"
            "  3. Force the operation (the existing index is lost): repeat %1 with force=true\n")
                     .arg(operation, currentRoot, storedRoot, storagePath);
    }
    report(Verdict::Mismatch);
    return false;
}

QString StorageGuard::verdictToString(Verdict verdict)
{
    switch (verdict) {
    case Verdict::Safe:       return QStringLiteral("safe");
    case Verdict::Migrated:   return QStringLiteral("migrated");
    case Verdict::Forced:     return QStringLiteral("forced");
    case Verdict::Unverified: return QStringLiteral("unverified");
    case Verdict::Mismatch:   return QStringLiteral("mismatch");
    }
    return QStringLiteral("unknown");
}

} // namespace rc
