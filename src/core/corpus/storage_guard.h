#pragma once

#include <QString>

namespace rc {

// StorageGuard: keeps a storage directory bound to exactly one corpus root.
class StorageGuard {
public:
    enum class Verdict {
        Safe,           // no index yet, or the index belongs to this root
        Migrated,       // legacy index stamped with this root
        Forced,         // check skipped on request
        Unverified,     // index.json unreadable; proceeding
        Mismatch,       // index belongs to another root; nothing was written
    };

    // The configured storage directory for the default root, otherwise
    // <root>/.recollect.
    static QString deriveStoragePath(const QString& corpusRoot,
                                     const QString& defaultRoot,
                                     const QString& defaultStoragePath);

    // Checks that operating on corpusRoot with storagePath cannot overwrite
    // another corpus' index. Returns false only for Mismatch, with error set
    // to a message naming both roots and the three ways forward. A legacy
    // manifest is back-filled with the root, its name and the migration time.
    static bool validateSafe(const QString& storagePath,
                             const QString& corpusRoot,
                             const QString& operation,
                             bool force,
                             QString* error = nullptr,
                             Verdict* verdict = nullptr);

    static QString verdictToString(Verdict verdict);
};

} // namespace rc
