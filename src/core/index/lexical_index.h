#pragma once

#include "core/shared/chunk.h"
#include "core/shared/types.h"

#include <QString>
#include <QStringList>
#include <optional>
#include <vector>

#include <sqlite3.h>

namespace rc {

// One item together with its retrieval units, as written by the indexer.
// embeddings is either empty or parallel to chunks.
struct IndexedItem {
    Item item;
    std::vector<Chunk> chunks;
    std::vector<std::vector<float>> embeddings;
    QString modelId;
};

// A retrieval unit read back from the store, including its stored embedding.
struct StoredDocument {
    DocumentRef ref;
    QString modelId;
    std::vector<float> embedding;
};

struct LexicalHit {
    DocumentRef doc;
    double score = 0.0;        // -bm25(); higher is better
    bool tagMatch = false;     // some query term equals one of the item's tags
    QStringList matchedTags;
};

// LexicalIndex: owner of one corpus' SQLite database.
// Holds the item catalog, per-document embeddings, and the FTS5 table used
// for BM25 retrieval. Opened read-only for queries, read-write by the indexer.
class LexicalIndex {
public:
    ~LexicalIndex();

    // Move-only (owns sqlite3* handle)
    LexicalIndex(LexicalIndex&& other) noexcept : m_db(other.m_db) { other.m_db = nullptr; }
    LexicalIndex& operator=(LexicalIndex&& other) noexcept {
        if (this != &other) {
            if (m_db) sqlite3_close(m_db);
            m_db = other.m_db;
            other.m_db = nullptr;
        }
        return *this;
    }
    LexicalIndex(const LexicalIndex&) = delete;
    LexicalIndex& operator=(const LexicalIndex&) = delete;

    // Open or create the database. Creates schema and sets pragmas on first open.
    static std::optional<LexicalIndex> open(const QString& dbPath);

    // Open an existing database for querying. Fails if the file is missing.
    static std::optional<LexicalIndex> openReadOnly(const QString& dbPath);

    // ── Indexing ────────────────────────────────────────────

    // Insert or replace items and their documents in one transaction.
    bool index(const std::vector<IndexedItem>& items);

    bool setItemStatus(const QString& itemId, ItemStatus status);

    // ── Query ───────────────────────────────────────────────

    // BM25 retrieval. Empty or unmatched queries return an empty list.
    std::vector<LexicalHit> query(const QString& text, int limit) const;

    // ── Catalog ─────────────────────────────────────────────

    std::optional<std::vector<Item>> loadItems() const;
    std::optional<std::vector<StoredDocument>> loadDocuments() const;
    int itemCount() const;
    int documentCount() const;

    // Identifier of the build that wrote this database; empty for databases
    // written before builds were stamped.
    QString buildId() const;
    bool setBuildId(const QString& buildId);

    // Text that feeds BM25 for one retrieval unit.
    static QString searchableText(const Item& item, const QString& bodyText);

    // Query text reduced to an OR of quoted terms; empty when nothing is searchable.
    static QString sanitizeQuery(const QString& raw);

    // Normalized query terms compared against item tags.
    static QStringList tagTerms(const QString& raw);
    static QString normalizeTag(const QString& tag);

private:
    LexicalIndex() = default;
    bool init(const QString& dbPath, bool readOnly);
    bool execSql(const char* sql) const;
    bool writeItem(const IndexedItem& indexed, double indexedAt);
    int countRows(const char* sql) const;
    std::optional<QString> getSetting(const QString& key) const;
    bool setSetting(const QString& key, const QString& value);

    sqlite3* m_db = nullptr;
};

} // namespace rc
