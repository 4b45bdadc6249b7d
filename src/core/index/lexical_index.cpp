#include "core/index/lexical_index.h"
#include "core/index/schema.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QRegularExpression>
#include <QSet>

#include <cstring>

namespace rc {

namespace {

constexpr int kMaxQueryTerms = 16;

QString columnText(sqlite3_stmt* stmt, int column)
{
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? QString::fromUtf8(text) : QString();
}

QStringList parseTags(const QString& json)
{
    QStringList tags;
    const QJsonArray array = QJsonDocument::fromJson(json.toUtf8()).array();
    for (const QJsonValue& value : array) {
        tags.append(value.toString());
    }
    return tags;
}

const QSet<QString>& queryStopwords()
{
    static const QSet<QString> stopwords = {
        QStringLiteral("a"),    QStringLiteral("an"),   QStringLiteral("and"),
        QStringLiteral("are"),  QStringLiteral("as"),   QStringLiteral("at"),
        QStringLiteral("be"),   QStringLiteral("by"),   QStringLiteral("for"),
        QStringLiteral("from"), QStringLiteral("how"),  QStringLiteral("in"),
        QStringLiteral("is"),   QStringLiteral("it"),   QStringLiteral("my"),
        QStringLiteral("of"),   QStringLiteral("on"),   QStringLiteral("or"),
        QStringLiteral("that"), QStringLiteral("the"),  QStringLiteral("to"),
        QStringLiteral("what"), QStringLiteral("when"), QStringLiteral("where"),
        QStringLiteral("which"), QStringLiteral("who"), QStringLiteral("why"),
        QStringLiteral("with"),
    };
    return stopwords;
}

} // namespace

LexicalIndex::~LexicalIndex()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::optional<LexicalIndex> LexicalIndex::open(const QString& dbPath)
{
    LexicalIndex index;
    if (!index.init(dbPath, false)) {
        return std::nullopt;
    }
    return index;
}

std::optional<LexicalIndex> LexicalIndex::openReadOnly(const QString& dbPath)
{
    if (!QFile::exists(dbPath)) {
        LOG_WARN(rcIndex, "Lexical index not found: %s", qUtf8Printable(dbPath));
        return std::nullopt;
    }
    LexicalIndex index;
    if (!index.init(dbPath, true)) {
        return std::nullopt;
    }
    return index;
}

bool LexicalIndex::init(const QString& dbPath, bool readOnly)
{
    // Serialized mode: one handle is shared by concurrent queries.
    const int flags = SQLITE_OPEN_FULLMUTEX
        | (readOnly ? SQLITE_OPEN_READONLY : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE));
    int rc = sqlite3_open_v2(dbPath.toUtf8().constData(), &m_db, flags, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR(rcIndex, "Failed to open database: %s",
                  m_db ? sqlite3_errmsg(m_db) : "out of memory");
        return false;
    }

    sqlite3_busy_timeout(m_db, 30000);

    if (!execSql(kConnectionPragmas)) {
        LOG_ERROR(rcIndex, "Failed to set connection pragmas");
        return false;
    }

    bool schemaExists = false;
    {
        sqlite3_stmt* stmt = nullptr;
        rc = sqlite3_prepare_v2(m_db,
            "SELECT count(*) FROM sqlite_master WHERE type='table' AND name='items'",
            -1, &stmt, nullptr);
        if (rc == SQLITE_OK && sqlite3_step(stmt) == SQLITE_ROW) {
            schemaExists = (sqlite3_column_int(stmt, 0) > 0);
        }
        sqlite3_finalize(stmt);
    }

    if (readOnly) {
        if (!schemaExists) {
            LOG_ERROR(rcIndex, "Lexical index has no schema: %s", qUtf8Printable(dbPath));
            return false;
        }
        return true;
    }

    if (!schemaExists) {
        if (!execSql(kDatabasePragmas)) {
            LOG_ERROR(rcIndex, "Failed to set database pragmas");
            return false;
        }
        if (!execSql(kSchemaV1)) {
            LOG_ERROR(rcIndex, "Failed to create schema");
            return false;
        }
    }

    QFile dbFile(dbPath);
    dbFile.setPermissions(QFile::ReadOwner | QFile::WriteOwner);

    LOG_INFO(rcIndex, "Lexical index opened: %s", qUtf8Printable(dbPath));
    return true;
}

bool LexicalIndex::execSql(const char* sql) const
{
    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(rcIndex, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

// ── Indexing ────────────────────────────────────────────────

QString LexicalIndex::searchableText(const Item& item, const QString& bodyText)
{
    QStringList parts;
    parts.reserve(4 + item.tags.size() * 2);
    parts.append(item.title);
    for (const QString& tag : item.tags) {
        parts.append(tag);
        parts.append(tag);
    }
    if (!item.metadata.description.isEmpty()) {
        parts.append(item.metadata.description);
    }
    parts.append(bodyText);
    return parts.join(QLatin1Char('\n'));
}

bool LexicalIndex::index(const std::vector<IndexedItem>& items)
{
    if (!execSql("BEGIN TRANSACTION")) {
        return false;
    }

    const double now = static_cast<double>(QDateTime::currentSecsSinceEpoch());
    for (const IndexedItem& indexed : items) {
        if (!writeItem(indexed, now)) {
            LOG_ERROR(rcIndex, "Failed to index item %s, rolling back batch",
                      qUtf8Printable(indexed.item.id));
            execSql("ROLLBACK");
            return false;
        }
    }

    if (!execSql("COMMIT")) {
        execSql("ROLLBACK");
        return false;
    }

    LOG_DEBUG(rcIndex, "Indexed %d item(s)", static_cast<int>(items.size()));
    return true;
}

bool LexicalIndex::writeItem(const IndexedItem& indexed, double indexedAt)
{
    const Item& item = indexed.item;
    if (!indexed.embeddings.empty() && indexed.embeddings.size() != indexed.chunks.size()) {
        LOG_ERROR(rcIndex, "Item %s has %d chunks but %d embeddings",
                  qUtf8Printable(item.id),
                  static_cast<int>(indexed.chunks.size()),
                  static_cast<int>(indexed.embeddings.size()));
        return false;
    }

    const QByteArray idUtf8 = item.id.toUtf8();

    // FTS5 rows do not cascade; clear them before replacing the item.
    {
        const char* sql = R"(
            DELETE FROM search_index WHERE doc_id IN
                (SELECT doc_id FROM documents WHERE item_id = ?1)
        )";
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            LOG_ERROR(rcIndex, "FTS delete prepare failed: %s", sqlite3_errmsg(m_db));
            return false;
        }
        sqlite3_bind_text(stmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);
        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return false;
        }
    }
    {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, "DELETE FROM documents WHERE item_id = ?1",
                               -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }
        sqlite3_bind_text(stmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);
        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return false;
        }
    }

    {
        const char* sql = R"(
            INSERT INTO items (id, title, body, tags, metadata, modified_at, indexed_at, status)
            VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)
            ON CONFLICT(id) DO UPDATE SET
                title = excluded.title,
                body = excluded.body,
                tags = excluded.tags,
                metadata = excluded.metadata,
                modified_at = excluded.modified_at,
                indexed_at = excluded.indexed_at,
                status = excluded.status
        )";
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            LOG_ERROR(rcIndex, "Item upsert prepare failed: %s", sqlite3_errmsg(m_db));
            return false;
        }
        const QByteArray titleUtf8 = item.title.toUtf8();
        const QByteArray bodyUtf8 = item.body.toUtf8();
        const QByteArray tagsUtf8 =
            QJsonDocument(QJsonArray::fromStringList(item.tags)).toJson(QJsonDocument::Compact);
        const QByteArray metaUtf8 =
            QJsonDocument(item.metadata.toJson()).toJson(QJsonDocument::Compact);
        const QByteArray statusUtf8 = itemStatusToString(item.status).toUtf8();

        sqlite3_bind_text(stmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, titleUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 3, bodyUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 4, tagsUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 5, metaUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_double(stmt, 6, item.modifiedAt);
        sqlite3_bind_double(stmt, 7, indexedAt);
        sqlite3_bind_text(stmt, 8, statusUtf8.constData(), -1, SQLITE_STATIC);
        const int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            LOG_ERROR(rcIndex, "Item upsert failed: %s", sqlite3_errmsg(m_db));
            return false;
        }
    }

    const char* docSql = R"(
        INSERT INTO documents (doc_id, item_id, chunk_index, chunk_total,
                               start_offset, end_offset, model_id, embedding)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)
    )";
    const char* ftsSql = "INSERT INTO search_index (doc_id, content) VALUES (?1, ?2)";

    sqlite3_stmt* docStmt = nullptr;
    sqlite3_stmt* ftsStmt = nullptr;
    if (sqlite3_prepare_v2(m_db, docSql, -1, &docStmt, nullptr) != SQLITE_OK
        || sqlite3_prepare_v2(m_db, ftsSql, -1, &ftsStmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(rcIndex, "Document insert prepare failed: %s", sqlite3_errmsg(m_db));
        sqlite3_finalize(docStmt);
        sqlite3_finalize(ftsStmt);
        return false;
    }

    const QByteArray modelUtf8 = indexed.modelId.toUtf8();
    bool ok = true;
    for (size_t i = 0; i < indexed.chunks.size() && ok; ++i) {
        const Chunk& chunk = indexed.chunks[i];
        const QByteArray docIdUtf8 = chunk.chunkId.toUtf8();

        sqlite3_reset(docStmt);
        sqlite3_clear_bindings(docStmt);
        sqlite3_bind_text(docStmt, 1, docIdUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(docStmt, 2, idUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_int(docStmt, 3, chunk.chunkIndex);
        sqlite3_bind_int(docStmt, 4, chunk.chunkTotal);
        sqlite3_bind_int64(docStmt, 5, static_cast<sqlite3_int64>(chunk.startOffset));
        sqlite3_bind_int64(docStmt, 6, static_cast<sqlite3_int64>(chunk.endOffset));
        if (indexed.embeddings.empty() || indexed.embeddings[i].empty()) {
            sqlite3_bind_null(docStmt, 7);
            sqlite3_bind_null(docStmt, 8);
        } else {
            const std::vector<float>& vec = indexed.embeddings[i];
            sqlite3_bind_text(docStmt, 7, modelUtf8.constData(), -1, SQLITE_STATIC);
            sqlite3_bind_blob(docStmt, 8, vec.data(),
                              static_cast<int>(vec.size() * sizeof(float)), SQLITE_STATIC);
        }
        if (sqlite3_step(docStmt) != SQLITE_DONE) {
            LOG_ERROR(rcIndex, "Document insert failed: %s", sqlite3_errmsg(m_db));
            ok = false;
            break;
        }

        const QByteArray textUtf8 = searchableText(item, chunk.content).toUtf8();
        sqlite3_reset(ftsStmt);
        sqlite3_clear_bindings(ftsStmt);
        sqlite3_bind_text(ftsStmt, 1, docIdUtf8.constData(), -1, SQLITE_STATIC);
        sqlite3_bind_text(ftsStmt, 2, textUtf8.constData(), -1, SQLITE_STATIC);
        if (sqlite3_step(ftsStmt) != SQLITE_DONE) {
            LOG_ERROR(rcIndex, "FTS5 insert failed: %s", sqlite3_errmsg(m_db));
            ok = false;
        }
    }

    sqlite3_finalize(docStmt);
    sqlite3_finalize(ftsStmt);
    return ok;
}

bool LexicalIndex::setItemStatus(const QString& itemId, ItemStatus status)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "UPDATE items SET status = ?1 WHERE id = ?2",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(rcIndex, "setItemStatus prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    const QByteArray statusUtf8 = itemStatusToString(status).toUtf8();
    const QByteArray idUtf8 = itemId.toUtf8();
    sqlite3_bind_text(stmt, 1, statusUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, idUtf8.constData(), -1, SQLITE_STATIC);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE && sqlite3_changes(m_db) > 0;
}

// ── Query ───────────────────────────────────────────────────

QString LexicalIndex::sanitizeQuery(const QString& raw)
{
    const QString normalized = raw.toLower().trimmed();
    if (normalized.isEmpty()) {
        return {};
    }

    static const QRegularExpression tokenRegex(QStringLiteral(R"([\p{L}\p{N}_]+)"));

    QStringList tokens;
    QStringList stopTokens;
    QSet<QString> seen;
    auto matchIt = tokenRegex.globalMatch(normalized);
    while (matchIt.hasNext()) {
        const QString token = matchIt.next().captured(0);
        if (seen.contains(token)) {
            continue;
        }
        seen.insert(token);
        if (queryStopwords().contains(token)) {
            stopTokens.append(token);
        } else {
            tokens.append(token);
        }
    }

    // A query made only of stop words still searches for them.
    if (tokens.isEmpty()) {
        tokens = stopTokens;
    }
    if (tokens.isEmpty()) {
        return {};
    }
    if (tokens.size() > kMaxQueryTerms) {
        tokens = tokens.mid(0, kMaxQueryTerms);
    }

    QStringList quoted;
    quoted.reserve(tokens.size());
    for (const QString& token : tokens) {
        quoted.append(QLatin1Char('"') + token + QLatin1Char('"'));
    }
    return quoted.join(QStringLiteral(" OR "));
}

QString LexicalIndex::normalizeTag(const QString& tag)
{
    QString normalized = tag.trimmed().toLower();
    while (normalized.startsWith(QLatin1Char('#'))) {
        normalized.remove(0, 1);
    }
    return normalized;
}

QStringList LexicalIndex::tagTerms(const QString& raw)
{
    static const QRegularExpression separators(QStringLiteral(R"([\s,;]+)"));
    static const QRegularExpression edgePunct(QStringLiteral(R"(^[^\p{L}\p{N}#]+|[^\p{L}\p{N}]+$)"));

    QStringList terms;
    const QStringList parts = raw.split(separators, Qt::SkipEmptyParts);
    for (QString part : parts) {
        part.remove(edgePunct);
        const QString term = normalizeTag(part);
        if (!term.isEmpty() && !terms.contains(term)) {
            terms.append(term);
        }
    }
    return terms;
}

std::vector<LexicalHit> LexicalIndex::query(const QString& text, int limit) const
{
    if (!m_db || limit <= 0) {
        return {};
    }

    const QString sanitized = sanitizeQuery(text);
    if (sanitized.isEmpty()) {
        LOG_DEBUG(rcIndex, "Lexical search skipped after sanitization");
        return {};
    }

    const char* sql = R"(
        SELECT s.doc_id, bm25(search_index), d.item_id, d.chunk_index, d.chunk_total,
               d.start_offset, d.end_offset, i.tags
        FROM search_index s
        JOIN documents d ON d.doc_id = s.doc_id
        JOIN items i ON i.id = d.item_id
        WHERE search_index MATCH ?1
        ORDER BY bm25(search_index)
        LIMIT ?2
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(rcIndex, "Lexical search prepare: %s", sqlite3_errmsg(m_db));
        return {};
    }

    const QByteArray queryUtf8 = sanitized.toUtf8();
    sqlite3_bind_text(stmt, 1, queryUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 2, limit);

    const QStringList terms = tagTerms(text);

    std::vector<LexicalHit> hits;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        LexicalHit hit;
        hit.doc.docId = columnText(stmt, 0);
        hit.score = -sqlite3_column_double(stmt, 1);
        hit.doc.parentId = columnText(stmt, 2);
        hit.doc.chunkIndex = sqlite3_column_int(stmt, 3);
        hit.doc.chunkTotal = sqlite3_column_int(stmt, 4);
        hit.doc.startOffset = static_cast<qsizetype>(sqlite3_column_int64(stmt, 5));
        hit.doc.endOffset = static_cast<qsizetype>(sqlite3_column_int64(stmt, 6));

        const QStringList tags = parseTags(columnText(stmt, 7));
        for (const QString& tag : tags) {
            const QString normalized = normalizeTag(tag);
            if (terms.contains(normalized) && !hit.matchedTags.contains(normalized)) {
                hit.matchedTags.append(normalized);
            }
        }
        hit.tagMatch = !hit.matchedTags.isEmpty();
        hits.push_back(std::move(hit));
    }
    if (rc != SQLITE_DONE) {
        LOG_WARN(rcIndex, "Lexical search step failed: %s", sqlite3_errmsg(m_db));
    }
    sqlite3_finalize(stmt);

    LOG_DEBUG(rcIndex, "Lexical query '%s' -> %d hit(s)",
              qUtf8Printable(sanitized), static_cast<int>(hits.size()));
    return hits;
}

// ── Catalog ─────────────────────────────────────────────────

std::optional<std::vector<Item>> LexicalIndex::loadItems() const
{
    const char* sql = R"(
        SELECT id, title, body, tags, metadata, modified_at, status FROM items ORDER BY id
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(rcIndex, "loadItems prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }

    std::vector<Item> items;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        Item item;
        item.id = columnText(stmt, 0);
        item.title = columnText(stmt, 1);
        item.body = columnText(stmt, 2);
        item.tags = parseTags(columnText(stmt, 3));
        item.metadata = ItemMetadata::fromJson(
            QJsonDocument::fromJson(columnText(stmt, 4).toUtf8()).object());
        item.modifiedAt = sqlite3_column_double(stmt, 5);
        item.status = itemStatusFromString(columnText(stmt, 6)).value_or(ItemStatus::Active);
        items.push_back(std::move(item));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR(rcIndex, "loadItems failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return items;
}

std::optional<std::vector<StoredDocument>> LexicalIndex::loadDocuments() const
{
    const char* sql = R"(
        SELECT doc_id, item_id, chunk_index, chunk_total, start_offset, end_offset,
               model_id, embedding
        FROM documents ORDER BY item_id, chunk_index
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(rcIndex, "loadDocuments prepare failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }

    std::vector<StoredDocument> docs;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        StoredDocument doc;
        doc.ref.docId = columnText(stmt, 0);
        doc.ref.parentId = columnText(stmt, 1);
        doc.ref.chunkIndex = sqlite3_column_int(stmt, 2);
        doc.ref.chunkTotal = sqlite3_column_int(stmt, 3);
        doc.ref.startOffset = static_cast<qsizetype>(sqlite3_column_int64(stmt, 4));
        doc.ref.endOffset = static_cast<qsizetype>(sqlite3_column_int64(stmt, 5));
        doc.modelId = columnText(stmt, 6);

        const int bytes = sqlite3_column_bytes(stmt, 7);
        const void* blob = sqlite3_column_blob(stmt, 7);
        if (blob && bytes > 0 && bytes % static_cast<int>(sizeof(float)) == 0) {
            doc.embedding.resize(static_cast<size_t>(bytes) / sizeof(float));
            std::memcpy(doc.embedding.data(), blob, static_cast<size_t>(bytes));
        }
        docs.push_back(std::move(doc));
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        LOG_ERROR(rcIndex, "loadDocuments failed: %s", sqlite3_errmsg(m_db));
        return std::nullopt;
    }
    return docs;
}

int LexicalIndex::countRows(const char* sql) const
{
    sqlite3_stmt* stmt = nullptr;
    int count = 0;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) == SQLITE_OK
        && sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

int LexicalIndex::itemCount() const
{
    return countRows("SELECT count(*) FROM items");
}

int LexicalIndex::documentCount() const
{
    return countRows("SELECT count(*) FROM documents");
}

std::optional<QString> LexicalIndex::getSetting(const QString& key) const
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT value FROM settings WHERE key = ?1",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    const QByteArray keyUtf8 = key.toUtf8();
    sqlite3_bind_text(stmt, 1, keyUtf8.constData(), -1, SQLITE_STATIC);

    std::optional<QString> value;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        value = columnText(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return value;
}

bool LexicalIndex::setSetting(const QString& key, const QString& value)
{
    const char* sql = R"(
        INSERT INTO settings (key, value) VALUES (?1, ?2)
        ON CONFLICT(key) DO UPDATE SET value = excluded.value
    )";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(rcIndex, "setSetting prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    const QByteArray keyUtf8 = key.toUtf8();
    const QByteArray valueUtf8 = value.toUtf8();
    sqlite3_bind_text(stmt, 1, keyUtf8.constData(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, valueUtf8.constData(), -1, SQLITE_STATIC);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_DONE;
}

QString LexicalIndex::buildId() const
{
    return getSetting(QStringLiteral("build_id")).value_or(QString());
}

bool LexicalIndex::setBuildId(const QString& buildId)
{
    return setSetting(QStringLiteral("build_id"), buildId);
}

} // namespace rc
