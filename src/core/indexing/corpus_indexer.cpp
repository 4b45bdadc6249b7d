#include "core/indexing/corpus_indexer.h"
#include "core/shared/logging.h"
#include "core/vector/vector_index.h"

#include <QDateTime>
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QHash>
#include <QSet>
#include <QUuid>

#include <algorithm>
#include <cstdio>

namespace rc {

namespace {

struct PreviousItem {
    Item item;
    std::vector<StoredDocument> documents;
};

QHash<QString, PreviousItem> loadPreviousBuild(const QString& dbPath)
{
    QHash<QString, PreviousItem> previous;
    if (!QFileInfo::exists(dbPath)) {
        return previous;
    }

    auto db = LexicalIndex::openReadOnly(dbPath);
    if (!db) {
        LOG_WARN(rcIndex, "Previous index at %s unreadable; rebuilding from scratch",
                 qUtf8Printable(dbPath));
        return previous;
    }
    auto items = db->loadItems();
    auto documents = db->loadDocuments();
    if (!items || !documents) {
        LOG_WARN(rcIndex, "Previous index at %s incomplete; rebuilding from scratch",
                 qUtf8Printable(dbPath));
        return previous;
    }

    for (Item& item : *items) {
        const QString id = item.id;
        previous.insert(id, PreviousItem{std::move(item), {}});
    }
    for (StoredDocument& doc : *documents) {
        auto it = previous.find(doc.ref.parentId);
        if (it != previous.end()) {
            it->documents.push_back(std::move(doc));
        }
    }
    return previous;
}

// The live files may only seed this build when the manifest binds them to
// the same root. A forced rebind or an unreadable manifest starts clean.
bool previousBuildBelongsTo(const QString& storagePath, const QString& corpusRoot)
{
    const auto manifest = IndexManifest::read(storagePath);
    return manifest && !manifest->corpusRoot.isEmpty()
        && normalizedPath(manifest->corpusRoot) == normalizedPath(corpusRoot);
}

// Stored embeddings are reusable when the item is unchanged, was embedded by
// the same model, and chunks into the same documents.
std::vector<std::vector<float>> reusableEmbeddings(const PreviousItem* previous,
                                                   const Item& item,
                                                   const std::vector<Chunk>& chunks,
                                                   const QString& modelId)
{
    if (!previous || modelId.isEmpty() || previous->item.modifiedAt != item.modifiedAt
        || previous->documents.size() != chunks.size()) {
        return {};
    }

    std::vector<std::vector<float>> embeddings;
    embeddings.reserve(chunks.size());
    for (size_t i = 0; i < chunks.size(); ++i) {
        const StoredDocument& doc = previous->documents[i];
        if (doc.ref.docId != chunks[i].chunkId || doc.modelId != modelId
            || doc.embedding.empty()) {
            return {};
        }
        embeddings.push_back(doc.embedding);
    }
    return embeddings;
}

bool replaceFile(const QString& from, const QString& to, QString* error)
{
    if (std::rename(QFile::encodeName(from).constData(), QFile::encodeName(to).constData()) != 0) {
        if (error) {
            *error = QStringLiteral("Cannot move %1 into place as %2").arg(from, to);
        }
        return false;
    }
    return true;
}

void removeIfExists(const QString& path)
{
    if (QFileInfo::exists(path) && !QFile::remove(path)) {
        LOG_WARN(rcIndex, "Could not remove %s", qUtf8Printable(path));
    }
}

} // namespace

QJsonObject IndexBuildReport::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("itemCount")] = itemCount;
    json[QStringLiteral("activeCount")] = activeCount;
    json[QStringLiteral("inactiveCount")] = inactiveCount;
    json[QStringLiteral("documentCount")] = documentCount;
    json[QStringLiteral("embeddedCount")] = embeddedCount;
    json[QStringLiteral("reusedEmbeddings")] = reusedEmbeddings;
    json[QStringLiteral("vectorsBuilt")] = vectorsBuilt;
    json[QStringLiteral("modelId")] = modelId;
    json[QStringLiteral("storageCheck")] = StorageGuard::verdictToString(verdict);
    json[QStringLiteral("durationMs")] = durationMs;
    return json;
}

CorpusIndexer::CorpusIndexer(EmbeddingProvider* embeddings)
    : m_embeddings(embeddings)
{
}

ChunkerConfig CorpusIndexer::effectiveChunking(const IndexBuildOptions& options)
{
    ChunkerConfig config = options.chunking;
    if (!options.chunkingEnabled) {
        config.threshold = config.chunkSize;
    }
    return config;
}

std::optional<IndexBuildReport> CorpusIndexer::build(const Corpus& corpus,
                                                     ItemSource& source,
                                                     const IndexBuildOptions& options,
                                                     QString* error,
                                                     StorageGuard::Verdict* verdict) const
{
    QElapsedTimer timer;
    timer.start();

    IndexBuildReport report;
    if (!StorageGuard::validateSafe(corpus.storagePath, corpus.rootPath,
                                    QStringLiteral("reindex"), options.force,
                                    error, &report.verdict)) {
        if (verdict) {
            *verdict = report.verdict;
        }
        return std::nullopt;
    }
    if (verdict) {
        *verdict = report.verdict;
    }

    auto chunker = Chunker::create(effectiveChunking(options), error);
    if (!chunker) {
        return std::nullopt;
    }

    auto sourceItems = source.loadItems(corpus.rootPath, error);
    if (!sourceItems) {
        return std::nullopt;
    }

    if (!QDir().mkpath(corpus.storagePath)) {
        if (error) {
            *error = QStringLiteral("Cannot create storage directory %1").arg(corpus.storagePath);
        }
        return std::nullopt;
    }

    const QString liveDbPath = storage_layout::lexicalDbPath(corpus.storagePath);
    QHash<QString, PreviousItem> previous;
    if (previousBuildBelongsTo(corpus.storagePath, corpus.rootPath)) {
        previous = loadPreviousBuild(liveDbPath);
    } else if (QFileInfo::exists(liveDbPath)) {
        LOG_WARN(rcIndex, "Existing index at %s is not bound to %s; rebuilding from scratch",
                 qUtf8Printable(corpus.storagePath), qUtf8Printable(corpus.rootPath));
    }

    // Source items first, then previously indexed items the source dropped.
    std::vector<Item> items = std::move(*sourceItems);
    QSet<QString> present;
    for (const Item& item : items) {
        present.insert(item.id);
    }
    for (auto it = previous.cbegin(); it != previous.cend(); ++it) {
        if (!present.contains(it.key())) {
            Item kept = it->item;
            kept.status = ItemStatus::Inactive;
            items.push_back(std::move(kept));
            ++report.inactiveCount;
        }
    }

    const bool embeddingAvailable = m_embeddings && m_embeddings->isAvailable();
    const QString modelId = embeddingAvailable ? m_embeddings->modelId() : QString();
    if (!embeddingAvailable) {
        LOG_WARN(rcIndex, "Embedding service unavailable; building corpus '%s' lexical-only",
                 qUtf8Printable(corpus.name));
    }

    // ── Chunk and collect embedding work ────────────────────
    std::vector<IndexedItem> indexed;
    indexed.reserve(items.size());
    std::vector<std::pair<size_t, size_t>> pending;  // (item, chunk) needing an embedding
    std::vector<QString> pendingTexts;

    for (Item& item : items) {
        IndexedItem entry;
        entry.chunks = chunker->chunk(item.id, item.title, item.body);
        if (entry.chunks.empty()) {
            Chunk whole;
            whole.chunkId = item.id;
            whole.parentId = item.id;
            whole.title = item.title;
            entry.chunks.push_back(whole);
        }
        entry.modelId = modelId;

        if (item.status == ItemStatus::Active) {
            ++report.activeCount;
        }

        if (embeddingAvailable) {
            const auto prevIt = previous.constFind(item.id);
            const PreviousItem* prev = prevIt == previous.cend() ? nullptr : &prevIt.value();
            entry.embeddings = reusableEmbeddings(prev, item, entry.chunks, modelId);
            if (!entry.embeddings.empty()) {
                report.reusedEmbeddings += static_cast<int>(entry.embeddings.size());
            } else {
                entry.embeddings.resize(entry.chunks.size());
                for (size_t c = 0; c < entry.chunks.size(); ++c) {
                    pending.emplace_back(indexed.size(), c);
                    const Chunk& chunk = entry.chunks[c];
                    pendingTexts.push_back(chunk.content.isEmpty()
                                               ? chunk.title
                                               : chunk.title + QLatin1Char('\n') + chunk.content);
                }
            }
        }

        report.documentCount += static_cast<int>(entry.chunks.size());
        entry.item = std::move(item);
        indexed.push_back(std::move(entry));
    }
    report.itemCount = static_cast<int>(indexed.size());

    // ── Embed ───────────────────────────────────────────────
    bool vectorsComplete = embeddingAvailable;
    const size_t batchSize = static_cast<size_t>(std::max(1, options.embedBatchSize));
    for (size_t begin = 0; vectorsComplete && begin < pendingTexts.size(); begin += batchSize) {
        const size_t end = std::min(pendingTexts.size(), begin + batchSize);
        const std::vector<QString> batch(pendingTexts.begin() + static_cast<long>(begin),
                                         pendingTexts.begin() + static_cast<long>(end));
        auto vectors = m_embeddings->embedDocuments(batch);
        if (!vectors || vectors->size() != batch.size()) {
            LOG_WARN(rcIndex, "Embedding failed for batch at %d; building corpus '%s' lexical-only",
                     static_cast<int>(begin), qUtf8Printable(corpus.name));
            vectorsComplete = false;
            break;
        }
        for (size_t i = 0; i < vectors->size(); ++i) {
            const auto& slot = pending[begin + i];
            indexed[slot.first].embeddings[slot.second] = std::move((*vectors)[i]);
        }
        report.embeddedCount += static_cast<int>(vectors->size());
    }

    if (!vectorsComplete) {
        for (IndexedItem& entry : indexed) {
            entry.embeddings.clear();
            entry.modelId.clear();
        }
        report.embeddedCount = 0;
        report.reusedEmbeddings = 0;
    }

    // Stamped into every file of this build; readers pair files by it.
    const QString buildId = QUuid::createUuid().toString(QUuid::WithoutBraces);

    // ── Write lexical database beside the live one ──────────
    const QString buildDbPath = liveDbPath + QStringLiteral(".building");
    removeIfExists(buildDbPath);
    removeIfExists(buildDbPath + QStringLiteral("-journal"));
    {
        auto db = LexicalIndex::open(buildDbPath);
        if (!db) {
            if (error) {
                *error = QStringLiteral("Cannot create %1").arg(buildDbPath);
            }
            return std::nullopt;
        }
        if (!db->index(indexed) || !db->setBuildId(buildId)) {
            if (error) {
                *error = QStringLiteral("Failed to write lexical index for corpus '%1'").arg(corpus.name);
            }
            db.reset();
            removeIfExists(buildDbPath);
            return std::nullopt;
        }
    }

    // ── Vector index ────────────────────────────────────────
    const QString liveVectorPath = storage_layout::vectorIndexPath(corpus.storagePath);
    const QString liveMetaPath = storage_layout::vectorMetaPath(corpus.storagePath);
    const QString buildVectorPath = liveVectorPath + QStringLiteral(".building");
    const QString buildMetaPath = liveMetaPath + QStringLiteral(".building");
    int dimensions = 0;

    if (vectorsComplete && report.documentCount > 0) {
        dimensions = static_cast<int>(indexed.front().embeddings.front().size());
        VectorIndex::IndexMetadata meta;
        meta.dimensions = dimensions;
        meta.modelId = modelId;
        meta.buildId = buildId;
        VectorIndex vectors(meta);
        bool ok = vectors.create(report.documentCount);
        for (const IndexedItem& entry : indexed) {
            for (size_t c = 0; ok && c < entry.chunks.size(); ++c) {
                ok = vectors.add(documentRef(entry.chunks[c]), entry.embeddings[c]);
            }
        }
        if (ok) {
            ok = vectors.save(buildVectorPath, buildMetaPath);
        }
        if (ok) {
            report.vectorsBuilt = true;
        } else {
            LOG_WARN(rcIndex, "Vector index build failed for corpus '%s'; lexical-only",
                     qUtf8Printable(corpus.name));
            removeIfExists(buildVectorPath);
            removeIfExists(buildMetaPath);
            dimensions = 0;
        }
    }

    // ── Swap into place, manifest last ──────────────────────
    // Readers opening between renames see files with different build ids and
    // fall back to lexical-only until the swap completes.
    if (!replaceFile(buildDbPath, liveDbPath, error)) {
        removeIfExists(buildDbPath);
        removeIfExists(buildVectorPath);
        removeIfExists(buildMetaPath);
        return std::nullopt;
    }
    if (report.vectorsBuilt) {
        QString swapError;
        if (!replaceFile(buildVectorPath, liveVectorPath, &swapError)
            || !replaceFile(buildMetaPath, liveMetaPath, &swapError)) {
            LOG_WARN(rcIndex, "%s; corpus '%s' is left lexical-only",
                     qUtf8Printable(swapError), qUtf8Printable(corpus.name));
            removeIfExists(buildVectorPath);
            removeIfExists(buildMetaPath);
            report.vectorsBuilt = false;
            dimensions = 0;
        }
    }
    if (!report.vectorsBuilt) {
        removeIfExists(liveVectorPath);
        removeIfExists(liveMetaPath);
    }

    IndexManifest manifest;
    manifest.corpusRoot = normalizedPath(corpus.rootPath);
    manifest.corpusName = corpus.name;
    manifest.modelId = report.vectorsBuilt ? modelId : QString();
    manifest.buildId = buildId;
    manifest.dimensions = dimensions;
    manifest.indexedAt = static_cast<double>(QDateTime::currentSecsSinceEpoch());
    manifest.itemCount = report.itemCount;
    manifest.documentCount = report.documentCount;
    if (!manifest.write(corpus.storagePath, error)) {
        return std::nullopt;
    }

    report.modelId = manifest.modelId;
    report.durationMs = timer.elapsed();
    LOG_INFO(rcIndex,
             "Indexed corpus '%s': %d item(s) (%d inactive), %d document(s), "
             "%d embedded, %d reused, vectors=%s, %lld ms",
             qUtf8Printable(corpus.name), report.itemCount, report.inactiveCount,
             report.documentCount, report.embeddedCount, report.reusedEmbeddings,
             report.vectorsBuilt ? "yes" : "no", static_cast<long long>(report.durationMs));
    return report;
}

} // namespace rc
