#pragma once

#include "core/corpus/corpus.h"
#include "core/corpus/storage_guard.h"
#include "core/index/lexical_index.h"
#include "core/indexing/chunker.h"
#include "core/indexing/item_source.h"
#include "core/models/embedding_provider.h"

#include <QJsonObject>
#include <QString>
#include <optional>

namespace rc {

struct IndexBuildOptions {
    ChunkerConfig chunking;
    bool chunkingEnabled = true;    // false: only bodies longer than one window are split
    bool force = false;             // skip the storage/root binding check
    int embedBatchSize = 32;
};

// Result of one corpus build.
struct IndexBuildReport {
    int itemCount = 0;
    int activeCount = 0;
    int inactiveCount = 0;          // kept from the previous build, absent from the source
    int documentCount = 0;
    int embeddedCount = 0;
    int reusedEmbeddings = 0;
    bool vectorsBuilt = false;
    QString modelId;
    StorageGuard::Verdict verdict = StorageGuard::Verdict::Safe;
    qint64 durationMs = 0;

    QJsonObject toJson() const;
};

// CorpusIndexer: builds or refreshes the index files of one corpus.
//
// Items whose modification time and embedding model are unchanged keep their
// stored embeddings. Items that vanished from the source stay indexed as
// inactive. New files are written next to the live ones and renamed into
// place; index.json is written last.
class CorpusIndexer {
public:
    // embeddings may be null; the build is then lexical-only.
    explicit CorpusIndexer(EmbeddingProvider* embeddings);

    std::optional<IndexBuildReport> build(const Corpus& corpus,
                                          ItemSource& source,
                                          const IndexBuildOptions& options,
                                          QString* error = nullptr,
                                          StorageGuard::Verdict* verdict = nullptr) const;

    // Chunker settings used for a build; chunkingEnabled=false raises the
    // threshold to one window so no body exceeds the model input budget.
    static ChunkerConfig effectiveChunking(const IndexBuildOptions& options);

private:
    EmbeddingProvider* m_embeddings = nullptr;
};

} // namespace rc
