#pragma once

#include "core/corpus/corpus.h"
#include "core/index/lexical_index.h"
#include "core/shared/item_catalog.h"
#include "core/vector/vector_index.h"

#include <QString>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace rc {

// RetrievalClient: ready-to-query handle for one corpus: the read-only
// lexical database, the loaded vectors and the item catalog.
//
// Queries run under a Lease. release() refuses new leases, waits for the
// outstanding ones to end, then closes the database and drops the vectors.
// Leases are counted rather than locked, so they may end on any thread.
class RetrievalClient {
public:
    class Lease {
    public:
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&&) = delete;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        ~Lease();

        RetrievalClient* operator->() const { return m_client.get(); }
        RetrievalClient& operator*() const { return *m_client; }

    private:
        friend class RetrievalClient;
        explicit Lease(std::shared_ptr<RetrievalClient> client);

        std::shared_ptr<RetrievalClient> m_client;
    };

    RetrievalClient(Corpus corpus,
                    std::optional<LexicalIndex> lexical,
                    std::unique_ptr<VectorIndex> vectors,
                    ItemCatalog catalog);
    ~RetrievalClient();

    RetrievalClient(const RetrievalClient&) = delete;
    RetrievalClient& operator=(const RetrievalClient&) = delete;

    // Opens the index files under corpus.storagePath. A missing or unreadable
    // vector index leaves the client lexical-only, as does one stamped with a
    // different build id than the lexical database. A missing lexical
    // database is an error.
    static std::shared_ptr<RetrievalClient> open(const Corpus& corpus, QString* error = nullptr);

    // nullopt once release() has started.
    static std::optional<Lease> acquire(const std::shared_ptr<RetrievalClient>& client);

    // Blocks until every lease has ended. Idempotent.
    void release();
    bool isReleased() const;
    int activeLeases() const;

    // ── Query (valid under a lease) ─────────────────────────

    std::vector<LexicalHit> lexicalQuery(const QString& text, int limit) const;
    std::vector<VectorHit> vectorQuery(const std::vector<float>& embedding, int limit) const;

    bool hasVectors() const;
    QString vectorModelId() const;
    // Vectors were present on disk but belong to another build.
    bool vectorsOutOfDate() const { return m_vectorsOutOfDate; }

    const Corpus& corpus() const { return m_corpus; }
    const ItemCatalog& catalog() const { return m_catalog; }

    // Open database and vector handles across all clients in the process.
    static int liveHandleCount();

private:
    void endLease();

    Corpus m_corpus;
    std::optional<LexicalIndex> m_lexical;
    std::unique_ptr<VectorIndex> m_vectors;
    ItemCatalog m_catalog;
    bool m_vectorsOutOfDate = false;

    mutable std::mutex m_mutex;
    std::condition_variable m_leasesDone;
    int m_leases = 0;
    bool m_released = false;

    static std::atomic<int> s_liveHandles;
};

} // namespace rc
