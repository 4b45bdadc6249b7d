#include "core/corpus/retrieval_client.h"
#include "core/shared/logging.h"

#include <QFileInfo>

namespace rc {

std::atomic<int> RetrievalClient::s_liveHandles{0};

// ── Lease ───────────────────────────────────────────────────

RetrievalClient::Lease::Lease(std::shared_ptr<RetrievalClient> client)
    : m_client(std::move(client))
{
}

RetrievalClient::Lease::Lease(Lease&& other) noexcept
    : m_client(std::move(other.m_client))
{
}

RetrievalClient::Lease::~Lease()
{
    if (m_client) {
        m_client->endLease();
    }
}

// ── RetrievalClient ─────────────────────────────────────────

RetrievalClient::RetrievalClient(Corpus corpus,
                                 std::optional<LexicalIndex> lexical,
                                 std::unique_ptr<VectorIndex> vectors,
                                 ItemCatalog catalog)
    : m_corpus(std::move(corpus))
    , m_lexical(std::move(lexical))
    , m_vectors(std::move(vectors))
    , m_catalog(std::move(catalog))
{
    if (m_lexical) {
        s_liveHandles.fetch_add(1);
    }
    if (m_vectors) {
        s_liveHandles.fetch_add(1);
    }
}

RetrievalClient::~RetrievalClient()
{
    release();
}

std::shared_ptr<RetrievalClient> RetrievalClient::open(const Corpus& corpus, QString* error)
{
    const QString dbPath = storage_layout::lexicalDbPath(corpus.storagePath);
    auto lexical = LexicalIndex::openReadOnly(dbPath);
    if (!lexical) {
        if (error) {
            *error = QStringLiteral("No index for corpus '%1' at %2")
                         .arg(corpus.name, corpus.storagePath);
        }
        return nullptr;
    }

    auto items = lexical->loadItems();
    if (!items) {
        if (error) {
            *error = QStringLiteral("Cannot read items of corpus '%1'").arg(corpus.name);
        }
        return nullptr;
    }

    std::unique_ptr<VectorIndex> vectors;
    bool vectorsOutOfDate = false;
    const QString indexPath = storage_layout::vectorIndexPath(corpus.storagePath);
    const QString metaPath = storage_layout::vectorMetaPath(corpus.storagePath);
    if (QFileInfo::exists(indexPath) && QFileInfo::exists(metaPath)) {
        vectors = std::make_unique<VectorIndex>();
        if (!vectors->load(indexPath, metaPath)) {
            LOG_WARN(rcCorpus, "Vector index for corpus '%s' failed to load; lexical only",
                     qUtf8Printable(corpus.name));
            vectors.reset();
        } else if (vectors->metadata().buildId != lexical->buildId()) {
            LOG_WARN(rcCorpus, "Vector index of corpus '%s' is from build '%s', database is "
                               "from '%s'; lexical only",
                     qUtf8Printable(corpus.name), qUtf8Printable(vectors->metadata().buildId),
                     qUtf8Printable(lexical->buildId()));
            vectors->release();
            vectors.reset();
            vectorsOutOfDate = true;
        }
    } else {
        LOG_INFO(rcCorpus, "Corpus '%s' has no vector index; lexical only",
                 qUtf8Printable(corpus.name));
    }

    Corpus resolved = corpus;
    if (auto manifest = IndexManifest::read(corpus.storagePath)) {
        resolved.modelId = manifest->modelId;
        resolved.lastIndexedAt = manifest->indexedAt;
    }

    LOG_INFO(rcCorpus, "Opened corpus '%s': %d item(s), %d vector(s)",
             qUtf8Printable(corpus.name), static_cast<int>(items->size()),
             vectors ? vectors->size() : 0);

    auto client = std::make_shared<RetrievalClient>(std::move(resolved), std::move(lexical),
                                                    std::move(vectors),
                                                    ItemCatalog(std::move(*items)));
    client->m_vectorsOutOfDate = vectorsOutOfDate;
    return client;
}

std::optional<RetrievalClient::Lease> RetrievalClient::acquire(
    const std::shared_ptr<RetrievalClient>& client)
{
    if (!client) {
        return std::nullopt;
    }
    {
        std::lock_guard<std::mutex> lock(client->m_mutex);
        if (client->m_released) {
            return std::nullopt;
        }
        ++client->m_leases;
    }
    return Lease(client);
}

void RetrievalClient::endLease()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    --m_leases;
    if (m_leases == 0) {
        m_leasesDone.notify_all();
    }
}

void RetrievalClient::release()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_released && !m_lexical && !m_vectors) {
        return;
    }
    m_released = true;
    m_leasesDone.wait(lock, [this]() { return m_leases == 0; });

    if (m_lexical) {
        m_lexical.reset();
        s_liveHandles.fetch_sub(1);
    }
    if (m_vectors) {
        m_vectors->release();
        m_vectors.reset();
        s_liveHandles.fetch_sub(1);
    }
    LOG_DEBUG(rcCorpus, "Released client for corpus '%s'", qUtf8Printable(m_corpus.name));
}

bool RetrievalClient::isReleased() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_released;
}

int RetrievalClient::activeLeases() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_leases;
}

std::vector<LexicalHit> RetrievalClient::lexicalQuery(const QString& text, int limit) const
{
    if (!m_lexical) {
        return {};
    }
    return m_lexical->query(text, limit);
}

std::vector<VectorHit> RetrievalClient::vectorQuery(const std::vector<float>& embedding,
                                                    int limit) const
{
    if (!m_vectors || !m_vectors->isAvailable()) {
        return {};
    }
    return m_vectors->query(embedding, limit);
}

bool RetrievalClient::hasVectors() const
{
    return m_vectors && m_vectors->isAvailable();
}

QString RetrievalClient::vectorModelId() const
{
    return m_vectors ? m_vectors->metadata().modelId : QString();
}

int RetrievalClient::liveHandleCount()
{
    return s_liveHandles.load();
}

} // namespace rc
