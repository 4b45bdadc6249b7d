#pragma once

#include "core/corpus/corpus.h"
#include "core/corpus/retrieval_client.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace rc {

// CorpusManager: registry of configured corpora plus a bounded LRU cache
// of their RetrievalClients, keyed by corpus name.
//
// The mutex covers lookup, insertion and eviction bookkeeping only. Client
// construction and release run outside it; an evicted client is released
// before get() returns, so its handles are closed before the slot is reused.
class CorpusManager {
public:
    using ClientFactory =
        std::function<std::shared_ptr<RetrievalClient>(const Corpus& corpus, QString* error)>;

    static constexpr int kDefaultCapacity = 3;

    explicit CorpusManager(std::vector<Corpus> corpora,
                           int capacity = kDefaultCapacity,
                           ClientFactory factory = {});
    ~CorpusManager();

    CorpusManager(const CorpusManager&) = delete;
    CorpusManager& operator=(const CorpusManager&) = delete;

    // ── Registry ────────────────────────────────────────────

    std::optional<Corpus> corpus(const QString& name) const;
    std::vector<Corpus> corpora() const;

    // ── Client cache ────────────────────────────────────────

    // Cached client, or a freshly opened one. nullptr with error set when
    // the corpus is unknown or cannot be opened.
    std::shared_ptr<RetrievalClient> get(const QString& name, QString* error = nullptr);

    // Drops and releases the cached client, e.g. after a re-index.
    void invalidate(const QString& name);
    void clear();

    struct Stats {
        int size = 0;
        int capacity = 0;
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t evictions = 0;
        QStringList cachedCorpora;     // most recently used first

        QJsonObject toJson() const;
    };
    Stats stats() const;

private:
    struct Entry {
        QString name;
        std::shared_ptr<RetrievalClient> client;
    };

    struct QStringHash {
        size_t operator()(const QString& s) const { return qHash(s); }
    };

    std::vector<Corpus> m_corpora;
    int m_capacity = kDefaultCapacity;
    ClientFactory m_factory;

    mutable std::mutex m_mutex;
    std::list<Entry> m_list;   // front = most recently used
    std::unordered_map<QString, std::list<Entry>::iterator, QStringHash> m_index;

    uint64_t m_hits = 0;
    uint64_t m_misses = 0;
    uint64_t m_evictions = 0;
};

} // namespace rc
