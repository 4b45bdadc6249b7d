#include "core/corpus/corpus_manager.h"
#include "core/shared/logging.h"

#include <QJsonArray>

#include <algorithm>

namespace rc {

QJsonObject CorpusManager::Stats::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("size")] = size;
    json[QStringLiteral("capacity")] = capacity;
    json[QStringLiteral("hits")] = static_cast<qint64>(hits);
    json[QStringLiteral("misses")] = static_cast<qint64>(misses);
    json[QStringLiteral("evictions")] = static_cast<qint64>(evictions);
    json[QStringLiteral("utilization")] =
        capacity > 0 ? static_cast<double>(size) / capacity : 0.0;
    json[QStringLiteral("cachedCorpora")] = QJsonArray::fromStringList(cachedCorpora);
    return json;
}

CorpusManager::CorpusManager(std::vector<Corpus> corpora, int capacity, ClientFactory factory)
    : m_corpora(std::move(corpora))
    , m_capacity(std::max(1, capacity))
    , m_factory(std::move(factory))
{
    if (!m_factory) {
        m_factory = [](const Corpus& corpus, QString* error) {
            return RetrievalClient::open(corpus, error);
        };
    }
}

CorpusManager::~CorpusManager()
{
    clear();
}

std::optional<Corpus> CorpusManager::corpus(const QString& name) const
{
    for (const Corpus& corpus : m_corpora) {
        if (corpus.name == name) {
            return corpus;
        }
    }
    return std::nullopt;
}

std::vector<Corpus> CorpusManager::corpora() const
{
    return m_corpora;
}

std::shared_ptr<RetrievalClient> CorpusManager::get(const QString& name, QString* error)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_index.find(name);
        if (it != m_index.end()) {
            if (it->second != m_list.begin()) {
                m_list.splice(m_list.begin(), m_list, it->second);
            }
            ++m_hits;
            LOG_DEBUG(rcCorpus, "Cache hit: %s", qUtf8Printable(name));
            return it->second->client;
        }
        ++m_misses;
    }

    const auto definition = corpus(name);
    if (!definition) {
        if (error) {
            *error = QStringLiteral("Unknown corpus: %1").arg(name);
        }
        return nullptr;
    }

    LOG_INFO(rcCorpus, "Cache miss: opening client for corpus '%s'", qUtf8Printable(name));
    std::shared_ptr<RetrievalClient> created = m_factory(*definition, error);
    if (!created) {
        return nullptr;
    }

    std::shared_ptr<RetrievalClient> result;
    std::vector<std::shared_ptr<RetrievalClient>> evicted;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_index.find(name);
        if (it != m_index.end()) {
            // Another caller opened it first; keep theirs.
            m_list.splice(m_list.begin(), m_list, it->second);
            result = it->second->client;
            evicted.push_back(std::move(created));
        } else {
            m_list.push_front({name, created});
            m_index[name] = m_list.begin();
            result = std::move(created);

            while (static_cast<int>(m_list.size()) > m_capacity) {
                Entry& back = m_list.back();
                LOG_INFO(rcCorpus, "Cache evict: %s", qUtf8Printable(back.name));
                evicted.push_back(std::move(back.client));
                m_index.erase(back.name);
                m_list.pop_back();
                ++m_evictions;
            }
        }
    }

    for (auto& client : evicted) {
        client->release();
    }
    return result;
}

void CorpusManager::invalidate(const QString& name)
{
    std::shared_ptr<RetrievalClient> dropped;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_index.find(name);
        if (it == m_index.end()) {
            return;
        }
        dropped = std::move(it->second->client);
        m_list.erase(it->second);
        m_index.erase(it);
    }
    LOG_INFO(rcCorpus, "Cache invalidate: %s", qUtf8Printable(name));
    dropped->release();
}

void CorpusManager::clear()
{
    std::list<Entry> dropped;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        dropped.swap(m_list);
        m_index.clear();
    }
    for (auto& entry : dropped) {
        entry.client->release();
    }
    if (!dropped.empty()) {
        LOG_INFO(rcCorpus, "Cache cleared: %d client(s)", static_cast<int>(dropped.size()));
    }
}

CorpusManager::Stats CorpusManager::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    Stats stats;
    stats.size = static_cast<int>(m_list.size());
    stats.capacity = m_capacity;
    stats.hits = m_hits;
    stats.misses = m_misses;
    stats.evictions = m_evictions;
    for (const Entry& entry : m_list) {
        stats.cachedCorpora.append(entry.name);
    }
    return stats;
}

} // namespace rc
