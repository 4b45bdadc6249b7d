#pragma once

#include "core/concurrency/worker_pool.h"
#include "core/corpus/corpus_manager.h"
#include "core/indexing/corpus_indexer.h"
#include "core/models/embedding_provider.h"
#include "core/models/relevance_model.h"
#include "core/search/search_pipeline.h"
#include "core/search/search_profiles.h"
#include "core/shared/ipc_messages.h"
#include "core/shared/settings.h"

#include <QJsonObject>
#include <QSet>
#include <QString>

#include <memory>
#include <mutex>
#include <optional>

namespace rc {

// SearchService: the query-side surface behind the IPC methods:
// search, reindex, list_profiles, list_corpora, get_cache_stats.
//
// Owns the models, the stage pool, the corpus client cache and the profile
// registry. Every method is callable from several threads at once.
class SearchService {
public:
    // Builds the service from settings: registers custom profiles, lays out
    // the corpus list and loads the configured ONNX models. Fails on invalid
    // profiles or corpus definitions. A model that cannot be loaded is
    // logged and left out.
    static std::unique_ptr<SearchService> create(const Settings& settings,
                                                 QString* error = nullptr);

    // Models may be null. profiles must already hold the custom profiles.
    SearchService(const Settings& settings,
                  SearchProfileRegistry profiles,
                  std::unique_ptr<EmbeddingProvider> embeddings,
                  std::unique_ptr<RelevanceModel> relevance,
                  CorpusManager::ClientFactory clientFactory = {},
                  std::function<double()> clock = {});
    ~SearchService();

    SearchService(const SearchService&) = delete;
    SearchService& operator=(const SearchService&) = delete;

    std::optional<QJsonObject> search(const QJsonObject& params,
                                      const CancelToken& cancel = {},
                                      ServiceError* error = nullptr);
    std::optional<QJsonObject> reindex(const QJsonObject& params,
                                       ServiceError* error = nullptr);

    QJsonObject listProfiles() const;
    QJsonObject listCorpora() const;
    QJsonObject cacheStats() const;

    // Corpus list for the settings: the default corpus first, then the
    // configured ones with their storage derived from the root when unset.
    static std::optional<std::vector<Corpus>> corporaFromSettings(const Settings& settings,
                                                                  QString* error = nullptr);
    static std::optional<SearchProfileRegistry> profilesFromSettings(const Settings& settings,
                                                                     QString* error = nullptr);

    CorpusManager& corpusManager() { return *m_corpora; }
    const QString& defaultCorpus() const { return m_defaultCorpus; }

private:
    Settings m_settings;
    QString m_defaultCorpus;
    SearchProfileRegistry m_profiles;

    std::unique_ptr<EmbeddingProvider> m_embeddings;
    std::unique_ptr<RelevanceModel> m_relevance;

    WorkerPool m_stagePool;
    std::unique_ptr<CorpusManager> m_corpora;
    std::unique_ptr<SearchPipeline> m_pipeline;
    CorpusIndexer m_indexer;

    std::mutex m_reindexMutex;
    QSet<QString> m_reindexing;
};

} // namespace rc
