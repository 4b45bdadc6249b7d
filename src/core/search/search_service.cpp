#include "core/search/search_service.h"
#include "core/corpus/storage_guard.h"
#include "core/indexing/item_source.h"
#include "core/models/onnx_cross_encoder.h"
#include "core/models/onnx_embedding_provider.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QJsonArray>

namespace rc {

namespace {

ModelSpec toModelSpec(const QString& name, const ModelSettings& settings)
{
    ModelSpec spec;
    spec.name = name;
    spec.modelPath = settings.modelPath;
    spec.vocabPath = settings.vocabPath;
    spec.modelId = settings.modelId;
    spec.dimensions = settings.dimensions;
    spec.queryPrefix = settings.queryPrefix;
    spec.maxSequenceLength = settings.maxSequenceLength;
    spec.intraOpThreads = settings.intraOpThreads;
    return spec;
}

void setError(ServiceError* error, IpcErrorCode code, const QString& message)
{
    if (error) {
        error->code = code;
        error->message = message;
    }
}

PipelineConfig pipelineConfigFor(const Settings& settings, std::function<double()> clock)
{
    PipelineConfig config;
    config.timeouts.lexicalMs = settings.lexicalTimeoutMs;
    config.timeouts.embeddingMs = settings.embeddingTimeoutMs;
    config.timeouts.vectorMs = settings.vectorTimeoutMs;
    config.timeouts.rerankMs = settings.rerankTimeoutMs;
    config.retrievalDepth = settings.retrievalDepth;
    config.rerankTopN = settings.rerankTopN;
    config.clock = std::move(clock);
    return config;
}

} // namespace

// ── Construction ────────────────────────────────────────────

std::optional<std::vector<Corpus>> SearchService::corporaFromSettings(const Settings& settings,
                                                                      QString* error)
{
    std::vector<Corpus> corpora;

    Corpus defaultCorpus;
    defaultCorpus.name = settings.defaultCorpus;
    defaultCorpus.rootPath = settings.defaultCorpusRoot;
    defaultCorpus.storagePath = settings.defaultStoragePath;
    corpora.push_back(defaultCorpus);

    for (const CorpusSettings& configured : settings.corpora) {
        if (configured.name == settings.defaultCorpus) {
            if (error) {
                *error = QStringLiteral("Corpus '%1' shadows the default corpus")
                             .arg(configured.name);
            }
            return std::nullopt;
        }
        Corpus corpus;
        corpus.name = configured.name;
        corpus.rootPath = configured.root;
        corpus.storagePath = configured.storage.isEmpty()
            ? StorageGuard::deriveStoragePath(configured.root,
                                              settings.defaultCorpusRoot,
                                              settings.defaultStoragePath)
            : configured.storage;
        corpora.push_back(corpus);
    }
    return corpora;
}

std::optional<SearchProfileRegistry> SearchService::profilesFromSettings(const Settings& settings,
                                                                         QString* error)
{
    SearchProfileRegistry registry;
    for (auto it = settings.customProfiles.constBegin();
         it != settings.customProfiles.constEnd(); ++it) {
        if (!it.value().isObject()) {
            if (error) {
                *error = QStringLiteral("Profile '%1' must be an object").arg(it.key());
            }
            return std::nullopt;
        }
        QString profileError;
        auto profile = SearchProfile::fromJson(it.key(), it.value().toObject(), &profileError);
        if (!profile || !registry.addCustom(*profile, &profileError)) {
            if (error) {
                *error = QStringLiteral("Invalid profile '%1': %2").arg(it.key(), profileError);
            }
            return std::nullopt;
        }
        LOG_INFO(rcCore, "Registered custom profile '%s'", qUtf8Printable(it.key()));
    }
    return registry;
}

std::unique_ptr<SearchService> SearchService::create(const Settings& settings, QString* error)
{
    if (!SettingsManager::validate(settings, error)) {
        return nullptr;
    }
    auto profiles = profilesFromSettings(settings, error);
    if (!profiles) {
        return nullptr;
    }
    if (!corporaFromSettings(settings, error)) {
        return nullptr;
    }

    std::unique_ptr<EmbeddingProvider> embeddings;
    if (settings.embeddingModel.isConfigured()) {
        auto provider = std::make_unique<OnnxEmbeddingProvider>(
            toModelSpec(QStringLiteral("embedding"), settings.embeddingModel));
        if (provider->initialize()) {
            embeddings = std::move(provider);
        } else {
            LOG_WARN(rcModels, "Embedding model unavailable; searches are lexical-only");
        }
    } else {
        LOG_INFO(rcModels, "No embedding model configured; searches are lexical-only");
    }

    std::unique_ptr<RelevanceModel> relevance;
    if (settings.crossEncoderModel.isConfigured()) {
        auto model = std::make_unique<OnnxCrossEncoder>(
            toModelSpec(QStringLiteral("cross-encoder"), settings.crossEncoderModel));
        if (model->initialize()) {
            relevance = std::move(model);
        } else {
            LOG_WARN(rcModels, "Cross-encoder unavailable; reranking disabled");
        }
    }

    return std::make_unique<SearchService>(settings, std::move(*profiles),
                                           std::move(embeddings), std::move(relevance));
}

SearchService::SearchService(const Settings& settings,
                             SearchProfileRegistry profiles,
                             std::unique_ptr<EmbeddingProvider> embeddings,
                             std::unique_ptr<RelevanceModel> relevance,
                             CorpusManager::ClientFactory clientFactory,
                             std::function<double()> clock)
    : m_settings(settings)
    , m_defaultCorpus(settings.defaultCorpus)
    , m_profiles(std::move(profiles))
    , m_embeddings(std::move(embeddings))
    , m_relevance(std::move(relevance))
    , m_stagePool(QStringLiteral("stage"), settings.stageThreads, settings.queueLimit)
    , m_indexer(m_embeddings.get())
{
    QString error;
    auto corpora = corporaFromSettings(settings, &error);
    if (!corpora) {
        LOG_ERROR(rcCore, "Corpus configuration rejected: %s", qUtf8Printable(error));
        corpora.emplace();
    }
    m_corpora = std::make_unique<CorpusManager>(std::move(*corpora),
                                                settings.clientCacheSize,
                                                std::move(clientFactory));
    m_pipeline = std::make_unique<SearchPipeline>(m_stagePool, m_embeddings.get(),
                                                  m_relevance.get(),
                                                  pipelineConfigFor(settings, std::move(clock)));
}

SearchService::~SearchService()
{
    // Stage tasks may still hold leases and model pointers.
    m_corpora->clear();
    m_stagePool.shutdown();
}

// ── search ──────────────────────────────────────────────────

std::optional<QJsonObject> SearchService::search(const QJsonObject& params,
                                                 const CancelToken& cancel,
                                                 ServiceError* error)
{
    SearchLimits limits;
    limits.defaultLimit = m_settings.defaultLimit;
    limits.maxLimit = m_settings.maxLimit;

    QString message;
    auto request = SearchRequest::fromJson(params, limits, &message);
    if (!request) {
        setError(error, IpcErrorCode::InvalidParams, message);
        return std::nullopt;
    }
    if (request->corpus.isEmpty()) {
        request->corpus = m_defaultCorpus;
    }

    auto profile = m_profiles.find(request->profile);
    if (!profile) {
        setError(error, IpcErrorCode::NotFound,
                 QStringLiteral("Unknown profile: %1").arg(request->profile));
        return std::nullopt;
    }
    if (!m_corpora->corpus(request->corpus)) {
        setError(error, IpcErrorCode::NotFound,
                 QStringLiteral("Unknown corpus: %1").arg(request->corpus));
        return std::nullopt;
    }

    // One retry: the cached client may be evicted between get() and the lease.
    for (int attempt = 0; attempt < 2; ++attempt) {
        if (isCancelled(cancel)) {
            setError(error, IpcErrorCode::Cancelled, QStringLiteral("Search cancelled"));
            return std::nullopt;
        }

        auto client = m_corpora->get(request->corpus, &message);
        if (!client) {
            setError(error, IpcErrorCode::ServiceUnavailable,
                     QStringLiteral("Corpus '%1' is not available: %2")
                         .arg(request->corpus, message));
            return std::nullopt;
        }

        SearchPipeline::Failure failure = SearchPipeline::Failure::None;
        auto response = m_pipeline->run(client, *request, *profile, cancel, &failure);
        if (response) {
            return response->toJson(request->includeBreakdown);
        }
        if (failure == SearchPipeline::Failure::Cancelled) {
            setError(error, IpcErrorCode::Cancelled, QStringLiteral("Search cancelled"));
            return std::nullopt;
        }
        LOG_DEBUG(rcCore, "Client for '%s' released mid-request, retrying",
                  qUtf8Printable(request->corpus));
    }

    setError(error, IpcErrorCode::ServiceUnavailable,
             QStringLiteral("Corpus '%1' was released during the search").arg(request->corpus));
    return std::nullopt;
}

// ── reindex ─────────────────────────────────────────────────

std::optional<QJsonObject> SearchService::reindex(const QJsonObject& params,
                                                  ServiceError* error)
{
    const QJsonValue corpusValue = params.value(QStringLiteral("corpus"));
    const QJsonValue forceValue = params.value(QStringLiteral("force"));
    const QJsonValue profileValue = params.value(QStringLiteral("profile"));
    if ((!corpusValue.isUndefined() && !corpusValue.isString())
        || (!forceValue.isUndefined() && !forceValue.isBool())
        || (!profileValue.isUndefined() && !profileValue.isString())) {
        setError(error, IpcErrorCode::InvalidParams,
                 QStringLiteral("corpus and profile must be strings, force a boolean"));
        return std::nullopt;
    }

    const QString name = corpusValue.toString().isEmpty() ? m_defaultCorpus
                                                          : corpusValue.toString();
    auto corpus = m_corpora->corpus(name);
    if (!corpus) {
        setError(error, IpcErrorCode::NotFound, QStringLiteral("Unknown corpus: %1").arg(name));
        return std::nullopt;
    }

    IndexBuildOptions options;
    options.force = forceValue.toBool(false);
    options.chunking.threshold = m_settings.chunkThreshold;
    options.chunking.chunkSize = m_settings.chunkSize;
    options.chunking.overlap = m_settings.chunkOverlap;
    if (!profileValue.toString().isEmpty()) {
        auto profile = m_profiles.find(profileValue.toString());
        if (!profile) {
            setError(error, IpcErrorCode::NotFound,
                     QStringLiteral("Unknown profile: %1").arg(profileValue.toString()));
            return std::nullopt;
        }
        options.chunking.chunkSize = profile->chunkSize;
        options.chunking.overlap = profile->chunkOverlap;
        options.chunkingEnabled = profile->chunkingEnabled;
    }

    {
        std::lock_guard<std::mutex> lock(m_reindexMutex);
        if (m_reindexing.contains(name)) {
            setError(error, IpcErrorCode::AlreadyRunning,
                     QStringLiteral("Corpus '%1' is already being indexed").arg(name));
            return std::nullopt;
        }
        m_reindexing.insert(name);
    }

    JsonItemSource source;
    QString message;
    StorageGuard::Verdict verdict = StorageGuard::Verdict::Safe;
    auto report = m_indexer.build(*corpus, source, options, &message, &verdict);

    {
        std::lock_guard<std::mutex> lock(m_reindexMutex);
        m_reindexing.remove(name);
    }

    if (!report) {
        if (verdict == StorageGuard::Verdict::Mismatch) {
            setError(error, IpcErrorCode::StorageMismatch, message);
        } else {
            setError(error, IpcErrorCode::InternalError, message);
        }
        LOG_WARN(rcIndex, "Reindex of '%s' failed: %s",
                 qUtf8Printable(name), qUtf8Printable(message));
        return std::nullopt;
    }

    // Next search opens the fresh files.
    m_corpora->invalidate(name);

    QJsonObject result = report->toJson();
    result[QStringLiteral("corpus")] = name;
    return result;
}

// ── Introspection ───────────────────────────────────────────

QJsonObject SearchService::listProfiles() const
{
    return m_profiles.toJson();
}

QJsonObject SearchService::listCorpora() const
{
    QJsonArray corpora;
    for (const Corpus& corpus : m_corpora->corpora()) {
        QJsonObject json = corpus.toJson();
        auto manifest = IndexManifest::read(corpus.storagePath);
        json[QStringLiteral("indexed")] = manifest.has_value();
        if (manifest) {
            json[QStringLiteral("modelId")] = manifest->modelId;
            json[QStringLiteral("lastIndexedAt")] = manifest->indexedAt;
            json[QStringLiteral("itemCount")] = manifest->itemCount;
            json[QStringLiteral("documentCount")] = manifest->documentCount;
        }
        corpora.append(json);
    }

    QJsonObject result;
    result[QStringLiteral("corpora")] = corpora;
    result[QStringLiteral("default")] = m_defaultCorpus;
    return result;
}

QJsonObject SearchService::cacheStats() const
{
    QJsonObject result = m_corpora->stats().toJson();
    QJsonObject pool;
    pool[QStringLiteral("threads")] = m_stagePool.threadCount();
    pool[QStringLiteral("pending")] = m_stagePool.pendingCount();
    pool[QStringLiteral("submitted")] = static_cast<qint64>(m_stagePool.submittedCount());
    pool[QStringLiteral("rejected")] = static_cast<qint64>(m_stagePool.rejectedCount());
    result[QStringLiteral("stagePool")] = pool;
    return result;
}

} // namespace rc
