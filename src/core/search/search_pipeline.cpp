#include "core/search/search_pipeline.h"
#include "core/ranking/chunk_deduplicator.h"
#include "core/ranking/hybrid_fusion.h"
#include "core/ranking/time_decay_scorer.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QElapsedTimer>
#include <QJsonArray>

#include <algorithm>
#include <chrono>
#include <future>
#include <utility>

namespace rc {

namespace {

using Clock = std::chrono::steady_clock;

template <typename T>
std::optional<T> awaitStage(std::optional<std::future<std::optional<T>>>& future,
                            Clock::time_point deadline,
                            const QString& stage,
                            std::vector<SkippedStage>* skipped)
{
    if (!future) {
        skipped->push_back({stage, QStringLiteral("rejected")});
        return std::nullopt;
    }
    if (future->wait_until(deadline) != std::future_status::ready) {
        LOG_WARN(rcRanking, "Stage '%s' timed out", qUtf8Printable(stage));
        skipped->push_back({stage, QStringLiteral("timeout")});
        return std::nullopt;
    }
    std::optional<T> value = future->get();
    if (!value) {
        skipped->push_back({stage, QStringLiteral("failed")});
    }
    return value;
}

bool containsStatus(const std::vector<ItemStatus>& statuses, ItemStatus status)
{
    return std::find(statuses.begin(), statuses.end(), status) != statuses.end();
}

} // namespace

QJsonObject SkippedStage::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("stage")] = stage;
    json[QStringLiteral("reason")] = reason;
    return json;
}

bool SearchResponse::skipped(const QString& stage) const
{
    return std::any_of(skippedStages.begin(), skippedStages.end(),
                       [&](const SkippedStage& s) { return s.stage == stage; });
}

QJsonObject SearchResponse::toJson(bool includeBreakdown) const
{
    QJsonArray resultArray;
    for (const RetrievalCandidate& candidate : results) {
        resultArray.append(candidate.toJson(includeBreakdown, chunkContext));
    }
    QJsonArray skippedArray;
    for (const SkippedStage& stage : skippedStages) {
        skippedArray.append(stage.toJson());
    }

    QJsonObject json;
    json[QStringLiteral("query")] = query;
    if (expanded) {
        json[QStringLiteral("expandedQuery")] = effectiveQuery;
    }
    json[QStringLiteral("corpus")] = corpus;
    json[QStringLiteral("profile")] = profile;
    json[QStringLiteral("results")] = resultArray;
    json[QStringLiteral("total")] = static_cast<int>(results.size());
    json[QStringLiteral("candidateCount")] = candidateCount;
    json[QStringLiteral("skippedStages")] = skippedArray;
    json[QStringLiteral("reranked")] = reranked;
    json[QStringLiteral("elapsedMs")] = elapsedMs;
    return json;
}

SearchPipeline::SearchPipeline(WorkerPool& stagePool,
                               EmbeddingProvider* embeddings,
                               RelevanceModel* relevance,
                               PipelineConfig config)
    : m_stagePool(stagePool)
    , m_embeddings(embeddings)
    , m_relevance(relevance)
    , m_config(std::move(config))
    , m_expander(m_config.expansion)
{
}

double SearchPipeline::now() const
{
    if (m_config.clock) {
        return m_config.clock();
    }
    return static_cast<double>(QDateTime::currentMSecsSinceEpoch()) / 1000.0;
}

bool SearchPipeline::passesFilters(const RetrievalCandidate& candidate,
                                   const SearchRequest& request,
                                   const SearchProfile& profile)
{
    if (!candidate.item) {
        return false;
    }
    const Item& item = *candidate.item;

    if (!request.includeStatuses.empty() && !containsStatus(request.includeStatuses, item.status)) {
        return false;
    }
    if (containsStatus(request.excludeStatuses, item.status)) {
        return false;
    }

    const QStringList include = request.includeTypes.value_or(profile.defaultIncludeTypes);
    const QStringList exclude = request.excludeTypes.value_or(profile.defaultExcludeTypes);
    const QString type = item.metadata.type;
    if (!include.isEmpty() && !include.contains(type, Qt::CaseInsensitive)) {
        return false;
    }
    if (!type.isEmpty() && exclude.contains(type, Qt::CaseInsensitive)) {
        return false;
    }
    return true;
}

SearchPipeline::Retrieval SearchPipeline::retrieve(
    const std::shared_ptr<RetrievalClient::Lease>& lease,
    const QString& queryText,
    bool useVectors,
    std::vector<SkippedStage>* skipped) const
{
    Retrieval retrieval;
    const int depth = std::max(1, m_config.retrievalDepth);
    const auto start = Clock::now();

    auto lexicalFuture = m_stagePool.submit([lease, queryText, depth]() {
        return std::optional<std::vector<LexicalHit>>((*lease)->lexicalQuery(queryText, depth));
    });

    if (useVectors) {
        EmbeddingProvider* embeddings = m_embeddings;
        auto embedFuture = m_stagePool.submit([embeddings, queryText]() {
            return embeddings->embedQuery(queryText);
        });
        auto embedding = awaitStage(embedFuture,
                                    Clock::now() + std::chrono::milliseconds(m_config.timeouts.embeddingMs),
                                    QStringLiteral("embedding"), skipped);
        if (embedding) {
            std::vector<float> vec = std::move(*embedding);
            auto vectorFuture = m_stagePool.submit([lease, vec, depth]() {
                return std::optional<std::vector<VectorHit>>((*lease)->vectorQuery(vec, depth));
            });
            auto hits = awaitStage(vectorFuture,
                                   Clock::now() + std::chrono::milliseconds(m_config.timeouts.vectorMs),
                                   QStringLiteral("vector"), skipped);
            if (hits) {
                retrieval.vector = std::move(*hits);
            }
        } else {
            skipped->push_back({QStringLiteral("vector"), QStringLiteral("no_query_embedding")});
        }
    }

    auto lexical = awaitStage(lexicalFuture,
                              start + std::chrono::milliseconds(m_config.timeouts.lexicalMs),
                              QStringLiteral("lexical"), skipped);
    if (lexical) {
        retrieval.lexical = std::move(*lexical);
    }
    return retrieval;
}

std::vector<QString> SearchPipeline::expansionSeeds(
    const std::shared_ptr<RetrievalClient::Lease>& lease,
    const QString& query,
    bool useVectors,
    const FusionConfig& fusion,
    std::vector<SkippedStage>* skipped) const
{
    std::vector<SkippedStage> seedSkips;
    const Retrieval seedRetrieval = retrieve(lease, query, useVectors, &seedSkips);

    FusionConfig seedFusion = fusion;
    seedFusion.tagBoostEnabled = false;
    seedFusion.metadataBoostEnabled = false;
    std::vector<RetrievalCandidate> fused = HybridFusion::fuse(
        seedRetrieval.lexical, seedRetrieval.vector, query, (*lease)->catalog(), seedFusion);
    fused = ChunkDeduplicator::deduplicate(std::move(fused));

    std::vector<QString> seeds;
    for (const RetrievalCandidate& candidate : fused) {
        if (!candidate.item || candidate.item->status != ItemStatus::Active) {
            continue;
        }
        seeds.push_back(candidate.relevanceText());
        if (static_cast<int>(seeds.size()) >= m_config.expansion.topK) {
            break;
        }
    }

    if (static_cast<int>(seeds.size()) < m_config.expansion.topK) {
        skipped->push_back({QStringLiteral("expansion"),
                            seedSkips.empty() ? QStringLiteral("insufficient_seeds")
                                              : QStringLiteral("seed_retrieval_degraded")});
    }
    return seeds;
}

std::optional<SearchResponse> SearchPipeline::run(const std::shared_ptr<RetrievalClient>& client,
                                                  const SearchRequest& request,
                                                  const SearchProfile& profile,
                                                  const CancelToken& cancel,
                                                  Failure* failure) const
{
    auto fail = [failure](Failure reason) -> std::optional<SearchResponse> {
        if (failure) {
            *failure = reason;
        }
        return std::nullopt;
    };
    if (failure) {
        *failure = Failure::None;
    }

    QElapsedTimer timer;
    timer.start();

    auto acquired = RetrievalClient::acquire(client);
    if (!acquired) {
        return fail(Failure::ClientReleased);
    }
    auto lease = std::make_shared<RetrievalClient::Lease>(std::move(*acquired));
    const RetrievalClient& corpusClient = **lease;

    SearchResponse response;
    response.query = request.query;
    response.effectiveQuery = request.query;
    response.corpus = corpusClient.corpus().name;
    response.profile = profile.name;
    response.chunkContext = profile.showChunkContext;

    // ── Resolve per-query configuration ─────────────────────
    FusionConfig fusion = FusionConfig::fromHybridWeight(
        request.hybridWeight.value_or(profile.hybridWeight), profile.bm25Boost);
    fusion.metadataBoosts = profile.metadataBoosts;
    fusion.metadataBoostEnabled = request.metadataBoost.value_or(!profile.metadataBoosts.empty());
    fusion.tagBoostEnabled = request.tagBoost.value_or(true);

    TimeDecayConfig decay = profile.timeDecayConfig();
    if (request.timeDecay) {
        decay.enabled = *request.timeDecay;
    }

    const bool rerankWanted = request.rerank.value_or(profile.crossEncoderEnabled);
    const bool expandWanted = request.expandQuery.value_or(profile.queryExpansionEnabled);

    bool useVectors = false;
    if (fusion.vectorWeight > 0.0) {
        if (!corpusClient.hasVectors()) {
            response.skippedStages.push_back(
                {QStringLiteral("vector"), corpusClient.vectorsOutOfDate()
                                               ? QStringLiteral("stale_index")
                                               : QStringLiteral("no_index")});
        } else if (!m_embeddings || !m_embeddings->isAvailable()) {
            response.skippedStages.push_back({QStringLiteral("vector"), QStringLiteral("unavailable")});
        } else if (m_embeddings->modelId() != corpusClient.vectorModelId()) {
            LOG_WARN(rcRanking, "Query model %s does not match index model %s",
                     qUtf8Printable(m_embeddings->modelId()),
                     qUtf8Printable(corpusClient.vectorModelId()));
            response.skippedStages.push_back({QStringLiteral("vector"), QStringLiteral("model_mismatch")});
        } else {
            useVectors = true;
        }
    }

    // ── Expansion ───────────────────────────────────────────
    if (expandWanted && m_expander.shouldExpand(request.query)) {
        if (isCancelled(cancel)) {
            return fail(Failure::Cancelled);
        }
        const std::vector<QString> seeds =
            expansionSeeds(lease, request.query, useVectors, fusion, &response.skippedStages);
        response.effectiveQuery = m_expander.expand(request.query, seeds);
        response.expanded = response.effectiveQuery != request.query;
    }

    // ── Retrieval and fusion ────────────────────────────────
    if (isCancelled(cancel)) {
        return fail(Failure::Cancelled);
    }
    const Retrieval retrieval = retrieve(lease, response.effectiveQuery, useVectors,
                                         &response.skippedStages);

    if (isCancelled(cancel)) {
        return fail(Failure::Cancelled);
    }
    std::vector<RetrievalCandidate> candidates = HybridFusion::fuse(
        retrieval.lexical, retrieval.vector, response.effectiveQuery,
        corpusClient.catalog(), fusion);

    candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                    [&](const RetrievalCandidate& candidate) {
                                        return !passesFilters(candidate, request, profile);
                                    }),
                     candidates.end());

    // ── Recency, score floor, dedup ─────────────────────────
    TimeDecayScorer(decay).apply(candidates, now());

    if (request.minScore) {
        const double floor = *request.minScore;
        candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                        [floor](const RetrievalCandidate& candidate) {
                                            return candidate.finalScore < floor;
                                        }),
                         candidates.end());
    }

    candidates = ChunkDeduplicator::deduplicate(std::move(candidates));
    response.candidateCount = static_cast<int>(candidates.size());

    // ── Refinement ──────────────────────────────────────────
    if (isCancelled(cancel)) {
        return fail(Failure::Cancelled);
    }
    if (rerankWanted && !candidates.empty()) {
        CrossEncoderRefiner refiner(m_relevance);
        if (!refiner.isAvailable()) {
            response.skippedStages.push_back({QStringLiteral("rerank"), QStringLiteral("unavailable")});
        } else {
            RefinerConfig refinerConfig;
            refinerConfig.topN = m_config.rerankTopN;
            refinerConfig.topK = request.limit;
            using Refined = std::pair<std::vector<RetrievalCandidate>, CrossEncoderRefiner::Outcome>;
            const QString queryText = response.effectiveQuery;
            auto future = m_stagePool.submit([lease, refiner, queryText, candidates, refinerConfig]() {
                CrossEncoderRefiner::Outcome outcome;
                auto refined = refiner.refine(queryText, candidates, refinerConfig, &outcome);
                return std::optional<Refined>(Refined(std::move(refined), outcome));
            });
            auto refined = awaitStage(future,
                                      Clock::now() + std::chrono::milliseconds(m_config.timeouts.rerankMs),
                                      QStringLiteral("rerank"), &response.skippedStages);
            if (refined) {
                if (refined->second.applied) {
                    candidates = std::move(refined->first);
                    response.reranked = true;
                } else if (refined->second.modelFailed) {
                    response.skippedStages.push_back({QStringLiteral("rerank"), QStringLiteral("failed")});
                } else {
                    response.skippedStages.push_back({QStringLiteral("rerank"), QStringLiteral("all_pinned")});
                }
            }
        }
    }

    if (static_cast<int>(candidates.size()) > request.limit) {
        candidates.resize(static_cast<size_t>(request.limit));
    }

    if (isCancelled(cancel)) {
        return fail(Failure::Cancelled);
    }

    response.results = std::move(candidates);
    response.elapsedMs = timer.elapsed();
    LOG_INFO(rcRanking, "Search '%s' on '%s' (%s): %d result(s), %d skipped stage(s), %lld ms",
             qUtf8Printable(response.effectiveQuery), qUtf8Printable(response.corpus),
             qUtf8Printable(response.profile), static_cast<int>(response.results.size()),
             static_cast<int>(response.skippedStages.size()),
             static_cast<long long>(response.elapsedMs));
    return response;
}

} // namespace rc
