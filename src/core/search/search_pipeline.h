#pragma once

#include "core/concurrency/worker_pool.h"
#include "core/corpus/retrieval_client.h"
#include "core/models/embedding_provider.h"
#include "core/models/relevance_model.h"
#include "core/query/query_expander.h"
#include "core/ranking/cross_encoder_refiner.h"
#include "core/search/search_profiles.h"
#include "core/search/search_request.h"
#include "core/shared/retrieval_candidate.h"

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <functional>
#include <optional>
#include <vector>

namespace rc {

// Per-stage time budgets in milliseconds.
struct StageTimeouts {
    int lexicalMs = 2000;
    int embeddingMs = 3000;
    int vectorMs = 2000;
    int rerankMs = 5000;
};

struct PipelineConfig {
    StageTimeouts timeouts;
    int retrievalDepth = 100;           // hits requested from each list
    int rerankTopN = 100;
    QueryExpansionConfig expansion;
    std::function<double()> clock;      // seconds since epoch; defaults to wall time
};

// A stage that was meant to run but did not contribute.
struct SkippedStage {
    QString stage;      // "lexical", "embedding", "vector", "expansion", "rerank"
    QString reason;     // "timeout", "unavailable", "failed", "rejected", "model_mismatch",
                        // "no_index", "stale_index", "all_pinned", ...

    QJsonObject toJson() const;
};

struct SearchResponse {
    QString query;
    QString effectiveQuery;             // differs from query when expanded
    QString corpus;
    QString profile;
    std::vector<RetrievalCandidate> results;
    std::vector<SkippedStage> skippedStages;
    int candidateCount = 0;             // after fusion and filtering, before truncation
    bool expanded = false;
    bool reranked = false;
    bool chunkContext = false;          // results carry their full passage
    qint64 elapsedMs = 0;

    bool skipped(const QString& stage) const;
    QJsonObject toJson(bool includeBreakdown = true) const;
};

// SearchPipeline: one query from text to ranked results:
//   expansion (optional) -> lexical || vector -> fusion -> status/type
//   filters -> time decay -> minScore -> dedup -> refiner (optional) -> top-k
//
// Stage lookups run on the stage pool under their own timeouts; a stage that
// fails or times out is reported as skipped and the query continues with the
// remaining signal. The cancel token is checked between stages.
class SearchPipeline {
public:
    enum class Failure {
        None,
        Cancelled,
        ClientReleased,     // the client was evicted before a lease was taken
    };

    // embeddings and relevance may be null.
    SearchPipeline(WorkerPool& stagePool,
                   EmbeddingProvider* embeddings,
                   RelevanceModel* relevance,
                   PipelineConfig config = {});

    std::optional<SearchResponse> run(const std::shared_ptr<RetrievalClient>& client,
                                      const SearchRequest& request,
                                      const SearchProfile& profile,
                                      const CancelToken& cancel = {},
                                      Failure* failure = nullptr) const;

    // Status and type filters with the profile's type defaults applied.
    static bool passesFilters(const RetrievalCandidate& candidate,
                              const SearchRequest& request,
                              const SearchProfile& profile);

    const PipelineConfig& config() const { return m_config; }

private:
    struct Retrieval {
        std::vector<LexicalHit> lexical;
        std::vector<VectorHit> vector;
    };

    Retrieval retrieve(const std::shared_ptr<RetrievalClient::Lease>& lease,
                       const QString& queryText,
                       bool useVectors,
                       std::vector<SkippedStage>* skipped) const;

    std::vector<QString> expansionSeeds(const std::shared_ptr<RetrievalClient::Lease>& lease,
                                        const QString& query,
                                        bool useVectors,
                                        const FusionConfig& fusion,
                                        std::vector<SkippedStage>* skipped) const;

    double now() const;

    WorkerPool& m_stagePool;
    EmbeddingProvider* m_embeddings = nullptr;
    RelevanceModel* m_relevance = nullptr;
    PipelineConfig m_config;
    QueryExpander m_expander;
};

} // namespace rc
