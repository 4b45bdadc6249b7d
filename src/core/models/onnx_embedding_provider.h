#pragma once

#include "core/models/embedding_provider.h"
#include "core/models/model_session.h"

#include <atomic>
#include <cstdint>
#include <memory>

namespace rc {

struct EmbeddingCircuitBreaker {
    std::atomic<int> consecutiveFailures{0};
    std::atomic<int64_t> lastFailureTime{0};
    static constexpr int kOpenThreshold = 5;          // Open after 5 consecutive failures
    static constexpr int kHalfOpenDelayMs = 30000;    // Try again after 30s

    bool isOpen() const;
    void recordSuccess();
    void recordFailure();
};

// Bi-encoder embedding service on ONNX Runtime. Pools the CLS token when the
// model returns hidden states, and L2-normalizes every vector.
class OnnxEmbeddingProvider : public EmbeddingProvider {
public:
    explicit OnnxEmbeddingProvider(const ModelSpec& spec);
    ~OnnxEmbeddingProvider() override;

    OnnxEmbeddingProvider(const OnnxEmbeddingProvider&) = delete;
    OnnxEmbeddingProvider& operator=(const OnnxEmbeddingProvider&) = delete;

    bool initialize();

    bool isAvailable() const override;
    QString modelId() const override;
    int dimensions() const override;

    std::optional<std::vector<float>> embedQuery(const QString& text) override;
    std::optional<std::vector<std::vector<float>>> embedDocuments(
        const std::vector<QString>& texts) override;

    // Expose for testing
    EmbeddingCircuitBreaker& circuitBreaker() { return m_circuitBreaker; }

private:
    std::optional<std::vector<std::vector<float>>> embedBatch(const std::vector<QString>& texts);

    ModelSpec m_spec;
    std::unique_ptr<ModelSession> m_session;
    std::unique_ptr<WordPieceTokenizer> m_tokenizer;
    bool m_available = false;
    EmbeddingCircuitBreaker m_circuitBreaker;
};

} // namespace rc
