#include "core/models/onnx_embedding_provider.h"
#include "core/shared/logging.h"

#include <chrono>
#include <cmath>

namespace rc {

namespace {

int64_t steadyNowMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

std::vector<float> normalizeEmbedding(std::vector<float> embedding)
{
    double sumSquares = 0.0;
    for (const float value : embedding) {
        sumSquares += static_cast<double>(value) * static_cast<double>(value);
    }

    const double norm = std::sqrt(sumSquares);
    if (norm <= 0.0) {
        return embedding;
    }

    for (float& value : embedding) {
        value = static_cast<float>(static_cast<double>(value) / norm);
    }
    return embedding;
}

} // namespace

bool EmbeddingCircuitBreaker::isOpen() const
{
    if (consecutiveFailures.load() < kOpenThreshold) {
        return false;
    }
    // In open state, allow one attempt once the half-open delay has elapsed
    return steadyNowMs() - lastFailureTime.load() < kHalfOpenDelayMs;
}

void EmbeddingCircuitBreaker::recordSuccess()
{
    consecutiveFailures.store(0);
}

void EmbeddingCircuitBreaker::recordFailure()
{
    consecutiveFailures.fetch_add(1);
    lastFailureTime.store(steadyNowMs());
}

OnnxEmbeddingProvider::OnnxEmbeddingProvider(const ModelSpec& spec)
    : m_spec(spec)
{
}

OnnxEmbeddingProvider::~OnnxEmbeddingProvider() = default;

bool OnnxEmbeddingProvider::initialize()
{
    m_available = false;

    if (m_spec.dimensions <= 0) {
        LOG_WARN(rcModels, "Embedding provider initialize failed: invalid dimensions %d",
                 m_spec.dimensions);
        return false;
    }

    m_tokenizer = std::make_unique<WordPieceTokenizer>(m_spec.vocabPath, m_spec.maxSequenceLength);
    if (!m_tokenizer->isLoaded()) {
        LOG_WARN(rcModels, "Embedding provider initialize failed: tokenizer unavailable");
        return false;
    }

    m_session = std::make_unique<ModelSession>(m_spec);
    if (!m_session->initialize()) {
        LOG_WARN(rcModels, "Embedding provider initialize failed: session unavailable");
        return false;
    }

    m_available = true;
    LOG_INFO(rcModels, "Embedding provider ready: %s (%d dims)",
             qUtf8Printable(m_spec.modelId), m_spec.dimensions);
    return true;
}

bool OnnxEmbeddingProvider::isAvailable() const
{
    return m_available;
}

QString OnnxEmbeddingProvider::modelId() const
{
    return m_spec.modelId;
}

int OnnxEmbeddingProvider::dimensions() const
{
    return m_spec.dimensions;
}

std::optional<std::vector<float>> OnnxEmbeddingProvider::embedQuery(const QString& text)
{
    auto result = embedBatch({m_spec.queryPrefix + text});
    if (!result || result->empty()) {
        return std::nullopt;
    }
    return std::move(result->front());
}

std::optional<std::vector<std::vector<float>>> OnnxEmbeddingProvider::embedDocuments(
    const std::vector<QString>& texts)
{
    return embedBatch(texts);
}

std::optional<std::vector<std::vector<float>>> OnnxEmbeddingProvider::embedBatch(
    const std::vector<QString>& texts)
{
    if (!m_available || texts.empty()) {
        return std::nullopt;
    }

    if (m_circuitBreaker.isOpen()) {
        LOG_WARN(rcModels, "Embedding circuit breaker is open, skipping inference");
        return std::nullopt;
    }

    const EncodedBatch batch = m_tokenizer->encodeBatch(texts);
    if (batch.isEmpty()) {
        return std::nullopt;
    }

    const std::optional<ModelOutput> output = m_session->run(batch);
    if (!output) {
        m_circuitBreaker.recordFailure();
        return std::nullopt;
    }

    const std::vector<int64_t>& shape = output->shape;
    const int dims = m_spec.dimensions;

    // [batch, dims] pooled output, or [batch, seq, dims] hidden states (CLS pooling).
    int64_t rowStride = 0;
    if (shape.size() == 2 && shape[0] == batch.batchSize && shape[1] == dims) {
        rowStride = dims;
    } else if (shape.size() == 3 && shape[0] == batch.batchSize
               && shape[2] == dims && shape[1] >= 1) {
        rowStride = shape[1] * shape[2];
    } else {
        LOG_WARN(rcModels, "Embedding inference failed: unsupported output shape");
        m_circuitBreaker.recordFailure();
        return std::nullopt;
    }

    std::vector<std::vector<float>> embeddings;
    embeddings.reserve(static_cast<size_t>(batch.batchSize));
    for (int i = 0; i < batch.batchSize; ++i) {
        const float* row = output->data.data() + static_cast<size_t>(i * rowStride);
        embeddings.push_back(normalizeEmbedding(std::vector<float>(row, row + dims)));
    }

    m_circuitBreaker.recordSuccess();
    return embeddings;
}

} // namespace rc
