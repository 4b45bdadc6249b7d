#include "core/models/onnx_cross_encoder.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <cmath>

namespace rc {

OnnxCrossEncoder::OnnxCrossEncoder(const ModelSpec& spec)
    : m_spec(spec)
{
}

OnnxCrossEncoder::~OnnxCrossEncoder() = default;

bool OnnxCrossEncoder::initialize()
{
    m_available = false;

    m_tokenizer = std::make_unique<WordPieceTokenizer>(m_spec.vocabPath, m_spec.maxSequenceLength);
    if (!m_tokenizer->isLoaded()) {
        LOG_WARN(rcModels, "Cross-encoder: tokenizer unavailable");
        return false;
    }

    m_session = std::make_unique<ModelSession>(m_spec);
    if (!m_session->initialize()) {
        LOG_WARN(rcModels, "Cross-encoder: session unavailable");
        return false;
    }

    m_available = true;
    return true;
}

bool OnnxCrossEncoder::isAvailable() const
{
    return m_available;
}

std::optional<std::vector<float>> OnnxCrossEncoder::score(const QString& query,
                                                          const std::vector<QString>& passages)
{
    if (!m_available) {
        return std::nullopt;
    }

    std::vector<float> scores;
    scores.reserve(passages.size());

    for (size_t begin = 0; begin < passages.size(); begin += kMaxBatchSize) {
        const size_t end = std::min(passages.size(), begin + static_cast<size_t>(kMaxBatchSize));

        std::vector<std::pair<QString, QString>> pairs;
        pairs.reserve(end - begin);
        for (size_t i = begin; i < end; ++i) {
            pairs.emplace_back(query, passages[i]);
        }

        const EncodedBatch batch = m_tokenizer->encodePairBatch(pairs);
        const std::optional<ModelOutput> output = m_session->run(batch);
        if (!output) {
            return std::nullopt;
        }

        // [batch] or [batch, 1] logits; for two-class heads take the positive logit.
        const size_t rows = end - begin;
        size_t stride = 1;
        if (output->shape.size() == 2 && output->shape[1] > 0) {
            stride = static_cast<size_t>(output->shape[1]);
        }
        if (output->data.size() < rows * stride) {
            LOG_WARN(rcModels, "Cross-encoder: unexpected output size %zu for %zu pairs",
                     output->data.size(), rows);
            return std::nullopt;
        }

        for (size_t i = 0; i < rows; ++i) {
            const float logit = output->data[i * stride + (stride - 1)];
            scores.push_back(1.0f / (1.0f + std::exp(-logit)));
        }
    }

    return scores;
}

} // namespace rc
