#pragma once

#include "core/models/model_session.h"
#include "core/models/relevance_model.h"

#include <memory>

namespace rc {

// Cross-encoder relevance model on ONNX Runtime. Scores are the sigmoid of
// the single relevance logit per (query, passage) pair.
class OnnxCrossEncoder : public RelevanceModel {
public:
    explicit OnnxCrossEncoder(const ModelSpec& spec);
    ~OnnxCrossEncoder() override;

    OnnxCrossEncoder(const OnnxCrossEncoder&) = delete;
    OnnxCrossEncoder& operator=(const OnnxCrossEncoder&) = delete;

    bool initialize();

    bool isAvailable() const override;
    std::optional<std::vector<float>> score(const QString& query,
                                            const std::vector<QString>& passages) override;

    static constexpr int kMaxBatchSize = 32;

private:
    ModelSpec m_spec;
    std::unique_ptr<ModelSession> m_session;
    std::unique_ptr<WordPieceTokenizer> m_tokenizer;
    bool m_available = false;
};

} // namespace rc
