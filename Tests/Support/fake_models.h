#pragma once

#include "core/models/embedding_provider.h"
#include "core/models/relevance_model.h"

#include <QString>
#include <QStringList>

#include <atomic>
#include <functional>

namespace rc::test {

// Lowercased word tokens, as both fakes see text.
QStringList fakeTokens(const QString& text);

// Hashed bag-of-words embeddings: texts sharing words get similar vectors.
// Deterministic across runs and processes.
class FakeEmbeddingProvider : public EmbeddingProvider {
public:
    explicit FakeEmbeddingProvider(int dimensions = 64,
                                   const QString& modelId = QStringLiteral("fake-embed-v1"));

    bool isAvailable() const override { return available.load(); }
    QString modelId() const override { return m_modelId; }
    int dimensions() const override { return m_dimensions; }

    std::optional<std::vector<float>> embedQuery(const QString& text) override;
    std::optional<std::vector<std::vector<float>>> embedDocuments(
        const std::vector<QString>& texts) override;

    std::vector<float> embed(const QString& text) const;

    std::atomic<bool> available{true};
    std::atomic<bool> failQueries{false};
    std::atomic<bool> failDocuments{false};
    std::atomic<int> queryDelayMs{0};
    std::atomic<int> documentDelayMs{0};
    std::atomic<int> queryCalls{0};
    std::atomic<int> documentCalls{0};
    std::atomic<int> documentsEmbedded{0};

private:
    int m_dimensions;
    QString m_modelId;
};

// Scores a passage by the share of query tokens it contains, unless a custom
// scorer is installed.
class FakeRelevanceModel : public RelevanceModel {
public:
    using Scorer = std::function<float(const QString& query, const QString& passage)>;

    FakeRelevanceModel() = default;
    explicit FakeRelevanceModel(Scorer scorer) : m_scorer(std::move(scorer)) {}

    bool isAvailable() const override { return available.load(); }
    std::optional<std::vector<float>> score(const QString& query,
                                            const std::vector<QString>& passages) override;

    static float overlapScore(const QString& query, const QString& passage);

    std::atomic<bool> available{true};
    std::atomic<bool> fail{false};
    std::atomic<int> delayMs{0};
    std::atomic<int> calls{0};
    std::atomic<int> passagesScored{0};

private:
    Scorer m_scorer;
};

} // namespace rc::test
