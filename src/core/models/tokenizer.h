#pragma once

#include <QString>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rc {

// Flattened [batchSize x seqLength] model inputs, padded to the longest row.
struct EncodedBatch {
    std::vector<int64_t> inputIds;
    std::vector<int64_t> attentionMask;
    std::vector<int64_t> tokenTypeIds;
    int batchSize = 0;
    int seqLength = 0;

    bool isEmpty() const { return batchSize <= 0 || seqLength <= 0; }
};

// BERT-style WordPiece tokenizer (lowercasing, accent stripping, greedy
// longest-match subwords). Sequences are truncated to maxSequenceLength.
class WordPieceTokenizer {
public:
    explicit WordPieceTokenizer(const QString& vocabPath, int maxSequenceLength = 512);

    bool isLoaded() const;
    int vocabSize() const;
    int maxSequenceLength() const;

    // [CLS] text [SEP] per row.
    EncodedBatch encodeBatch(const std::vector<QString>& texts) const;

    // [CLS] A [SEP] B [SEP] per row; B is truncated before A.
    EncodedBatch encodePairBatch(const std::vector<std::pair<QString, QString>>& pairs) const;

    static constexpr int64_t kPadTokenId = 0;
    static constexpr int64_t kUnkTokenId = 100;
    static constexpr int64_t kClsTokenId = 101;
    static constexpr int64_t kSepTokenId = 102;

private:
    struct Row {
        std::vector<int64_t> ids;
        std::vector<int64_t> typeIds;
    };

    QString normalize(const QString& text) const;
    std::vector<int64_t> wordPieces(const QString& normalizedText, int budget) const;
    void appendWordPieces(const QString& word, int budget, std::vector<int64_t>* output) const;
    static EncodedBatch flatten(std::vector<Row> rows);

    std::unordered_map<std::string, int64_t> m_vocab;
    int m_maxSequenceLength = 512;
    bool m_loaded = false;
};

} // namespace rc
