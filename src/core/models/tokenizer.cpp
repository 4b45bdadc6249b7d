#include "core/models/tokenizer.h"
#include "core/shared/logging.h"

#include <QFile>
#include <QRegularExpression>
#include <QStringConverter>
#include <QTextStream>

#include <algorithm>

namespace rc {

WordPieceTokenizer::WordPieceTokenizer(const QString& vocabPath, int maxSequenceLength)
    : m_maxSequenceLength(std::clamp(maxSequenceLength, 8, 512))
{
    QFile file(vocabPath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        LOG_WARN(rcModels, "WordPieceTokenizer failed to open vocab: %s",
                 qUtf8Printable(vocabPath));
        return;
    }

    QTextStream in(&file);
    in.setEncoding(QStringConverter::Utf8);

    // Token id is the zero-based line number; blank lines still consume an id.
    int64_t index = 0;
    while (!in.atEnd()) {
        const QString token = in.readLine().trimmed();
        if (!token.isEmpty()) {
            m_vocab.emplace(token.toStdString(), index);
        }
        ++index;
    }

    if (m_vocab.empty()) {
        LOG_WARN(rcModels, "WordPieceTokenizer loaded empty vocab from %s",
                 qUtf8Printable(vocabPath));
        return;
    }

    m_loaded = true;
}

bool WordPieceTokenizer::isLoaded() const
{
    return m_loaded;
}

int WordPieceTokenizer::vocabSize() const
{
    return static_cast<int>(m_vocab.size());
}

int WordPieceTokenizer::maxSequenceLength() const
{
    return m_maxSequenceLength;
}

QString WordPieceTokenizer::normalize(const QString& text) const
{
    const QString decomposed = text.toLower().normalized(QString::NormalizationForm_D);

    QString stripped;
    stripped.reserve(decomposed.size());
    for (const QChar ch : decomposed) {
        const QChar::Category category = ch.category();
        if (category == QChar::Mark_NonSpacing
            || category == QChar::Mark_SpacingCombining
            || category == QChar::Mark_Enclosing) {
            continue;
        }
        // Punctuation becomes its own word, as in BERT's basic tokenizer.
        if (ch.isPunct() || ch.isSymbol()) {
            stripped.append(QLatin1Char(' '));
            stripped.append(ch);
            stripped.append(QLatin1Char(' '));
            continue;
        }
        stripped.append(ch);
    }

    static const QRegularExpression whitespaceRegex(QStringLiteral("\\s+"));
    stripped.replace(whitespaceRegex, QStringLiteral(" "));
    return stripped.trimmed();
}

void WordPieceTokenizer::appendWordPieces(const QString& word, int budget,
                                          std::vector<int64_t>* output) const
{
    const int wordLength = word.size();
    std::vector<int64_t> pieces;
    int start = 0;

    while (start < wordLength) {
        int end = wordLength;
        int64_t matchedId = -1;

        while (end > start) {
            QString piece = word.mid(start, end - start);
            if (start > 0) {
                piece.prepend(QStringLiteral("##"));
            }
            const auto it = m_vocab.find(piece.toStdString());
            if (it != m_vocab.end()) {
                matchedId = it->second;
                break;
            }
            --end;
        }

        if (matchedId < 0) {
            // A word with any unmatchable remainder maps to a single [UNK].
            pieces.assign(1, kUnkTokenId);
            break;
        }
        pieces.push_back(matchedId);
        start = end;
    }

    for (int64_t id : pieces) {
        if (static_cast<int>(output->size()) >= budget) {
            return;
        }
        output->push_back(id);
    }
}

std::vector<int64_t> WordPieceTokenizer::wordPieces(const QString& normalizedText, int budget) const
{
    std::vector<int64_t> content;
    if (!m_loaded || normalizedText.isEmpty() || budget <= 0) {
        return content;
    }

    const QStringList words = normalizedText.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    for (const QString& word : words) {
        if (static_cast<int>(content.size()) >= budget) {
            break;
        }
        appendWordPieces(word, budget, &content);
    }
    return content;
}

EncodedBatch WordPieceTokenizer::flatten(std::vector<Row> rows)
{
    EncodedBatch batch;
    if (rows.empty()) {
        return batch;
    }

    int maxLength = 0;
    for (const Row& row : rows) {
        maxLength = std::max(maxLength, static_cast<int>(row.ids.size()));
    }

    batch.batchSize = static_cast<int>(rows.size());
    batch.seqLength = maxLength;
    const size_t total = static_cast<size_t>(batch.batchSize) * static_cast<size_t>(maxLength);
    batch.inputIds.reserve(total);
    batch.attentionMask.reserve(total);
    batch.tokenTypeIds.reserve(total);

    for (Row& row : rows) {
        const size_t realLength = row.ids.size();
        row.ids.resize(static_cast<size_t>(maxLength), kPadTokenId);
        row.typeIds.resize(static_cast<size_t>(maxLength), 0);

        batch.inputIds.insert(batch.inputIds.end(), row.ids.begin(), row.ids.end());
        batch.tokenTypeIds.insert(batch.tokenTypeIds.end(), row.typeIds.begin(), row.typeIds.end());
        for (int i = 0; i < maxLength; ++i) {
            batch.attentionMask.push_back(static_cast<size_t>(i) < realLength ? 1 : 0);
        }
    }
    return batch;
}

EncodedBatch WordPieceTokenizer::encodeBatch(const std::vector<QString>& texts) const
{
    if (!m_loaded || texts.empty()) {
        return {};
    }

    std::vector<Row> rows;
    rows.reserve(texts.size());
    for (const QString& text : texts) {
        Row row;
        const std::vector<int64_t> content = wordPieces(normalize(text), m_maxSequenceLength - 2);
        row.ids.reserve(content.size() + 2);
        row.ids.push_back(kClsTokenId);
        row.ids.insert(row.ids.end(), content.begin(), content.end());
        row.ids.push_back(kSepTokenId);
        row.typeIds.assign(row.ids.size(), 0);
        rows.push_back(std::move(row));
    }
    return flatten(std::move(rows));
}

EncodedBatch WordPieceTokenizer::encodePairBatch(
    const std::vector<std::pair<QString, QString>>& pairs) const
{
    if (!m_loaded || pairs.empty()) {
        return {};
    }

    const int budget = m_maxSequenceLength - 3;  // [CLS] + 2x[SEP]

    std::vector<Row> rows;
    rows.reserve(pairs.size());
    for (const auto& [textA, textB] : pairs) {
        std::vector<int64_t> tokensA = wordPieces(normalize(textA), budget);
        std::vector<int64_t> tokensB = wordPieces(normalize(textB), budget);

        if (static_cast<int>(tokensA.size() + tokensB.size()) > budget) {
            const int keepB = std::max(budget / 2, budget - static_cast<int>(tokensA.size()));
            if (static_cast<int>(tokensB.size()) > keepB) {
                tokensB.resize(static_cast<size_t>(keepB));
            }
            const int keepA = budget - static_cast<int>(tokensB.size());
            if (static_cast<int>(tokensA.size()) > keepA) {
                tokensA.resize(static_cast<size_t>(keepA));
            }
        }

        Row row;
        row.ids.push_back(kClsTokenId);
        row.ids.insert(row.ids.end(), tokensA.begin(), tokensA.end());
        row.ids.push_back(kSepTokenId);
        row.typeIds.assign(row.ids.size(), 0);
        row.ids.insert(row.ids.end(), tokensB.begin(), tokensB.end());
        row.ids.push_back(kSepTokenId);
        row.typeIds.resize(row.ids.size(), 1);
        rows.push_back(std::move(row));
    }
    return flatten(std::move(rows));
}

} // namespace rc
