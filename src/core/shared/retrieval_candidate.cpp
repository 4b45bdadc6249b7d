#include "core/shared/retrieval_candidate.h"

#include <QJsonArray>

#include <algorithm>

namespace rc {

namespace {

constexpr int kSnippetLength = 240;

} // namespace

QJsonObject BoostAnnotation::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("kind")] = kind;
    json[QStringLiteral("reason")] = reason;
    json[QStringLiteral("factor")] = factor;
    return json;
}

QString RetrievalCandidate::passageText() const
{
    if (!item) {
        return {};
    }
    if (!doc.isChunk()) {
        return item->body;
    }
    const qsizetype start = std::clamp<qsizetype>(doc.startOffset, 0, item->body.size());
    const qsizetype end = std::clamp<qsizetype>(doc.endOffset, start, item->body.size());
    return item->body.mid(start, end - start);
}

QString RetrievalCandidate::relevanceText() const
{
    if (!item) {
        return {};
    }
    return item->title + QLatin1Char('\n') + passageText();
}

QJsonObject RetrievalCandidate::toJson(bool includeBreakdown, bool withPassage) const
{
    QJsonObject json;
    json[QStringLiteral("id")] = doc.parentId;
    json[QStringLiteral("score")] = finalScore;
    if (item) {
        json[QStringLiteral("title")] = chunkTitle(item->title, doc.chunkIndex, doc.chunkTotal);
        json[QStringLiteral("tags")] = QJsonArray::fromStringList(item->tags);
        json[QStringLiteral("status")] = itemStatusToString(item->status);
        json[QStringLiteral("modifiedAt")] = item->modifiedAt;
        if (!item->metadata.type.isEmpty()) {
            json[QStringLiteral("type")] = item->metadata.type;
        }
        const QString passage = passageText().simplified();
        json[QStringLiteral("snippet")] = passage.size() > kSnippetLength
            ? passage.left(kSnippetLength) + QStringLiteral("...")
            : passage;
        if (withPassage) {
            json[QStringLiteral("passage")] = passageText();
        }
    }
    if (doc.isChunk()) {
        QJsonObject chunk;
        chunk[QStringLiteral("index")] = doc.chunkIndex;
        chunk[QStringLiteral("total")] = doc.chunkTotal;
        chunk[QStringLiteral("start")] = static_cast<qint64>(doc.startOffset);
        chunk[QStringLiteral("end")] = static_cast<qint64>(doc.endOffset);
        json[QStringLiteral("chunk")] = chunk;
    }
    if (siblingMatches > 0) {
        json[QStringLiteral("siblingMatches")] = siblingMatches;
    }

    if (!includeBreakdown) {
        return json;
    }

    QJsonObject breakdown;
    if (lexicalRank) {
        breakdown[QStringLiteral("lexicalRank")] = *lexicalRank;
        breakdown[QStringLiteral("lexicalScore")] = lexicalScore;
    }
    if (vectorRank) {
        breakdown[QStringLiteral("vectorRank")] = *vectorRank;
        breakdown[QStringLiteral("vectorScore")] = vectorScore;
    }
    breakdown[QStringLiteral("fusedScore")] = fusedScore;
    breakdown[QStringLiteral("timeDecayFactor")] = timeDecayFactor;
    if (crossEncoderScore) {
        breakdown[QStringLiteral("crossEncoderScore")] = *crossEncoderScore;
    }
    if (tagMatched) {
        breakdown[QStringLiteral("matchedTags")] = QJsonArray::fromStringList(matchedTags);
    }
    QJsonArray boostArray;
    for (const BoostAnnotation& boost : boosts) {
        boostArray.append(boost.toJson());
    }
    breakdown[QStringLiteral("boosts")] = boostArray;
    json[QStringLiteral("breakdown")] = breakdown;
    return json;
}

bool rankedBefore(const RetrievalCandidate& lhs, const RetrievalCandidate& rhs)
{
    if (lhs.finalScore != rhs.finalScore) {
        return lhs.finalScore > rhs.finalScore;
    }
    if (lhs.lexicalScore != rhs.lexicalScore) {
        return lhs.lexicalScore > rhs.lexicalScore;
    }
    if (lhs.doc.parentId != rhs.doc.parentId) {
        return lhs.doc.parentId < rhs.doc.parentId;
    }
    return lhs.doc.docId < rhs.doc.docId;
}

void sortByFinalScore(std::vector<RetrievalCandidate>& candidates)
{
    std::stable_sort(candidates.begin(), candidates.end(), rankedBefore);
}

} // namespace rc
