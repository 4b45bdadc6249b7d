#include "core/shared/chunk.h"
#include <QCryptographicHash>

namespace rc {

QString computeChunkId(const QString& parentId, int chunkIndex)
{
    const QString seed = parentId + QStringLiteral("#") + QString::number(chunkIndex);
    const QByteArray hash = QCryptographicHash::hash(
        seed.toUtf8(), QCryptographicHash::Sha256);
    return QString::fromLatin1(hash.toHex());
}

QString chunkTitle(const QString& parentTitle, int chunkIndex, int chunkTotal)
{
    if (chunkTotal <= 1) {
        return parentTitle;
    }
    return QStringLiteral("%1 (part %2/%3)")
        .arg(parentTitle)
        .arg(chunkIndex + 1)
        .arg(chunkTotal);
}

DocumentRef documentRef(const Chunk& chunk)
{
    DocumentRef ref;
    ref.docId = chunk.chunkId;
    ref.parentId = chunk.parentId;
    ref.chunkIndex = chunk.chunkIndex;
    ref.chunkTotal = chunk.chunkTotal;
    ref.startOffset = chunk.startOffset;
    ref.endOffset = chunk.endOffset;
    return ref;
}

} // namespace rc
