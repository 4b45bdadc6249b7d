#pragma once

#include <QString>

namespace rc {

// A contiguous slice [startOffset, endOffset) of one item's body.
// Unchunked items produce a single chunk whose chunkId equals the item id.
struct Chunk {
    QString chunkId;
    QString parentId;
    int chunkIndex = 0;
    int chunkTotal = 1;
    qsizetype startOffset = 0;
    qsizetype endOffset = 0;
    QString title;
    QString content;

    qsizetype length() const { return endOffset - startOffset; }
};

// Reference to one retrieval unit (a chunk, or a whole unchunked item).
// Deduplication identity is always parentId.
struct DocumentRef {
    QString docId;
    QString parentId;
    int chunkIndex = 0;
    int chunkTotal = 1;
    qsizetype startOffset = 0;
    qsizetype endOffset = 0;

    bool isChunk() const { return chunkTotal > 1; }
};

DocumentRef documentRef(const Chunk& chunk);

// Compute stable chunk ID: SHA-256 of "parentId#chunkIndex"
QString computeChunkId(const QString& parentId, int chunkIndex);

// "Title (part 2/5)" when total > 1, otherwise the title unchanged.
QString chunkTitle(const QString& parentTitle, int chunkIndex, int chunkTotal);

} // namespace rc
