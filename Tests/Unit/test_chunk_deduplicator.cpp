#include <QtTest/QtTest>
#include "core/ranking/chunk_deduplicator.h"

class TestChunkDeduplicator : public QObject {
    Q_OBJECT

private slots:
    void testKeepsBestChunkPerParent();
    void testCountsSiblingMatches();
    void testScoresPreserved();
    void testUnchunkedItemsPassThrough();
    void testEmptyInput();
};

namespace {

rc::RetrievalCandidate chunkCandidate(const QString& parent, int index, double score)
{
    rc::RetrievalCandidate c;
    c.doc.parentId = parent;
    c.doc.docId = QStringLiteral("%1#%2").arg(parent).arg(index);
    c.doc.chunkIndex = index;
    c.doc.chunkTotal = 3;
    c.finalScore = score;
    return c;
}

} // namespace

void TestChunkDeduplicator::testKeepsBestChunkPerParent()
{
    const auto result = rc::ChunkDeduplicator::deduplicate({
        chunkCandidate(QStringLiteral("a"), 0, 0.2),
        chunkCandidate(QStringLiteral("b"), 1, 0.5),
        chunkCandidate(QStringLiteral("a"), 2, 0.9),
        chunkCandidate(QStringLiteral("b"), 0, 0.1),
    });

    QCOMPARE(static_cast<int>(result.size()), 2);
    QCOMPARE(result[0].doc.docId, QStringLiteral("a#2"));
    QCOMPARE(result[1].doc.docId, QStringLiteral("b#1"));
}

void TestChunkDeduplicator::testCountsSiblingMatches()
{
    const auto result = rc::ChunkDeduplicator::deduplicate({
        chunkCandidate(QStringLiteral("a"), 0, 0.3),
        chunkCandidate(QStringLiteral("a"), 1, 0.4),
        chunkCandidate(QStringLiteral("a"), 2, 0.1),
        chunkCandidate(QStringLiteral("b"), 0, 0.2),
    });
    QCOMPARE(result[0].siblingMatches, 2);
    QCOMPARE(result[1].siblingMatches, 0);
}

void TestChunkDeduplicator::testScoresPreserved()
{
    const auto result = rc::ChunkDeduplicator::deduplicate({
        chunkCandidate(QStringLiteral("x"), 0, 0.75),
        chunkCandidate(QStringLiteral("x"), 1, 0.25),
    });
    QCOMPARE(static_cast<int>(result.size()), 1);
    QCOMPARE(result[0].finalScore, 0.75);
}

void TestChunkDeduplicator::testUnchunkedItemsPassThrough()
{
    rc::RetrievalCandidate whole;
    whole.doc.parentId = QStringLiteral("note");
    whole.doc.docId = QStringLiteral("note");
    whole.finalScore = 0.4;

    const auto result = rc::ChunkDeduplicator::deduplicate({
        whole, chunkCandidate(QStringLiteral("other"), 0, 0.6)});
    QCOMPARE(static_cast<int>(result.size()), 2);
    QCOMPARE(result[1].doc.docId, QStringLiteral("note"));
    QCOMPARE(result[1].siblingMatches, 0);
}

void TestChunkDeduplicator::testEmptyInput()
{
    QVERIFY(rc::ChunkDeduplicator::deduplicate({}).empty());
}

QTEST_MAIN(TestChunkDeduplicator)
#include "test_chunk_deduplicator.moc"
