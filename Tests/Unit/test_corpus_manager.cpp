#include <QtTest/QtTest>
#include "core/corpus/corpus_manager.h"
#include "core/index/lexical_index.h"
#include "Support/corpus_fixture.h"

#include <QDir>
#include <QTemporaryDir>

#include <atomic>
#include <chrono>
#include <thread>

class TestCorpusManager : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();

    // ── Registry ─────────────────────────────────────────────────
    void testUnknownCorpusIsError();
    void testUnopenableCorpusNotCached();

    // ── LRU cache ────────────────────────────────────────────────
    void testHitReturnsSameClient();
    void testFourthCorpusEvictsLeastRecentlyUsed();
    void testEvictedClientHandlesClosed();
    void testEvictionWaitsForActiveLease();
    void testInvalidateReleasesClient();
    void testClearReleasesEverything();
    void testConcurrentOpenKeepsOneClient();
    void testStatsJson();

private:
    QTemporaryDir m_tmp;
    std::vector<rc::Corpus> m_corpora;
};

namespace {

// Writes a lexical-only index with a single item into storage.
bool buildIndex(const QString& storage, const QString& itemId)
{
    QDir().mkpath(storage);
    auto index = rc::LexicalIndex::open(rc::storage_layout::lexicalDbPath(storage));
    if (!index) {
        return false;
    }
    rc::IndexedItem indexed;
    indexed.item = rc::test::makeItem(itemId, itemId, QStringLiteral("body of %1").arg(itemId));

    rc::Chunk chunk;
    chunk.chunkId = itemId;
    chunk.parentId = itemId;
    chunk.endOffset = indexed.item.body.size();
    chunk.title = indexed.item.title;
    chunk.content = indexed.item.body;
    indexed.chunks.push_back(chunk);

    return index->index({indexed});
}

} // namespace

void TestCorpusManager::initTestCase()
{
    QVERIFY(m_tmp.isValid());
    for (const QString& name : {QStringLiteral("a"), QStringLiteral("b"),
                                QStringLiteral("c"), QStringLiteral("d")}) {
        const QString root = m_tmp.filePath(name);
        const QString storage = m_tmp.filePath(name + QStringLiteral("-store"));
        QDir().mkpath(root);
        QVERIFY(buildIndex(storage, name + QStringLiteral("-item")));
        m_corpora.push_back(rc::test::makeCorpus(name, root, storage));
    }
}

// ── Registry ─────────────────────────────────────────────────────

void TestCorpusManager::testUnknownCorpusIsError()
{
    rc::CorpusManager manager(m_corpora);
    QString error;
    QVERIFY(!manager.get(QStringLiteral("nope"), &error));
    QCOMPARE(error, QStringLiteral("Unknown corpus: nope"));
    QCOMPARE(manager.stats().size, 0);
    QVERIFY(!manager.corpus(QStringLiteral("nope")).has_value());
    QCOMPARE(manager.corpus(QStringLiteral("b"))->name, QStringLiteral("b"));
}

void TestCorpusManager::testUnopenableCorpusNotCached()
{
    std::vector<rc::Corpus> corpora{rc::test::makeCorpus(
        QStringLiteral("empty"), m_tmp.path(), m_tmp.filePath(QStringLiteral("missing-store")))};
    rc::CorpusManager manager(corpora);

    QString error;
    QVERIFY(!manager.get(QStringLiteral("empty"), &error));
    QVERIFY(error.contains(QStringLiteral("No index for corpus 'empty'")));
    QCOMPARE(manager.stats().size, 0);
    QCOMPARE(manager.stats().misses, uint64_t(1));
}

// ── LRU cache ────────────────────────────────────────────────────

void TestCorpusManager::testHitReturnsSameClient()
{
    rc::CorpusManager manager(m_corpora);
    const auto first = manager.get(QStringLiteral("a"));
    QVERIFY(first);
    const auto second = manager.get(QStringLiteral("a"));
    QCOMPARE(second.get(), first.get());
    QCOMPARE(first->catalog().size(), 1);

    const auto stats = manager.stats();
    QCOMPARE(stats.hits, uint64_t(1));
    QCOMPARE(stats.misses, uint64_t(1));
}

void TestCorpusManager::testFourthCorpusEvictsLeastRecentlyUsed()
{
    rc::CorpusManager manager(m_corpora, 3);
    QVERIFY(manager.get(QStringLiteral("a")));
    const auto b = manager.get(QStringLiteral("b"));
    QVERIFY(manager.get(QStringLiteral("c")));
    QVERIFY(manager.get(QStringLiteral("a")));  // a becomes most recent; b is now LRU

    QVERIFY(manager.get(QStringLiteral("d")));

    const auto stats = manager.stats();
    QCOMPARE(stats.size, 3);
    QCOMPARE(stats.evictions, uint64_t(1));
    QCOMPARE(stats.cachedCorpora, (QStringList{QStringLiteral("d"), QStringLiteral("a"),
                                               QStringLiteral("c")}));
    QVERIFY(b->isReleased());
    QVERIFY(!rc::RetrievalClient::acquire(b).has_value());
}

void TestCorpusManager::testEvictedClientHandlesClosed()
{
    const int baseline = rc::RetrievalClient::liveHandleCount();
    {
        rc::CorpusManager manager(m_corpora, 3);
        for (const rc::Corpus& corpus : m_corpora) {
            QVERIFY(manager.get(corpus.name));
            QVERIFY(rc::RetrievalClient::liveHandleCount() - baseline <= 3);
        }
        QCOMPARE(rc::RetrievalClient::liveHandleCount() - baseline, 3);
    }
    QCOMPARE(rc::RetrievalClient::liveHandleCount(), baseline);
}

void TestCorpusManager::testEvictionWaitsForActiveLease()
{
    rc::CorpusManager manager(m_corpora, 1);
    const auto a = manager.get(QStringLiteral("a"));
    QVERIFY(a);

    std::atomic<bool> finished{false};
    std::thread evictor;
    {
        auto lease = rc::RetrievalClient::acquire(a);
        QVERIFY(lease.has_value());
        QCOMPARE(a->activeLeases(), 1);

        evictor = std::thread([&] {
            manager.get(QStringLiteral("b"));
            finished = true;
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        QVERIFY(!finished.load());

        // The lease still reads from the open database.
        QVERIFY(!(*lease)->lexicalQuery(QStringLiteral("body"), 5).empty());
    }
    evictor.join();
    QVERIFY(finished.load());
    QVERIFY(a->isReleased());
    QCOMPARE(a->activeLeases(), 0);
}

void TestCorpusManager::testInvalidateReleasesClient()
{
    rc::CorpusManager manager(m_corpora);
    const auto before = manager.get(QStringLiteral("c"));
    QVERIFY(before);

    manager.invalidate(QStringLiteral("c"));
    QVERIFY(before->isReleased());
    QCOMPARE(manager.stats().size, 0);

    const auto after = manager.get(QStringLiteral("c"));
    QVERIFY(after);
    QVERIFY(after.get() != before.get());
    QCOMPARE(manager.stats().misses, uint64_t(2));

    manager.invalidate(QStringLiteral("never-cached"));
    QCOMPARE(manager.stats().size, 1);
}

void TestCorpusManager::testClearReleasesEverything()
{
    const int baseline = rc::RetrievalClient::liveHandleCount();
    rc::CorpusManager manager(m_corpora);
    const auto a = manager.get(QStringLiteral("a"));
    const auto b = manager.get(QStringLiteral("b"));
    QVERIFY(a && b);

    manager.clear();
    QVERIFY(a->isReleased());
    QVERIFY(b->isReleased());
    QCOMPARE(manager.stats().size, 0);
    QCOMPARE(rc::RetrievalClient::liveHandleCount(), baseline);
}

void TestCorpusManager::testConcurrentOpenKeepsOneClient()
{
    std::atomic<int> opened{0};
    rc::CorpusManager manager(m_corpora, 3, [&](const rc::Corpus& corpus, QString* error) {
        ++opened;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return rc::RetrievalClient::open(corpus, error);
    });

    const int baseline = rc::RetrievalClient::liveHandleCount();
    std::shared_ptr<rc::RetrievalClient> first;
    std::shared_ptr<rc::RetrievalClient> second;
    std::thread t1([&] { first = manager.get(QStringLiteral("a")); });
    std::thread t2([&] { second = manager.get(QStringLiteral("a")); });
    t1.join();
    t2.join();

    QVERIFY(first && second);
    QCOMPARE(first.get(), second.get());
    QCOMPARE(manager.stats().size, 1);
    QVERIFY(opened.load() >= 1);
    QCOMPARE(rc::RetrievalClient::liveHandleCount() - baseline, 1);
}

void TestCorpusManager::testStatsJson()
{
    rc::CorpusManager manager(m_corpora, 2);
    QVERIFY(manager.get(QStringLiteral("a")));
    QVERIFY(manager.get(QStringLiteral("a")));

    const QJsonObject json = manager.stats().toJson();
    QCOMPARE(json.value(QStringLiteral("size")).toInt(), 1);
    QCOMPARE(json.value(QStringLiteral("capacity")).toInt(), 2);
    QCOMPARE(json.value(QStringLiteral("hits")).toInt(), 1);
    QCOMPARE(json.value(QStringLiteral("misses")).toInt(), 1);
    QCOMPARE(json.value(QStringLiteral("evictions")).toInt(), 0);
    QCOMPARE(json.value(QStringLiteral("utilization")).toDouble(), 0.5);
    QCOMPARE(json.value(QStringLiteral("cachedCorpora")).toArray().size(), 1);
}

QTEST_MAIN(TestCorpusManager)
#include "test_corpus_manager.moc"
