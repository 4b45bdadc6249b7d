#include <QtTest/QtTest>
#include <QScopeGuard>
#include "core/concurrency/worker_pool.h"

#include <atomic>
#include <chrono>
#include <future>
#include <set>
#include <stdexcept>
#include <thread>

class TestWorkerPool : public QObject {
    Q_OBJECT

private slots:
    void testSubmitReturnsResult();
    void testTasksRunOnPoolThreads();
    void testQueueFullRejects();
    void testShutdownDrainsQueue();
    void testSubmitAfterShutdownRejected();
    void testExceptionReachesFuture();
    void testCancelToken();
};

namespace {

// Blocks the only worker until released, so later submissions stay queued.
struct Gate {
    std::promise<void> started;
    std::promise<void> release;
    std::shared_future<void> released{release.get_future().share()};
};

} // namespace

void TestWorkerPool::testSubmitReturnsResult()
{
    rc::WorkerPool pool(QStringLiteral("test"), 2, 8);
    QCOMPARE(pool.threadCount(), 2);
    QCOMPARE(pool.name(), QStringLiteral("test"));

    auto future = pool.submit([]() { return 6 * 7; });
    QVERIFY(future.has_value());
    QCOMPARE(future->get(), 42);

    auto text = pool.submit([]() { return QStringLiteral("done"); });
    QVERIFY(text.has_value());
    QCOMPARE(text->get(), QStringLiteral("done"));
}

void TestWorkerPool::testTasksRunOnPoolThreads()
{
    rc::WorkerPool pool(QStringLiteral("threads"), 3, 64);
    const std::thread::id caller = std::this_thread::get_id();

    std::vector<std::future<std::thread::id>> futures;
    for (int i = 0; i < 12; ++i) {
        auto future = pool.submit([]() { return std::this_thread::get_id(); });
        QVERIFY(future.has_value());
        futures.push_back(std::move(*future));
    }

    std::set<std::thread::id> ids;
    for (auto& future : futures) {
        const auto id = future.get();
        QVERIFY(id != caller);
        ids.insert(id);
    }
    QVERIFY(ids.size() <= 3);
    pool.shutdown();
    QCOMPARE(pool.completedCount(), int64_t(12));
}

void TestWorkerPool::testQueueFullRejects()
{
    rc::WorkerPool pool(QStringLiteral("bounded"), 1, 1);
    Gate gate;
    std::shared_future<void> released = gate.released;
    bool opened = false;
    auto open = [&]() {
        if (!opened) {
            opened = true;
            gate.release.set_value();
        }
    };
    auto openOnExit = qScopeGuard(open);

    auto blocker = pool.submit([&gate, released]() {
        gate.started.set_value();
        released.wait();
    });
    QVERIFY(blocker.has_value());
    gate.started.get_future().wait();

    auto queued = pool.submit([]() { return 1; });
    QVERIFY(queued.has_value());
    QCOMPARE(pool.pendingCount(), 1);

    auto rejected = pool.submit([]() { return 2; });
    QVERIFY(!rejected.has_value());
    QCOMPARE(pool.rejectedCount(), int64_t(1));

    open();
    QCOMPARE(queued->get(), 1);
    QCOMPARE(pool.submittedCount(), int64_t(2));
}

void TestWorkerPool::testShutdownDrainsQueue()
{
    rc::WorkerPool pool(QStringLiteral("drain"), 1, 16);
    std::atomic<int> ran{0};
    for (int i = 0; i < 10; ++i) {
        auto future = pool.submit([&ran]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            ++ran;
        });
        QVERIFY(future.has_value());
    }
    pool.shutdown();
    QCOMPARE(ran.load(), 10);
    QCOMPARE(pool.pendingCount(), 0);
    QCOMPARE(pool.threadCount(), 0);

    pool.shutdown();
}

void TestWorkerPool::testSubmitAfterShutdownRejected()
{
    rc::WorkerPool pool(QStringLiteral("stopped"), 1, 4);
    pool.shutdown();
    QVERIFY(!pool.submit([]() { return 0; }).has_value());
    QCOMPARE(pool.rejectedCount(), int64_t(1));
}

void TestWorkerPool::testExceptionReachesFuture()
{
    rc::WorkerPool pool(QStringLiteral("throws"), 1, 4);
    auto future = pool.submit([]() -> int { throw std::runtime_error("stage failed"); });
    QVERIFY(future.has_value());

    bool caught = false;
    try {
        future->get();
    } catch (const std::runtime_error& e) {
        caught = QString::fromUtf8(e.what()) == QLatin1String("stage failed");
    }
    QVERIFY(caught);

    // The worker survives and keeps serving.
    auto next = pool.submit([]() { return 5; });
    QVERIFY(next.has_value());
    QCOMPARE(next->get(), 5);
}

void TestWorkerPool::testCancelToken()
{
    QVERIFY(!rc::isCancelled(rc::CancelToken{}));

    rc::CancelToken token = rc::makeCancelToken();
    QVERIFY(!rc::isCancelled(token));
    rc::CancelToken shared = token;
    shared->store(true);
    QVERIFY(rc::isCancelled(token));
}

QTEST_MAIN(TestWorkerPool)
#include "test_worker_pool.moc"
