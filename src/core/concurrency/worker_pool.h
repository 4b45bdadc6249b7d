#pragma once

#include <QString>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <vector>

namespace rc {

// Cooperative cancellation flag shared between a request and its stages.
using CancelToken = std::shared_ptr<std::atomic<bool>>;

inline CancelToken makeCancelToken()
{
    return std::make_shared<std::atomic<bool>>(false);
}

inline bool isCancelled(const CancelToken& token)
{
    return token && token->load();
}

// WorkerPool: fixed set of threads draining one bounded FIFO queue.
// submit() returns nullopt when the queue is full or the pool is stopping.
class WorkerPool {
public:
    WorkerPool(const QString& name, int threadCount, int queueLimit);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename Fn>
    std::optional<std::future<std::invoke_result_t<Fn>>> submit(Fn&& fn)
    {
        using Result = std::invoke_result_t<Fn>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
        std::future<Result> future = task->get_future();
        if (!enqueue([task]() { (*task)(); })) {
            return std::nullopt;
        }
        return future;
    }

    // Finishes queued work, then joins the threads. Idempotent.
    void shutdown();

    const QString& name() const { return m_name; }
    int threadCount() const { return static_cast<int>(m_threads.size()); }
    int pendingCount() const;

    int64_t submittedCount() const { return m_submitted.load(); }
    int64_t completedCount() const { return m_completed.load(); }
    int64_t rejectedCount() const { return m_rejected.load(); }

private:
    bool enqueue(std::function<void()> job);
    void workerLoop();

    QString m_name;
    int m_queueLimit = 0;
    std::vector<std::thread> m_threads;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<std::function<void()>> m_queue;
    bool m_stop = false;

    std::atomic<int64_t> m_submitted{0};
    std::atomic<int64_t> m_completed{0};
    std::atomic<int64_t> m_rejected{0};
};

} // namespace rc
