#include "core/concurrency/worker_pool.h"
#include "core/shared/logging.h"

#include <algorithm>

namespace rc {

WorkerPool::WorkerPool(const QString& name, int threadCount, int queueLimit)
    : m_name(name)
    , m_queueLimit(std::max(1, queueLimit))
{
    const int count = std::max(1, threadCount);
    m_threads.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        m_threads.emplace_back([this]() { workerLoop(); });
    }
    LOG_DEBUG(rcCore, "Worker pool '%s' started with %d thread(s), queue limit %d",
              qUtf8Printable(m_name), count, m_queueLimit);
}

WorkerPool::~WorkerPool()
{
    shutdown();
}

void WorkerPool::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stop && m_threads.empty()) {
            return;
        }
        m_stop = true;
    }
    m_cv.notify_all();

    for (auto& thread : m_threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    m_threads.clear();
}

int WorkerPool::pendingCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<int>(m_queue.size());
}

bool WorkerPool::enqueue(std::function<void()> job)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stop) {
            m_rejected.fetch_add(1);
            return false;
        }
        if (static_cast<int>(m_queue.size()) >= m_queueLimit) {
            m_rejected.fetch_add(1);
            LOG_WARN(rcCore, "Worker pool '%s' queue full (%d), rejecting task",
                     qUtf8Printable(m_name), m_queueLimit);
            return false;
        }
        m_queue.push_back(std::move(job));
        m_submitted.fetch_add(1);
    }
    m_cv.notify_one();
    return true;
}

void WorkerPool::workerLoop()
{
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [&]() { return m_stop || !m_queue.empty(); });
            if (m_stop && m_queue.empty()) {
                return;
            }
            job = std::move(m_queue.front());
            m_queue.pop_front();
        }

        job();
        m_completed.fetch_add(1);
    }
}

} // namespace rc
