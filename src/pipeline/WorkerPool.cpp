#include "WorkerPool.h"
#include <algorithm>

namespace SceneStitch {

WorkerPool::WorkerPool(size_t workerCount) {
    if (workerCount == 0) workerCount = 1;
    m_workers.reserve(workerCount);
    for (size_t i = 0; i < workerCount; ++i) {
        m_workers.emplace_back(&WorkerPool::workerLoop, this);
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_done = true;
    }
    m_taskCv.notify_all();
    for (auto& t : m_workers) {
        if (t.joinable()) t.join();
    }
}

size_t WorkerPool::resolveWorkerCount(int requested, size_t jobs) {
    size_t count = requested > 0 ? static_cast<size_t>(requested) : std::thread::hardware_concurrency();
    if (count == 0) count = 1;
    if (jobs > 0) count = std::min(count, jobs);
    return count;
}

void WorkerPool::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_tasks.push(std::move(task));
    }
    m_taskCv.notify_one();
}

void WorkerPool::wait() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idleCv.wait(lock, [this] { return m_tasks.empty() && m_active == 0; });
    if (m_firstError) {
        std::exception_ptr error = m_firstError;
        m_firstError = nullptr;
        std::rethrow_exception(error);
    }
}

void WorkerPool::workerLoop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_taskCv.wait(lock, [this] { return !m_tasks.empty() || m_done; });
            if (m_tasks.empty()) return;
            task = std::move(m_tasks.front());
            m_tasks.pop();
            ++m_active;
        }

        std::exception_ptr error;
        try {
            task();
        } catch (...) {
            error = std::current_exception();
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            --m_active;
            if (error) {
                if (!m_firstError) m_firstError = error;
                std::queue<std::function<void()>>().swap(m_tasks);
            }
            if (m_tasks.empty() && m_active == 0) {
                m_idleCv.notify_all();
            }
        }
    }
}

} // namespace SceneStitch
