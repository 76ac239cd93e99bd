#pragma once

#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace SceneStitch {

/**
 * @brief Fixed-size pool of threads pulling tasks from a shared queue
 *
 * A run is all-or-nothing: once a task throws, queued tasks that have not
 * started are dropped, running ones finish, and wait() rethrows the first
 * exception.
 */
class WorkerPool {
public:
    // workerCount 0 is treated as 1
    explicit WorkerPool(size_t workerCount);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void submit(std::function<void()> task);

    // Block until the queue is drained and no task is running, then rethrow
    // the first failure, if any.
    void wait();

    size_t size() const { return m_workers.size(); }

    // Hardware concurrency capped at `jobs`; `requested` > 0 wins over hardware.
    static size_t resolveWorkerCount(int requested, size_t jobs);

private:
    void workerLoop();

    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_tasks;
    std::mutex m_mutex;
    std::condition_variable m_taskCv;
    std::condition_variable m_idleCv;
    size_t m_active = 0;
    bool m_done = false;
    std::exception_ptr m_firstError;
};

} // namespace SceneStitch
